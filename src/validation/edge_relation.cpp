/// @file edge_relation.cpp
/// @brief Module dependency edge relation implementation

#include <modgraph/validation/edge_relation.hpp>
#include <modgraph/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace modgraph_validation {

using modgraph_bundle::BundleModule;
using modgraph_core::Err;
using modgraph_core::Result;
using modgraph_core::ValidationError;

namespace {

/// DOT quoted ID; backslashes and quotes are escaped
std::string dot_id(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

// =============================================================================
// EdgeRelation Implementation
// =============================================================================

bool EdgeRelation::contains_key(const std::string& module) const {
    return m_index.count(module) > 0;
}

bool EdgeRelation::contains_entry(const std::string& module, const std::string& dependency) const {
    const auto& deps = dependencies_of(module);
    return std::find(deps.begin(), deps.end(), dependency) != deps.end();
}

const std::vector<std::string>& EdgeRelation::dependencies_of(const std::string& module) const {
    static const std::vector<std::string> s_none;

    auto it = m_index.find(module);
    if (it == m_index.end()) {
        return s_none;
    }
    return m_entries[it->second].second;
}

std::vector<std::string> EdgeRelation::keys() const {
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& [name, _] : m_entries) {
        names.push_back(name);
    }
    return names;
}

std::size_t EdgeRelation::edge_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [_, deps] : m_entries) {
        count += deps.size();
    }
    return count;
}

EdgeRelation::Entry& EdgeRelation::add_key(const std::string& module) {
    m_index[module] = m_entries.size();
    m_entries.emplace_back(module, std::vector<std::string>{});
    return m_entries.back();
}

std::string EdgeRelation::to_dot_graph(const std::vector<BundleModule>& modules) const {
    std::map<std::string, const BundleModule*> by_name;
    for (const auto& module : modules) {
        by_name.emplace(module.name(), &module);
    }

    std::ostringstream oss;
    oss << "digraph modules {\n";
    oss << "  rankdir=BT;\n";
    oss << "  node [shape=box];\n\n";

    // Base is filled, on-demand modules are dashed
    for (const auto& [name, _] : m_entries) {
        oss << "  " << dot_id(name);
        auto it = by_name.find(name);
        if (name == m_root) {
            oss << " [style=filled, fillcolor=lightblue]";
        } else if (it != by_name.end() && it->second->is_dynamic_module()) {
            oss << " [style=dashed]";
        }
        oss << ";\n";
    }
    oss << "\n";

    for (const auto& [name, deps] : m_entries) {
        for (const auto& dep : deps) {
            if (name == dep && name == m_root) {
                continue;  // Implicit base self edge
            }
            oss << "  " << dot_id(name) << " -> " << dot_id(dep);
            if (dep == m_root) {
                oss << " [color=gray]";
            }
            oss << ";\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

// =============================================================================
// Construction
// =============================================================================

Result<EdgeRelation> build_edge_relation(
    const std::vector<BundleModule>& modules,
    const std::string& root) {

    EdgeRelation relation;
    relation.m_root = root;

    for (const auto& module : modules) {
        const std::string& name = module.name();

        if (relation.contains_key(name)) {
            modgraph_core::validation_logger()->error(
                "Module '{}' supplied more than once; the module set must have unique names", name);
            return Err<EdgeRelation>(ValidationError::duplicate_module_entry(name));
        }

        auto& entry = relation.add_key(name);
        const auto& declared = module.uses_splits();
        entry.second.assign(declared.begin(), declared.end());

        // The base dependency is always implicit
        if (std::find(declared.begin(), declared.end(), root) != declared.end()) {
            return Err<EdgeRelation>(ValidationError::explicit_root_dependency(name, root));
        }

        // Also ensures that every module has at least one edge
        entry.second.push_back(root);
    }

    modgraph_core::validation_logger()->trace("Built edge relation: {} modules, {} edges",
        relation.size(), relation.edge_count());

    return relation;
}

} // namespace modgraph_validation
