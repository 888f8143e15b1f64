#pragma once

/// @file edge_relation.hpp
/// @brief Module dependency edge relation
///
/// If module "a" declares `<uses-split name="b"/>`, the relation contains the
/// edge ("a", "b"). Every module also depends implicitly on the base module,
/// so the relation contains ("a", "base") for every module "a", including the
/// self edge ("base", "base").

#include "fwd.hpp"
#include <modgraph/bundle/module.hpp>
#include <modgraph/core/error.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace modgraph_validation {

// =============================================================================
// EdgeRelation
// =============================================================================

/// Read-only multimap from module name to the names it depends on
///
/// Keys are kept in module order and each edge list in declaration order
/// followed by the implicit base edge, so traversals and diagnostics are
/// reproducible. An EdgeRelation can only be produced by build_edge_relation.
class EdgeRelation {
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    EdgeRelation() = default;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Name of the base module every module depends on
    [[nodiscard]] const std::string& root() const noexcept { return m_root; }

    /// Check if a module is a key of the relation
    [[nodiscard]] bool contains_key(const std::string& module) const;

    /// Check if the edge (module, dependency) is present at least once
    [[nodiscard]] bool contains_entry(const std::string& module, const std::string& dependency) const;

    /// Outgoing edges of a module in insertion order (empty if not a key)
    [[nodiscard]] const std::vector<std::string>& dependencies_of(const std::string& module) const;

    /// All keys in module order
    [[nodiscard]] std::vector<std::string> keys() const;

    /// All (module, edges) entries in module order
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return m_entries; }

    /// Number of modules
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    /// Total number of edges, counting duplicates
    [[nodiscard]] std::size_t edge_count() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    // =========================================================================
    // Debugging
    // =========================================================================

    /// Generate GraphViz DOT format of the relation
    ///
    /// @param modules Used to mark the base and on-demand modules; may be empty
    [[nodiscard]] std::string to_dot_graph(
        const std::vector<modgraph_bundle::BundleModule>& modules = {}) const;

private:
    friend modgraph_core::Result<EdgeRelation> build_edge_relation(
        const std::vector<modgraph_bundle::BundleModule>& modules,
        const std::string& root);

    /// Add a key with no edges; returns its entry
    Entry& add_key(const std::string& module);

    std::string m_root;
    std::vector<Entry> m_entries;
    std::map<std::string, std::size_t> m_index;
};

// =============================================================================
// Construction
// =============================================================================

/// Build the relation from module declarations
///
/// Fails with DuplicateModuleEntry if a module name occurs twice, and with
/// ExplicitRootDependency if a module lists the base module explicitly.
///
/// @param modules Modules in bundle order
/// @param root Name of the base module
[[nodiscard]] modgraph_core::Result<EdgeRelation> build_edge_relation(
    const std::vector<modgraph_bundle::BundleModule>& modules,
    const std::string& root);

} // namespace modgraph_validation
