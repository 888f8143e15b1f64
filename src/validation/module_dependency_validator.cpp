/// @file module_dependency_validator.cpp
/// @brief Module dependency validation implementation

#include <modgraph/validation/module_dependency_validator.hpp>
#include <modgraph/core/log.hpp>

#include <map>
#include <set>

namespace modgraph_validation {

using modgraph_bundle::BundleModule;
using modgraph_bundle::kBaseModuleName;
using modgraph_core::Err;
using modgraph_core::Ok;
using modgraph_core::Result;
using modgraph_core::ValidationError;

// =============================================================================
// ModuleDependencyValidator Implementation
// =============================================================================

namespace {

/// Run every check in order, stopping at the first violation
Result<void> run_dependency_checks(const std::vector<BundleModule>& modules) {
    auto logger = modgraph_core::validation_logger();

    auto base_result = check_has_base_module(modules);
    if (!base_result) {
        return Err(base_result.error());
    }
    const std::string& root = base_result.value();

    auto split_result = check_split_ids(modules);
    if (!split_result) {
        return split_result;
    }

    auto relation_result = build_edge_relation(modules, root);
    if (!relation_result) {
        return Err(relation_result.error());
    }
    const EdgeRelation& relation = relation_result.value();

    logger->debug("Checking structure of {} edge(s)", relation.edge_count());

    if (auto result = check_no_reflexive_dependencies(relation); !result) {
        return result;
    }
    if (auto result = check_modules_have_unique_dependencies(relation); !result) {
        return result;
    }
    if (auto result = check_referenced_modules_exist(relation); !result) {
        return result;
    }

    logger->debug("Checking for dependency cycles");
    if (auto result = check_no_cycles(relation); !result) {
        return result;
    }

    return check_no_install_time_to_on_demand_dependencies(modules, relation);
}

} // anonymous namespace

Result<void> ModuleDependencyValidator::validate_all_modules(
    const std::vector<BundleModule>& modules) const {

    auto logger = modgraph_core::validation_logger();
    logger->debug("Validating dependencies of {} module(s)", modules.size());

    auto result = run_dependency_checks(modules);
    if (!result) {
        std::map<std::string, std::string> fields;
        if (const auto* failure = result.error().as<ValidationError>()) {
            fields["kind"] = modgraph_core::validation_error_kind_name(failure->kind);
            if (!failure->module.empty()) {
                fields["module"] = failure->module;
            }
            if (!failure->dependency.empty()) {
                fields["dependency"] = failure->dependency;
            }
        }
        modgraph_core::log_with_fields(*logger, spdlog::level::warn, result.error().message(), fields);
        return result;
    }

    logger->info("Module dependency graph of {} module(s) is valid", modules.size());
    return result;
}

// =============================================================================
// Base and Split ID Checks
// =============================================================================

Result<std::string> check_has_base_module(const std::vector<BundleModule>& modules) {
    for (const auto& module : modules) {
        if (module.is_base_module()) {
            return module.name();
        }
    }
    return Err<std::string>(ValidationError::missing_root_module(kBaseModuleName));
}

Result<void> check_split_ids(const std::vector<BundleModule>& modules) {
    // The tooling rewrites the split attribute anyway, so a mismatch means a
    // broken manifest rather than a naming choice.
    for (const auto& module : modules) {
        const auto& split_id = module.split_id();
        if (!split_id.has_value()) {
            continue;
        }

        if (module.is_base_module()) {
            // The base split has an empty split ID
            return Err(ValidationError::root_split_id(module.name(), *split_id));
        }
        if (*split_id != module.name()) {
            return Err(ValidationError::split_id_mismatch(module.name(), *split_id));
        }
    }
    return Ok();
}

// =============================================================================
// Structural Checks
// =============================================================================

Result<void> check_no_reflexive_dependencies(const EdgeRelation& relation) {
    for (const auto& [name, deps] : relation.entries()) {
        // The base module is the only one with a self loop
        if (name == relation.root()) {
            continue;
        }
        if (relation.contains_entry(name, name)) {
            return Err(ValidationError::self_dependency(name));
        }
    }
    return Ok();
}

Result<void> check_modules_have_unique_dependencies(const EdgeRelation& relation) {
    for (const auto& [name, deps] : relation.entries()) {
        std::set<std::string> already_referenced;
        for (const auto& dep : deps) {
            if (!already_referenced.insert(dep).second) {
                return Err(ValidationError::duplicate_dependency(name, dep));
            }
        }
    }
    return Ok();
}

Result<void> check_referenced_modules_exist(const EdgeRelation& relation) {
    for (const auto& [name, deps] : relation.entries()) {
        for (const auto& dep : deps) {
            if (!relation.contains_key(dep)) {
                modgraph_core::Error error = ValidationError::unknown_module_reference(dep);
                error.with_context("referenced_by", name);
                return Err(std::move(error));
            }
        }
    }
    return Ok();
}

// =============================================================================
// Cycle Detection
// =============================================================================

namespace {

/// One module on the traversal path and the next outgoing edge to follow
struct TraversalFrame {
    const std::string* module;
    const std::vector<std::string>* edges;
    std::size_t next_edge;
};

/// Depth-first traversal from a single start module
///
/// Fails as soon as an edge leads back to a module on the current path.
/// Every module reached is added to `visited`.
Result<void> visit_from(
    const std::string& start,
    const EdgeRelation& relation,
    std::set<std::string>& visited,
    const std::set<std::string>& safe) {

    auto logger = modgraph_core::validation_logger();

    // Modules on the current path; mirrors the frames of `stack`
    std::set<std::string> processing;
    std::vector<TraversalFrame> stack;

    visited.insert(start);
    processing.insert(start);
    stack.push_back(TraversalFrame{&start, &relation.dependencies_of(start), 0});

    while (!stack.empty()) {
        TraversalFrame& top = stack.back();

        if (top.next_edge == top.edges->size()) {
            processing.erase(*top.module);
            stack.pop_back();
            continue;
        }

        const std::string& dep = (*top.edges)[top.next_edge++];

        // Skip the reflexive (base, base) edge
        if (dep == *top.module) {
            continue;
        }

        if (processing.count(dep)) {
            std::vector<std::string> path;
            path.reserve(stack.size());
            for (const auto& frame : stack) {
                path.push_back(*frame.module);
            }
            logger->trace("Edge '{}' -> '{}' closes a cycle", *top.module, dep);
            return Err(ValidationError::cyclic_dependency(std::move(path)));
        }

        // Fully explored modules cannot lead back onto the current path
        if (safe.count(dep) || visited.count(dep)) {
            continue;
        }

        logger->trace("Visiting '{}' from '{}'", dep, *top.module);
        visited.insert(dep);
        processing.insert(dep);
        stack.push_back(TraversalFrame{&dep, &relation.dependencies_of(dep), 0});
    }

    return Ok();
}

} // anonymous namespace

Result<void> check_no_cycles(const EdgeRelation& relation) {
    std::set<std::string> safe;

    for (const auto& [name, _] : relation.entries()) {
        if (safe.count(name)) {
            continue;
        }

        std::set<std::string> visited;
        auto result = visit_from(name, relation, visited, safe);
        if (!result) {
            return result;
        }

        safe.insert(visited.begin(), visited.end());
    }

    return Ok();
}

// =============================================================================
// Delivery Ordering
// =============================================================================

Result<void> check_no_install_time_to_on_demand_dependencies(
    const std::vector<BundleModule>& modules,
    const EdgeRelation& relation) {

    std::map<std::string, const BundleModule*> modules_by_name;
    for (const auto& module : modules) {
        modules_by_name.emplace(module.name(), &module);
    }

    for (const auto& [name, deps] : relation.entries()) {
        auto module_it = modules_by_name.find(name);
        if (module_it == modules_by_name.end() || module_it->second->is_dynamic_module()) {
            continue;
        }

        for (const auto& dep : deps) {
            auto dep_it = modules_by_name.find(dep);
            if (dep_it == modules_by_name.end()) {
                continue;  // Rejected earlier by check_referenced_modules_exist
            }
            if (dep_it->second->is_dynamic_module()) {
                return Err(ValidationError::invalid_delivery_ordering(name, dep));
            }
        }
    }

    return Ok();
}

} // namespace modgraph_validation
