#pragma once

/// @file module_dependency_validator.hpp
/// @brief Validates dependencies between bundle modules
///
/// The dependency graph is inferred from module names and the
/// `<uses-split name="..."/>` declarations of each module manifest.
/// Checks run in a fixed order and stop at the first violation:
/// - base module present
/// - split IDs consistent with module names
/// - relation construction (no duplicate modules, no explicit base edge)
/// - no reflexive dependencies
/// - no repeated dependencies
/// - all referenced modules exist
/// - no cycles
/// - install-time modules never depend on on-demand modules

#include "fwd.hpp"
#include "edge_relation.hpp"
#include "sub_validator.hpp"
#include <modgraph/bundle/module.hpp>
#include <modgraph/core/error.hpp>

#include <string>
#include <vector>

namespace modgraph_validation {

// =============================================================================
// ModuleDependencyValidator
// =============================================================================

/// Certifies the module dependency graph of a bundle
///
/// Stateless: all working sets live for one call only, so a single instance
/// may validate any number of bundles, from any number of threads.
class ModuleDependencyValidator : public SubValidator {
public:
    ModuleDependencyValidator() = default;

    [[nodiscard]] const char* name() const override { return "ModuleDependencyValidator"; }

    [[nodiscard]] modgraph_core::Result<void> validate_all_modules(
        const std::vector<modgraph_bundle::BundleModule>& modules) const override;
};

// =============================================================================
// Individual Checks
// =============================================================================

/// Find the base module
///
/// @return Name of the first module flagged as base, or MissingRootModule
[[nodiscard]] modgraph_core::Result<std::string> check_has_base_module(
    const std::vector<modgraph_bundle::BundleModule>& modules);

/// Check that the base declares no split ID and other modules declare their own name
[[nodiscard]] modgraph_core::Result<void> check_split_ids(
    const std::vector<modgraph_bundle::BundleModule>& modules);

/// Checks that a module doesn't depend on itself.
[[nodiscard]] modgraph_core::Result<void> check_no_reflexive_dependencies(
    const EdgeRelation& relation);

/// Checks that a module doesn't declare dependency on another module more than once.
[[nodiscard]] modgraph_core::Result<void> check_modules_have_unique_dependencies(
    const EdgeRelation& relation);

[[nodiscard]] modgraph_core::Result<void> check_referenced_modules_exist(
    const EdgeRelation& relation);

/// Validate that the relation contains no cycles other than the base self edge
///
/// Uses two sets of nodes for better time complexity:
/// - "safe" holds modules already known not to take part in any cycle. They
///   are never examined again.
/// - "visited" holds modules reached from the current start module. When that
///   traversal finds no cycle, they all join "safe".
///
/// The traversal keeps an explicit stack, so the depth of the graph is not
/// bounded by the call stack. The reported cycle path is the current
/// traversal path in visiting order.
[[nodiscard]] modgraph_core::Result<void> check_no_cycles(const EdgeRelation& relation);

/// Checks that an install-time module does not depend on an on-demand module.
[[nodiscard]] modgraph_core::Result<void> check_no_install_time_to_on_demand_dependencies(
    const std::vector<modgraph_bundle::BundleModule>& modules,
    const EdgeRelation& relation);

} // namespace modgraph_validation
