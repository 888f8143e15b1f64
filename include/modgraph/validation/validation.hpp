#pragma once

/// @file validation.hpp
/// @brief Main include file for modgraph_validation module
///
/// # Basic Usage
///
/// ```cpp
/// #include <modgraph/validation/validation.hpp>
///
/// auto descriptor = modgraph_bundle::BundleDescriptor::load("bundle.json");
/// if (!descriptor) {
///     return 2;
/// }
///
/// auto validator = modgraph_validation::BundleValidator::with_default_validators();
/// auto result = validator.validate(descriptor->modules);
/// if (!result) {
///     std::cerr << result.error().message() << "\n";
/// }
/// ```
///
/// # Dependency Rules
///
/// - Exactly one base module; every other module depends on it implicitly
/// - A module may not list the base, itself, or the same module twice
/// - Every listed module must exist
/// - No dependency cycles
/// - Install-time modules may only depend on install-time modules

#include "fwd.hpp"
#include "edge_relation.hpp"
#include "sub_validator.hpp"
#include "module_dependency_validator.hpp"
#include "bundle_validator.hpp"
#include <modgraph/bundle/descriptor.hpp>
#include <modgraph/bundle/module.hpp>
