#pragma once

/// @file sub_validator.hpp
/// @brief Interface for a single bundle validation pass

#include "fwd.hpp"
#include <modgraph/bundle/module.hpp>
#include <modgraph/core/error.hpp>

#include <vector>

namespace modgraph_validation {

/// Abstract base class for validation passes over all modules of a bundle
///
/// Implementations hold no state across calls; a pass either certifies the
/// whole module set or returns the first violation it finds.
class SubValidator {
public:
    virtual ~SubValidator() = default;

    /// Get validator name for logging
    [[nodiscard]] virtual const char* name() const = 0;

    /// Validate the complete module set of one bundle
    ///
    /// @param modules Modules in bundle order
    /// @return Ok if valid, Error describing the first violation otherwise
    [[nodiscard]] virtual modgraph_core::Result<void> validate_all_modules(
        const std::vector<modgraph_bundle::BundleModule>& modules) const = 0;

protected:
    SubValidator() = default;

    // Non-copyable
    SubValidator(const SubValidator&) = delete;
    SubValidator& operator=(const SubValidator&) = delete;
};

} // namespace modgraph_validation
