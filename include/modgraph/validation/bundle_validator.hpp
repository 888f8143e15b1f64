#pragma once

/// @file bundle_validator.hpp
/// @brief Runs a sequence of sub-validators over a bundle

#include "fwd.hpp"
#include "sub_validator.hpp"
#include <modgraph/bundle/module.hpp>
#include <modgraph/core/error.hpp>

#include <memory>
#include <string>
#include <vector>

namespace modgraph_validation {

/// Ordered pipeline of validation passes
///
/// Passes run in registration order and the first failure stops the
/// pipeline. The failing pass name is attached to the error as the
/// "validator" context entry.
class BundleValidator {
public:
    BundleValidator() = default;

    // Non-copyable, movable
    BundleValidator(const BundleValidator&) = delete;
    BundleValidator& operator=(const BundleValidator&) = delete;
    BundleValidator(BundleValidator&&) = default;
    BundleValidator& operator=(BundleValidator&&) = default;

    /// Create a pipeline with all built-in passes
    [[nodiscard]] static BundleValidator with_default_validators();

    /// Append a pass (takes ownership; null is ignored)
    void add_validator(std::unique_ptr<SubValidator> validator);

    /// Run all passes over the module set
    [[nodiscard]] modgraph_core::Result<void> validate(
        const std::vector<modgraph_bundle::BundleModule>& modules) const;

    /// Names of registered passes in run order
    [[nodiscard]] std::vector<std::string> validator_names() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_validators.size(); }

private:
    std::vector<std::unique_ptr<SubValidator>> m_validators;
};

} // namespace modgraph_validation
