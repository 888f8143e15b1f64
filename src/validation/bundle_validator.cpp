/// @file bundle_validator.cpp
/// @brief Bundle validation pipeline implementation

#include <modgraph/validation/bundle_validator.hpp>
#include <modgraph/validation/module_dependency_validator.hpp>
#include <modgraph/core/log.hpp>

namespace modgraph_validation {

BundleValidator BundleValidator::with_default_validators() {
    BundleValidator validator;
    validator.add_validator(std::make_unique<ModuleDependencyValidator>());
    return validator;
}

void BundleValidator::add_validator(std::unique_ptr<SubValidator> validator) {
    if (!validator) {
        return;
    }
    m_validators.push_back(std::move(validator));
}

modgraph_core::Result<void> BundleValidator::validate(
    const std::vector<modgraph_bundle::BundleModule>& modules) const {

    auto logger = modgraph_core::validation_logger();
    MODGRAPH_TRACE_SCOPE(logger, "bundle validation");

    for (const auto& validator : m_validators) {
        logger->debug("Running {}", validator->name());

        auto result = validator->validate_all_modules(modules);
        if (!result) {
            result.error().with_context("validator", validator->name());
            return result;
        }
    }

    return modgraph_core::Ok();
}

std::vector<std::string> BundleValidator::validator_names() const {
    std::vector<std::string> names;
    names.reserve(m_validators.size());
    for (const auto& validator : m_validators) {
        names.push_back(validator->name());
    }
    return names;
}

} // namespace modgraph_validation
