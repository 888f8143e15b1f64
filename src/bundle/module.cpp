/// @file module.cpp
/// @brief Bundle module implementation

#include <modgraph/bundle/module.hpp>

#include <utility>

namespace modgraph_bundle {

BundleModule::BundleModule(
    std::string name,
    ModuleManifest manifest,
    DeliveryType delivery,
    bool is_base)
    : m_name(std::move(name))
    , m_manifest(std::move(manifest))
    , m_delivery(delivery)
    , m_is_base(is_base) {}

BundleModule BundleModule::named(
    std::string name,
    std::vector<std::string> uses_splits,
    DeliveryType delivery) {
    bool is_base = (name == kBaseModuleName);
    ModuleManifest manifest;
    manifest.uses_splits = std::move(uses_splits);
    return BundleModule(std::move(name), std::move(manifest), delivery, is_base);
}

} // namespace modgraph_bundle
