/// @file descriptor.cpp
/// @brief Bundle descriptor implementation

#include <modgraph/bundle/descriptor.hpp>
#include <modgraph/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace modgraph_bundle {

using modgraph_core::Err;
using modgraph_core::Error;
using modgraph_core::ErrorCode;
using modgraph_core::ManifestError;
using modgraph_core::Result;

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

/// Parse the optional "manifest" object of a module
Result<ModuleManifest> parse_manifest(
    const nlohmann::json& j, const std::string& source, const std::string& path) {

    ModuleManifest manifest;

    if (!j.is_object()) {
        return Err<ModuleManifest>(ManifestError::invalid_field(source, path, "expected an object"));
    }

    if (j.contains("split")) {
        if (!j["split"].is_string()) {
            return Err<ModuleManifest>(
                ManifestError::invalid_field(source, path + ".split", "expected a string"));
        }
        manifest.split_id = j["split"].get<std::string>();
    }

    if (j.contains("uses_splits")) {
        const auto& arr = j["uses_splits"];
        if (!arr.is_array()) {
            return Err<ModuleManifest>(
                ManifestError::invalid_field(source, path + ".uses_splits", "expected an array"));
        }

        manifest.uses_splits.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (!arr[i].is_string()) {
                return Err<ModuleManifest>(ManifestError::invalid_field(
                    source, path + ".uses_splits[" + std::to_string(i) + "]", "expected a string"));
            }
            // Duplicates are kept; the dependency validator reports them
            manifest.uses_splits.push_back(arr[i].get<std::string>());
        }
    }

    return manifest;
}

/// Parse a single module entry
Result<BundleModule> parse_module(
    const nlohmann::json& j, const std::string& source, const std::string& path) {

    if (!j.is_object()) {
        return Err<BundleModule>(ManifestError::invalid_field(source, path, "expected an object"));
    }

    // Name is required
    if (!j.contains("name")) {
        return Err<BundleModule>(ManifestError::missing_field(source, path + ".name"));
    }
    if (!j["name"].is_string() || j["name"].get<std::string>().empty()) {
        return Err<BundleModule>(
            ManifestError::invalid_field(source, path + ".name", "expected a non-empty string"));
    }
    std::string name = j["name"].get<std::string>();

    // Base flag (optional, defaults to the conventional name)
    bool is_base = (name == kBaseModuleName);
    if (j.contains("base")) {
        if (!j["base"].is_boolean()) {
            return Err<BundleModule>(
                ManifestError::invalid_field(source, path + ".base", "expected a boolean"));
        }
        is_base = j["base"].get<bool>();
    }

    // Delivery (optional, defaults to install-time)
    DeliveryType delivery = DeliveryType::InstallTime;
    if (j.contains("delivery")) {
        if (!j["delivery"].is_string() ||
            !delivery_type_from_string(j["delivery"].get<std::string>(), delivery)) {
            return Err<BundleModule>(ManifestError::invalid_field(
                source, path + ".delivery", "expected \"install-time\" or \"on-demand\""));
        }
    }

    ModuleManifest manifest;
    if (j.contains("manifest")) {
        auto manifest_result = parse_manifest(j["manifest"], source, path + ".manifest");
        if (!manifest_result) {
            return Err<BundleModule>(manifest_result.error());
        }
        manifest = std::move(*manifest_result);
    }

    return BundleModule(std::move(name), std::move(manifest), delivery, is_base);
}

} // anonymous namespace

// =============================================================================
// BundleDescriptor Implementation
// =============================================================================

Result<BundleDescriptor> BundleDescriptor::load(const std::filesystem::path& path) {
    // Check file exists
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<BundleDescriptor>(Error(ErrorCode::NotFound,
            "Bundle descriptor not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<BundleDescriptor>(Error(ErrorCode::IOError,
            "Failed to open bundle descriptor: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str(), path.string());
    if (!result) {
        return result;
    }

    result->source_path = path;
    modgraph_core::bundle_logger()->debug("Loaded {} module(s) from {}",
        result->modules.size(), path.string());

    return result;
}

Result<BundleDescriptor> BundleDescriptor::from_json_string(
    const std::string& json_str,
    const std::string& source_name) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<BundleDescriptor>(ManifestError::syntax(source_name, e.what()));
    }

    if (!j.is_object()) {
        return Err<BundleDescriptor>(ManifestError::syntax(source_name, "top level must be an object"));
    }

    BundleDescriptor descriptor;

    // "bundle" section (optional)
    if (j.contains("bundle")) {
        const auto& bundle = j["bundle"];
        if (!bundle.is_object()) {
            return Err<BundleDescriptor>(
                ManifestError::invalid_field(source_name, "bundle", "expected an object"));
        }
        if (bundle.contains("name")) {
            if (!bundle["name"].is_string()) {
                return Err<BundleDescriptor>(
                    ManifestError::invalid_field(source_name, "bundle.name", "expected a string"));
            }
            descriptor.name = bundle["name"].get<std::string>();
        }
    }

    // "modules" array (required)
    if (!j.contains("modules")) {
        return Err<BundleDescriptor>(ManifestError::missing_field(source_name, "modules"));
    }
    const auto& modules = j["modules"];
    if (!modules.is_array()) {
        return Err<BundleDescriptor>(
            ManifestError::invalid_field(source_name, "modules", "expected an array"));
    }

    descriptor.modules.reserve(modules.size());
    for (std::size_t i = 0; i < modules.size(); ++i) {
        auto module_result = parse_module(
            modules[i], source_name, "modules[" + std::to_string(i) + "]");
        if (!module_result) {
            return Err<BundleDescriptor>(module_result.error());
        }
        descriptor.modules.push_back(std::move(*module_result));
    }

    return descriptor;
}

std::vector<std::string> BundleDescriptor::module_names() const {
    std::vector<std::string> names;
    names.reserve(modules.size());
    for (const auto& module : modules) {
        names.push_back(module.name());
    }
    return names;
}

} // namespace modgraph_bundle
