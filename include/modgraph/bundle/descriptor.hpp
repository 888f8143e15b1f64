#pragma once

/// @file descriptor.hpp
/// @brief Bundle descriptor JSON parsing
///
/// A bundle descriptor lists the modules of one application bundle together
/// with the dependency-relevant parts of their manifests:
/// ```json
/// {
///   "bundle": { "name": "com.example.app" },
///   "modules": [
///     { "name": "base", "base": true },
///     { "name": "camera", "delivery": "on-demand",
///       "manifest": { "split": "camera", "uses_splits": ["filters"] } }
///   ]
/// }
/// ```
/// The descriptor only materializes modules; graph rules are checked by
/// modgraph_validation.

#include "fwd.hpp"
#include "module.hpp"
#include <modgraph/core/error.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace modgraph_bundle {

/// All modules of one bundle, in descriptor order
struct BundleDescriptor {
    std::string name;                    ///< Bundle name (optional in the document)
    std::vector<BundleModule> modules;   ///< Modules in document order
    std::filesystem::path source_path;   ///< Path to descriptor file (set by load)

    /// Load descriptor from a JSON file
    [[nodiscard]] static modgraph_core::Result<BundleDescriptor> load(
        const std::filesystem::path& path);

    /// Parse descriptor from JSON string
    ///
    /// @param json_str JSON string content
    /// @param source_name Name used in error messages
    [[nodiscard]] static modgraph_core::Result<BundleDescriptor> from_json_string(
        const std::string& json_str,
        const std::string& source_name = "<string>");

    /// Names of all modules in document order
    [[nodiscard]] std::vector<std::string> module_names() const;
};

} // namespace modgraph_bundle
