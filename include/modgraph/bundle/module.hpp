#pragma once

/// @file module.hpp
/// @brief Bundle module and its manifest declarations
///
/// A BundleModule is one top-level directory of an application bundle. Its
/// manifest may name a split ID and list the modules it needs present
/// (`<uses-split name="..."/>` entries). Modules are immutable once built.

#include "fwd.hpp"

#include <optional>
#include <string>
#include <vector>

namespace modgraph_bundle {

// =============================================================================
// ModuleManifest
// =============================================================================

/// Dependency-relevant subset of a module manifest
struct ModuleManifest {
    std::optional<std::string> split_id;   ///< Declared split ID, if any
    std::vector<std::string> uses_splits;  ///< Declared dependencies, in manifest order
};

// =============================================================================
// BundleModule
// =============================================================================

/// A named module of an application bundle
class BundleModule {
public:
    /// Construct a module
    ///
    /// @param name Module name (unique within a bundle)
    /// @param manifest Parsed manifest declarations
    /// @param delivery Install-time or on-demand
    /// @param is_base Whether this is the mandatory base module
    BundleModule(
        std::string name,
        ModuleManifest manifest,
        DeliveryType delivery = DeliveryType::InstallTime,
        bool is_base = false);

    /// Construct a module whose base flag follows the conventional base name
    [[nodiscard]] static BundleModule named(
        std::string name,
        std::vector<std::string> uses_splits = {},
        DeliveryType delivery = DeliveryType::InstallTime);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const ModuleManifest& manifest() const noexcept { return m_manifest; }
    [[nodiscard]] DeliveryType delivery() const noexcept { return m_delivery; }

    /// Whether this is the mandatory base module
    [[nodiscard]] bool is_base_module() const noexcept { return m_is_base; }

    /// Whether the module is installed on demand rather than at install time
    [[nodiscard]] bool is_dynamic_module() const noexcept {
        return m_delivery == DeliveryType::OnDemand;
    }

    [[nodiscard]] const std::optional<std::string>& split_id() const noexcept {
        return m_manifest.split_id;
    }

    [[nodiscard]] const std::vector<std::string>& uses_splits() const noexcept {
        return m_manifest.uses_splits;
    }

private:
    std::string m_name;
    ModuleManifest m_manifest;
    DeliveryType m_delivery;
    bool m_is_base;
};

} // namespace modgraph_bundle
