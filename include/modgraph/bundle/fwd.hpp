#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for modgraph_bundle module

#include <cstdint>
#include <string>

namespace modgraph_bundle {

// =============================================================================
// Module Types
// =============================================================================

/// When a module is delivered to the device
enum class DeliveryType : std::uint8_t {
    InstallTime,  ///< Installed together with the base module
    OnDemand      ///< Installed later, when requested
};

/// Name of the mandatory module every other module implicitly depends on
inline constexpr const char* kBaseModuleName = "base";

struct ModuleManifest;
class BundleModule;

// =============================================================================
// Descriptor Types
// =============================================================================

struct BundleDescriptor;

// =============================================================================
// Utility Functions
// =============================================================================

/// Convert DeliveryType to string
[[nodiscard]] const char* delivery_type_to_string(DeliveryType type) noexcept;

/// Parse DeliveryType from string
[[nodiscard]] bool delivery_type_from_string(const std::string& str, DeliveryType& out_type) noexcept;

} // namespace modgraph_bundle
