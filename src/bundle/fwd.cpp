/// @file fwd.cpp
/// @brief Implementation of forward declaration utilities

#include <modgraph/bundle/fwd.hpp>
#include <algorithm>
#include <cctype>

namespace modgraph_bundle {

const char* delivery_type_to_string(DeliveryType type) noexcept {
    switch (type) {
        case DeliveryType::InstallTime: return "install-time";
        case DeliveryType::OnDemand:    return "on-demand";
        default:                        return "unknown";
    }
}

bool delivery_type_from_string(const std::string& str, DeliveryType& out_type) noexcept {
    // Convert to lowercase for comparison
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "install-time" || lower == "install_time") {
        out_type = DeliveryType::InstallTime;
        return true;
    }
    if (lower == "on-demand" || lower == "on_demand") {
        out_type = DeliveryType::OnDemand;
        return true;
    }
    return false;
}

} // namespace modgraph_bundle
