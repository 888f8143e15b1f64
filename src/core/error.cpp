/// @file error.cpp
/// @brief Error handling implementation for modgraph_core
///
/// Formatting of typed errors for diagnostics.

#include <modgraph/core/error.hpp>
#include <sstream>
#include <vector>

namespace modgraph_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

/// Format validation error with full context
std::string format_validation_error(const ValidationError& err) {
    std::ostringstream oss;
    oss << "[" << validation_error_kind_name(err.kind) << "] " << err.message;

    if (!err.module.empty()) {
        oss << " (module: " << err.module << ")";
    }
    if (!err.dependency.empty()) {
        oss << " (dependency: " << err.dependency << ")";
    }
    if (!err.cycle_path.empty()) {
        oss << " (cycle length: " << err.cycle_path.size() << ")";
    }

    return oss.str();
}

/// Format manifest error with full context
std::string format_manifest_error(const ManifestError& err) {
    std::ostringstream oss;
    oss << "[ManifestError] " << err.message;

    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ValidationError>) {
            oss << detail::format_validation_error(err);
        } else if constexpr (std::is_same_v<T, ManifestError>) {
            oss << detail::format_manifest_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

} // namespace modgraph_core
