#pragma once

/// @file config.hpp
/// @brief Tool configuration (modgraph.toml)
///
/// ```toml
/// [logging]
/// level = "info"
/// console = true
/// directory = ""
///
/// [report]
/// format = "text"
/// dot_output = ""
/// ```

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace modgraph_core {

// =============================================================================
// ReportFormat
// =============================================================================

/// How validation verdicts are printed
enum class ReportFormat : std::uint8_t {
    Text,  ///< Failure message verbatim on stderr
    Json,  ///< Single JSON object on stdout
};

/// Get report format name
[[nodiscard]] const char* report_format_name(ReportFormat format) noexcept;

/// Parse report format from string ("text" or "json")
[[nodiscard]] std::optional<ReportFormat> parse_report_format(const std::string& str);

// =============================================================================
// ToolConfig
// =============================================================================

/// Settings for the modgraph command-line tool
struct ToolConfig {
    LogConfig logging;
    ReportFormat format = ReportFormat::Text;
    std::filesystem::path dot_output;  ///< Empty disables DOT export

    /// Load configuration from a TOML file
    [[nodiscard]] static Result<ToolConfig> load(const std::filesystem::path& path);

    /// Parse configuration from a TOML string
    ///
    /// Missing sections and keys keep their defaults.
    [[nodiscard]] static Result<ToolConfig> from_toml_string(
        const std::string& content,
        const std::string& source_name = "modgraph.toml");
};

} // namespace modgraph_core
