/// @file config.cpp
/// @brief Tool configuration (modgraph.toml) parsing implementation

#include <modgraph/core/config.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace modgraph_core {

const char* report_format_name(ReportFormat format) noexcept {
    switch (format) {
        case ReportFormat::Text: return "text";
        case ReportFormat::Json: return "json";
        default: return "unknown";
    }
}

std::optional<ReportFormat> parse_report_format(const std::string& str) {
    if (str == "text") return ReportFormat::Text;
    if (str == "json") return ReportFormat::Json;
    return std::nullopt;
}

// =============================================================================
// ToolConfig Implementation
// =============================================================================

Result<ToolConfig> ToolConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<ToolConfig>(Error(ErrorCode::NotFound,
            "Config file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<ToolConfig>(Error(ErrorCode::IOError,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_toml_string(buffer.str(), path.string());
    if (result) {
        core_logger()->debug("Loaded configuration from {}", path.string());
    }
    return result;
}

Result<ToolConfig> ToolConfig::from_toml_string(
    const std::string& content,
    const std::string& source_name)
{
    ToolConfig config;

    toml::table tbl;
    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return Err<ToolConfig>(Error(ErrorCode::ParseError,
            "TOML parse error in " + source_name + ": " + std::string(err.description())));
    }

    // [logging]
    if (auto logging = tbl["logging"].as_table()) {
        if (auto level = (*logging)["level"].value<std::string>()) {
            auto parsed = parse_log_level(*level);
            if (!parsed) {
                return Err<ToolConfig>(Error(ErrorCode::ParseError,
                    "Invalid logging.level in " + source_name + ": " + *level));
            }
            config.logging.level = *parsed;
        }
        config.logging.console = (*logging)["console"].value_or(config.logging.console);
        if (auto dir = (*logging)["directory"].value<std::string>()) {
            config.logging.directory = *dir;
        }
    }

    // [report]
    if (auto report = tbl["report"].as_table()) {
        if (auto format = (*report)["format"].value<std::string>()) {
            auto parsed = parse_report_format(*format);
            if (!parsed) {
                return Err<ToolConfig>(Error(ErrorCode::ParseError,
                    "Invalid report.format in " + source_name + ": " + *format));
            }
            config.format = *parsed;
        }
        if (auto dot = (*report)["dot_output"].value<std::string>()) {
            config.dot_output = *dot;
        }
    }

    return config;
}

} // namespace modgraph_core
