#pragma once

/// @file log.hpp
/// @brief Logging for modgraph
///
/// Every subsystem logs through its own channel (core, bundle, validation).
/// All channels share one set of sinks: stderr when console output is on,
/// and a rotating `modgraph.log` when a log directory is configured. stdout
/// is never written to, so it stays free for reports.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

/// Log through the "modgraph" channel (the spdlog default once configured)
#define MODGRAPH_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MODGRAPH_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MODGRAPH_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define MODGRAPH_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define MODGRAPH_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace modgraph_core {

// =============================================================================
// Configuration
// =============================================================================

/// Where log output goes and how much of it
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    std::filesystem::path directory;             ///< Empty disables the log file
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;

    [[nodiscard]] bool writes_file() const { return !directory.empty(); }
};

/// Apply a configuration to every channel, existing and future
///
/// Also installs the "modgraph" channel as the spdlog default logger so the
/// MODGRAPH_LOG_* macros share the same sinks.
void configure_logging(const LogConfig& config);

/// Flush and release all channels
void shutdown_logging();

// =============================================================================
// Channels
// =============================================================================

/// Get or create a channel
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> core_logger();
std::shared_ptr<spdlog::logger> bundle_logger();
std::shared_ptr<spdlog::logger> validation_logger();

// =============================================================================
// Levels
// =============================================================================

/// Accepts the spdlog names plus "warning", "err" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Helpers
// =============================================================================

/// Log a message followed by `key=value` pairs, e.g. `cycle found [kind=CyclicDependency]`
void log_with_fields(
    spdlog::logger& logger,
    spdlog::level::level_enum level,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// Traces entry and exit of a block, with its duration, at trace level
class TraceScope {
public:
    TraceScope(std::shared_ptr<spdlog::logger> logger, std::string label);
    ~TraceScope();

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_label;
    std::chrono::steady_clock::time_point m_start;
};

#define MODGRAPH_DETAIL_CONCAT_IMPL(a, b) a##b
#define MODGRAPH_DETAIL_CONCAT(a, b) MODGRAPH_DETAIL_CONCAT_IMPL(a, b)

/// Trace the enclosing block on the given channel
#define MODGRAPH_TRACE_SCOPE(logger, label) \
    ::modgraph_core::TraceScope MODGRAPH_DETAIL_CONCAT(modgraph_trace_scope_, __LINE__)(logger, label)

} // namespace modgraph_core
