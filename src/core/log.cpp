/// @file log.cpp
/// @brief Logging channels and shared sinks

#include <modgraph/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

namespace modgraph_core {

namespace {

constexpr const char* kDefaultChannel = "modgraph";
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

struct Channels {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
    bool configured = false;
};

Channels& channels() {
    static Channels instance;
    return instance;
}

spdlog::sink_ptr make_console_sink() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(kConsolePattern);
    return sink;
}

/// Build the sink set for a configuration; `file_error` receives the reason
/// the log file could not be opened, if any
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, std::string& file_error) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(make_console_sink());
    }

    if (config.writes_file()) {
        try {
            auto path = config.directory / "modgraph.log";
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            sink->set_pattern(kFilePattern);
            sinks.push_back(std::move(sink));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }
    return sinks;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    std::string file_error;
    auto sinks = make_sinks(config, file_error);

    {
        auto& state = channels();
        std::lock_guard<std::mutex> lock(state.mutex);

        state.sinks = std::move(sinks);
        state.level = config.level;
        state.configured = true;

        for (auto& [name, logger] : state.loggers) {
            logger->sinks() = state.sinks;
            logger->set_level(state.level);
        }
    }

    spdlog::set_default_logger(get_logger(kDefaultChannel));

    if (!file_error.empty()) {
        core_logger()->warn("Log file disabled: {}", file_error);
    }
}

void shutdown_logging() {
    auto& state = channels();
    std::lock_guard<std::mutex> lock(state.mutex);

    for (auto& [name, logger] : state.loggers) {
        logger->flush();
        spdlog::drop(name);
    }
    state.loggers.clear();
    state.sinks.clear();
    state.configured = false;
}

// =============================================================================
// Channels
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& state = channels();
    std::lock_guard<std::mutex> lock(state.mutex);

    auto it = state.loggers.find(name);
    if (it != state.loggers.end()) {
        return it->second;
    }

    // Unconfigured channels still report to stderr
    if (!state.configured && state.sinks.empty()) {
        state.sinks.push_back(make_console_sink());
    }

    auto logger = std::make_shared<spdlog::logger>(name, state.sinks.begin(), state.sinks.end());
    logger->set_level(state.level);
    state.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("core");
}

std::shared_ptr<spdlog::logger> bundle_logger() {
    return get_logger("bundle");
}

std::shared_ptr<spdlog::logger> validation_logger() {
    return get_logger("validation");
}

// =============================================================================
// Levels
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "warning") return spdlog::level::warn;
    if (str == "err") return spdlog::level::err;
    if (str == "fatal") return spdlog::level::critical;

    auto level = spdlog::level::from_str(str);
    // from_str maps every unknown name to "off"
    if (level == spdlog::level::off && str != "off") {
        return std::nullopt;
    }
    return level;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Helpers
// =============================================================================

void log_with_fields(
    spdlog::logger& logger,
    spdlog::level::level_enum level,
    const std::string& message,
    const std::map<std::string, std::string>& fields) {

    if (!logger.should_log(level)) {
        return;
    }

    std::ostringstream oss;
    oss << message;
    if (!fields.empty()) {
        oss << " [";
        const char* separator = "";
        for (const auto& [key, value] : fields) {
            oss << separator << key << '=' << value;
            separator = " ";
        }
        oss << ']';
    }
    logger.log(level, oss.str());
}

TraceScope::TraceScope(std::shared_ptr<spdlog::logger> logger, std::string label)
    : m_logger(std::move(logger))
    , m_label(std::move(label))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->trace("begin {}", m_label);
}

TraceScope::~TraceScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("end {} ({}us)", m_label, elapsed.count());
}

} // namespace modgraph_core
