// modgraph_core configuration and log level tests

#include <catch2/catch_test_macros.hpp>
#include <modgraph/core/config.hpp>
#include <modgraph/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

using namespace modgraph_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

namespace {

/// Logger writing bare messages into a string stream
std::shared_ptr<spdlog::logger> capture_logger(const std::string& name, std::ostringstream& oss) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    sink->set_pattern("%v");
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::trace);
    return logger;
}

} // anonymous namespace

TEST_CASE("Logging channels", "[core][log]") {
    SECTION("channels are created once") {
        REQUIRE(get_logger("modgraph_test") == get_logger("modgraph_test"));
        REQUIRE(validation_logger()->name() == "validation");
        REQUIRE(bundle_logger()->name() == "bundle");
        REQUIRE(core_logger()->name() == "core");
    }

    SECTION("configuration reaches existing channels") {
        auto logger = validation_logger();

        LogConfig quiet;
        quiet.level = spdlog::level::err;
        quiet.console = false;
        configure_logging(quiet);

        REQUIRE(logger->level() == spdlog::level::err);
        REQUIRE(logger->sinks().empty());
        REQUIRE(get_logger("modgraph_test_late")->level() == spdlog::level::err);

        configure_logging(LogConfig{});
        REQUIRE(logger->level() == spdlog::level::info);
        REQUIRE(logger->sinks().size() == 1);
    }
}

TEST_CASE("Log fields", "[core][log]") {
    std::ostringstream oss;
    auto logger = capture_logger("fields_test", oss);

    log_with_fields(*logger, spdlog::level::warn, "cycle found",
        {{"module", "a"}, {"kind", "CyclicDependency"}});
    REQUIRE(oss.str().find("cycle found [kind=CyclicDependency module=a]") == 0);

    oss.str("");
    logger->set_level(spdlog::level::err);
    log_with_fields(*logger, spdlog::level::warn, "dropped", {});
    REQUIRE(oss.str().empty());
}

TEST_CASE("Trace scopes nest within one block", "[core][log]") {
    std::ostringstream oss;
    auto logger = capture_logger("scope_test", oss);
    {
        MODGRAPH_TRACE_SCOPE(logger, "outer");
        MODGRAPH_TRACE_SCOPE(logger, "inner");
    }

    const auto out = oss.str();
    auto begin_outer = out.find("begin outer");
    auto begin_inner = out.find("begin inner");
    auto end_inner = out.find("end inner");
    auto end_outer = out.find("end outer");
    REQUIRE(begin_outer != std::string::npos);
    REQUIRE(end_outer != std::string::npos);
    REQUIRE(begin_outer < begin_inner);
    REQUIRE(begin_inner < end_inner);
    REQUIRE(end_inner < end_outer);
}

TEST_CASE("Report format parsing", "[core][config]") {
    REQUIRE(parse_report_format("text") == ReportFormat::Text);
    REQUIRE(parse_report_format("json") == ReportFormat::Json);
    REQUIRE_FALSE(parse_report_format("yaml").has_value());
    REQUIRE(std::string(report_format_name(ReportFormat::Json)) == "json");
}

TEST_CASE("ToolConfig parsing", "[core][config]") {
    SECTION("empty document keeps defaults") {
        auto result = ToolConfig::from_toml_string("");
        REQUIRE(result.is_ok());
        REQUIRE(result->format == ReportFormat::Text);
        REQUIRE(result->logging.level == spdlog::level::info);
        REQUIRE(result->logging.console);
        REQUIRE_FALSE(result->logging.writes_file());
        REQUIRE(result->dot_output.empty());
    }

    SECTION("all sections") {
        auto result = ToolConfig::from_toml_string(R"(
[logging]
level = "debug"
console = false
directory = "logs"

[report]
format = "json"
dot_output = "graph.dot"
)");
        REQUIRE(result.is_ok());
        const auto& config = result.value();
        REQUIRE(config.logging.level == spdlog::level::debug);
        REQUIRE_FALSE(config.logging.console);
        REQUIRE(config.logging.writes_file());
        REQUIRE(config.logging.directory.string() == "logs");
        REQUIRE(config.format == ReportFormat::Json);
        REQUIRE(config.dot_output.string() == "graph.dot");
    }

    SECTION("invalid level") {
        auto result = ToolConfig::from_toml_string("[logging]\nlevel = \"loud\"\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("invalid format") {
        auto result = ToolConfig::from_toml_string("[report]\nformat = \"xml\"\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("report.format") != std::string::npos);
    }

    SECTION("malformed toml") {
        auto result = ToolConfig::from_toml_string("[logging\nlevel = ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("missing file") {
        auto result = ToolConfig::load("/nonexistent/modgraph.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }
}
