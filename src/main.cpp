/// @file main.cpp
/// @brief modgraph entry point - validates the module dependency graph of a bundle
///
/// Loads a bundle descriptor, runs the validation pipeline and reports the
/// verdict. Exit codes:
/// - 0: the dependency graph is valid
/// - 1: validation failed (message printed verbatim)
/// - 2: usage, configuration or descriptor error

#include <modgraph/core/config.hpp>
#include <modgraph/core/log.hpp>
#include <modgraph/report/report.hpp>
#include <modgraph/validation/validation.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using modgraph_report::ExitCode;

int to_status(ExitCode code) {
    return static_cast<int>(code);
}

// =============================================================================
// Command Line
// =============================================================================

struct CommandLine {
    fs::path bundle_path;
    fs::path config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> format;
    std::optional<fs::path> dot_output;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] BUNDLE_JSON\n"
              << "\n"
              << "Arguments:\n"
              << "  BUNDLE_JSON          Bundle descriptor listing modules and their manifests\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE        Read settings from a modgraph.toml file\n"
              << "  --log-level LEVEL    trace|debug|info|warn|error|critical|off\n"
              << "  --format FORMAT      text|json\n"
              << "  --dot FILE           Write the dependency graph in GraphViz DOT format\n"
              << "  --help, -h           Show this help message\n"
              << "  --version, -v        Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " bundle.json\n"
              << "  " << program_name << " --format json --dot graph.dot bundle.json\n";
}

void print_version() {
    std::cout << "modgraph 0.1.0\n"
              << "Bundle module dependency validator\n";
}

/// Write the dependency graph as DOT, when it can be built
void write_dot_graph(
    const fs::path& path,
    const std::vector<modgraph_bundle::BundleModule>& modules) {

    auto dot = modgraph_report::render_dot_graph(modules);
    if (!dot) {
        MODGRAPH_LOG_WARN("Skipping DOT export: {}", dot.error().message());
        return;
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        MODGRAPH_LOG_ERROR("Failed to open DOT output: {}", path.string());
        return;
    }
    out << dot.value();
    MODGRAPH_LOG_INFO("Wrote dependency graph to {}", path.string());
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    CommandLine cli;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return to_status(ExitCode::Valid);
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return to_status(ExitCode::Valid);
        } else if (arg == "--config" || arg == "--log-level" || arg == "--format" || arg == "--dot") {
            auto value = next_value(arg.c_str());
            if (!value) {
                print_usage(argv[0]);
                return to_status(ExitCode::Usage);
            }
            if (arg == "--config") cli.config_path = *value;
            else if (arg == "--log-level") cli.log_level = *value;
            else if (arg == "--format") cli.format = *value;
            else cli.dot_output = fs::path(*value);
        } else if (!arg.empty() && arg[0] != '-') {
            cli.bundle_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return to_status(ExitCode::Usage);
        }
    }

    if (cli.bundle_path.empty()) {
        std::cerr << "Error: No bundle descriptor specified.\n\n";
        print_usage(argv[0]);
        return to_status(ExitCode::Usage);
    }

    // Configuration: file first, then command-line overrides
    modgraph_core::ToolConfig config;
    if (!cli.config_path.empty()) {
        auto config_result = modgraph_core::ToolConfig::load(cli.config_path);
        if (!config_result) {
            std::cerr << modgraph_core::build_error_chain(config_result.error()) << "\n";
            return to_status(ExitCode::Usage);
        }
        config = std::move(config_result).value();
    }
    if (cli.log_level) {
        auto level = modgraph_core::parse_log_level(*cli.log_level);
        if (!level) {
            std::cerr << "Invalid log level: " << *cli.log_level << "\n";
            return to_status(ExitCode::Usage);
        }
        config.logging.level = *level;
    }
    if (cli.format) {
        auto format = modgraph_core::parse_report_format(*cli.format);
        if (!format) {
            std::cerr << "Invalid format: " << *cli.format << "\n";
            return to_status(ExitCode::Usage);
        }
        config.format = *format;
    }
    if (cli.dot_output) {
        config.dot_output = *cli.dot_output;
    }

    modgraph_core::configure_logging(config.logging);

    // Load modules
    MODGRAPH_LOG_DEBUG("Loading bundle descriptor: {}", cli.bundle_path.string());
    auto descriptor = modgraph_bundle::BundleDescriptor::load(cli.bundle_path);
    if (!descriptor) {
        std::cerr << "Failed to load bundle: "
                  << modgraph_core::build_error_chain(descriptor.error()) << "\n";
        modgraph_core::shutdown_logging();
        return to_status(ExitCode::Usage);
    }

    const std::string bundle_name = descriptor->name.empty()
        ? cli.bundle_path.stem().string()
        : descriptor->name;

    if (!config.dot_output.empty()) {
        write_dot_graph(config.dot_output, descriptor->modules);
    }

    // Validate
    auto validator = modgraph_validation::BundleValidator::with_default_validators();
    auto result = validator.validate(descriptor->modules);

    modgraph_report::write_report(config.format, bundle_name, result, std::cout, std::cerr);

    modgraph_core::shutdown_logging();
    return to_status(modgraph_report::exit_code_for(result));
}
