#pragma once

/// @file report.hpp
/// @brief Verdict reporting for the modgraph command line tool
///
/// A validation verdict is reported in one of two shapes:
/// - text: nothing on success, the failure message verbatim on the error stream
/// - json: one object on the output stream, e.g.
///   `{"valid":false,"bundle":"app","code":"ValidationError",
///     "kind":"CyclicDependency","message":"...","module":"a","cycle":["a","b"]}`

#include <modgraph/bundle/module.hpp>
#include <modgraph/core/config.hpp>
#include <modgraph/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace modgraph_report {

/// Process exit status of the modgraph tool
enum class ExitCode : std::uint8_t {
    Valid = 0,    ///< Dependency graph is valid
    Invalid = 1,  ///< Validation found a violation
    Usage = 2,    ///< Bad arguments, configuration or descriptor
};

/// Exit status for a validation verdict
[[nodiscard]] ExitCode exit_code_for(const modgraph_core::Result<void>& verdict);

/// JSON document describing a verdict
[[nodiscard]] nlohmann::json build_json_report(
    const std::string& bundle_name,
    const modgraph_core::Result<void>& verdict);

/// Write a verdict in the requested format
///
/// @param out Receives JSON reports
/// @param err Receives text failure messages
void write_report(
    modgraph_core::ReportFormat format,
    const std::string& bundle_name,
    const modgraph_core::Result<void>& verdict,
    std::ostream& out,
    std::ostream& err);

/// Render the dependency graph of a module set as GraphViz DOT
///
/// Fails when the graph cannot be built (no base module, duplicate names,
/// explicit base dependency). Other violations still render.
[[nodiscard]] modgraph_core::Result<std::string> render_dot_graph(
    const std::vector<modgraph_bundle::BundleModule>& modules);

} // namespace modgraph_report
