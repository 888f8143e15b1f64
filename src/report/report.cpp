/// @file report.cpp
/// @brief Verdict reporting implementation

#include <modgraph/report/report.hpp>
#include <modgraph/validation/module_dependency_validator.hpp>

namespace modgraph_report {

using modgraph_core::Err;
using modgraph_core::Result;
using modgraph_core::ValidationError;

ExitCode exit_code_for(const Result<void>& verdict) {
    return verdict ? ExitCode::Valid : ExitCode::Invalid;
}

nlohmann::json build_json_report(const std::string& bundle_name, const Result<void>& verdict) {
    nlohmann::json j;
    j["valid"] = verdict.is_ok();
    j["bundle"] = bundle_name;
    if (verdict) {
        return j;
    }

    const auto& error = verdict.error();
    j["code"] = modgraph_core::error_code_name(error.code());
    j["message"] = error.message();

    if (const auto* failure = error.as<ValidationError>()) {
        j["kind"] = modgraph_core::validation_error_kind_name(failure->kind);
        if (!failure->module.empty()) {
            j["module"] = failure->module;
        }
        if (!failure->dependency.empty()) {
            j["dependency"] = failure->dependency;
        }
        if (!failure->cycle_path.empty()) {
            j["cycle"] = failure->cycle_path;
        }
    }

    if (!error.context().empty()) {
        j["context"] = error.context();
    }

    return j;
}

void write_report(
    modgraph_core::ReportFormat format,
    const std::string& bundle_name,
    const Result<void>& verdict,
    std::ostream& out,
    std::ostream& err) {

    switch (format) {
        case modgraph_core::ReportFormat::Json:
            out << build_json_report(bundle_name, verdict).dump() << "\n";
            break;
        case modgraph_core::ReportFormat::Text:
            if (!verdict) {
                err << verdict.error().message() << "\n";
            }
            break;
    }
}

Result<std::string> render_dot_graph(const std::vector<modgraph_bundle::BundleModule>& modules) {
    auto base = modgraph_validation::check_has_base_module(modules);
    if (!base) {
        return Err<std::string>(base.error());
    }

    auto relation = modgraph_validation::build_edge_relation(modules, base.value());
    if (!relation) {
        return Err<std::string>(relation.error());
    }

    return relation->to_dot_graph(modules);
}

} // namespace modgraph_report
