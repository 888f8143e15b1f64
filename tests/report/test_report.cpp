// modgraph_report Unit Tests
//
// Tests for verdict reporting:
// - exit status for each verdict
// - JSON report fields for every failure shape
// - text and JSON stream routing
// - DOT rendering of a module set

#include <catch2/catch_test_macros.hpp>
#include <modgraph/report/report.hpp>
#include <modgraph/validation/bundle_validator.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace modgraph_report;
using namespace modgraph_bundle;
using namespace modgraph_core;

namespace {

Result<void> validate(const std::vector<BundleModule>& modules) {
    return modgraph_validation::BundleValidator::with_default_validators().validate(modules);
}

} // anonymous namespace

TEST_CASE("Exit status", "[report][exit]") {
    REQUIRE(exit_code_for(Ok()) == ExitCode::Valid);
    REQUIRE(exit_code_for(Err(ValidationError::self_dependency("a"))) == ExitCode::Invalid);

    REQUIRE(static_cast<int>(ExitCode::Valid) == 0);
    REQUIRE(static_cast<int>(ExitCode::Invalid) == 1);
    REQUIRE(static_cast<int>(ExitCode::Usage) == 2);
}

TEST_CASE("JSON report", "[report][json]") {
    SECTION("valid bundle") {
        auto report = build_json_report("com.example.app", validate({
            BundleModule::named("base"),
            BundleModule::named("feature"),
        }));
        REQUIRE(report["valid"] == true);
        REQUIRE(report["bundle"] == "com.example.app");
        REQUIRE_FALSE(report.contains("kind"));
        REQUIRE_FALSE(report.contains("message"));
    }

    SECTION("delivery ordering names module and dependency") {
        auto report = build_json_report("app", validate({
            BundleModule::named("base"),
            BundleModule::named("a", {"b"}),
            BundleModule::named("b", {}, DeliveryType::OnDemand),
        }));
        REQUIRE(report["valid"] == false);
        REQUIRE(report["code"] == "ValidationError");
        REQUIRE(report["kind"] == "InvalidDeliveryOrdering");
        REQUIRE(report["module"] == "a");
        REQUIRE(report["dependency"] == "b");
        REQUIRE(report["message"] ==
            "Install-time module 'a' declares dependency on on-demand module 'b'.");
        REQUIRE(report["context"]["validator"] == "ModuleDependencyValidator");
        REQUIRE_FALSE(report.contains("cycle"));
    }

    SECTION("cycle lists the path") {
        auto report = build_json_report("app", validate({
            BundleModule::named("base"),
            BundleModule::named("a", {"b"}),
            BundleModule::named("b", {"c"}),
            BundleModule::named("c", {"a"}),
        }));
        REQUIRE(report["kind"] == "CyclicDependency");
        REQUIRE(report["module"] == "a");
        REQUIRE(report["cycle"] == nlohmann::json::array({"a", "b", "c"}));
        REQUIRE_FALSE(report.contains("dependency"));
    }

    SECTION("unknown reference keeps the referring module in context") {
        auto report = build_json_report("app", validate({
            BundleModule::named("base"),
            BundleModule::named("a", {"ghost"}),
        }));
        REQUIRE(report["code"] == "DependencyMissing");
        REQUIRE(report["kind"] == "UnknownModuleReference");
        REQUIRE(report["dependency"] == "ghost");
        REQUIRE(report["context"]["referenced_by"] == "a");
    }

    SECTION("untyped error has no kind") {
        auto report = build_json_report("app", Err(Error(ErrorCode::ValidationError, "rejected")));
        REQUIRE(report["valid"] == false);
        REQUIRE(report["message"] == "rejected");
        REQUIRE_FALSE(report.contains("kind"));
        REQUIRE_FALSE(report.contains("context"));
    }
}

TEST_CASE("Report streams", "[report][output]") {
    std::ostringstream out;
    std::ostringstream err;
    Result<void> failed = Err(ValidationError::self_dependency("a"));

    SECTION("text success is silent") {
        write_report(ReportFormat::Text, "app", Ok(), out, err);
        REQUIRE(out.str().empty());
        REQUIRE(err.str().empty());
    }

    SECTION("text failure prints the message verbatim") {
        write_report(ReportFormat::Text, "app", failed, out, err);
        REQUIRE(out.str().empty());
        REQUIRE(err.str() == "Module 'a' depends on itself via <uses-split>.\n");
    }

    SECTION("json goes to the output stream as one line") {
        write_report(ReportFormat::Json, "app", failed, out, err);
        REQUIRE(err.str().empty());

        auto text = out.str();
        REQUIRE(text.back() == '\n');
        REQUIRE(text.find('\n') == text.size() - 1);

        auto parsed = nlohmann::json::parse(text);
        REQUIRE(parsed["kind"] == "SelfDependency");
        REQUIRE(parsed["module"] == "a");
    }
}

TEST_CASE("DOT rendering", "[report][dot]") {
    SECTION("renders a graph that has violations") {
        auto dot = render_dot_graph({
            BundleModule::named("base"),
            BundleModule::named("a", {"b"}),
            BundleModule::named("b", {"a"}),
        });
        REQUIRE(dot.is_ok());
        REQUIRE(dot->find("\"a\" -> \"b\";") != std::string::npos);
        REQUIRE(dot->find("\"b\" -> \"a\";") != std::string::npos);
    }

    SECTION("needs a base module") {
        auto dot = render_dot_graph({BundleModule::named("a")});
        REQUIRE(dot.is_err());
        REQUIRE(dot.error().as<ValidationError>()->kind == ValidationError::Kind::MissingRootModule);
    }
}
