// modgraph_core error model tests
//
// - ValidationError messages and the error code each kind maps to
// - ManifestError field paths
// - context entries and the formatted error chain
// - Result access for values and checks

#include <catch2/catch_test_macros.hpp>
#include <modgraph/core/error.hpp>

#include <string>
#include <vector>

using namespace modgraph_core;

// =============================================================================
// Validation Errors
// =============================================================================

TEST_CASE("ValidationError messages", "[core][error]") {
    SECTION("missing base module") {
        Error err = ValidationError::missing_root_module("base");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.message() == "Mandatory 'base' module is missing.");
        REQUIRE(err.as<ValidationError>()->kind == ValidationError::Kind::MissingRootModule);
    }

    SECTION("explicit base dependency names both modules") {
        Error err = ValidationError::explicit_root_dependency("camera", "base");
        REQUIRE(err.message() ==
            "Module 'camera' declares dependency on the 'base' module, which is implicit.");
        REQUIRE(err.as<ValidationError>()->module == "camera");
        REQUIRE(err.as<ValidationError>()->dependency == "base");
    }

    SECTION("cycle path is rendered in order") {
        Error err = ValidationError::cyclic_dependency({"a", "b", "c"});
        REQUIRE(err.message() == "Found cyclic dependency between modules: [a, b, c]");

        const auto* failure = err.as<ValidationError>();
        REQUIRE(failure != nullptr);
        REQUIRE(failure->cycle_path == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(failure->module == "a");
    }

    SECTION("delivery ordering") {
        Error err = ValidationError::invalid_delivery_ordering("a", "b");
        REQUIRE(err.message() ==
            "Install-time module 'a' declares dependency on on-demand module 'b'.");
    }

    SECTION("kind names") {
        REQUIRE(std::string(validation_error_kind_name(ValidationError::Kind::SelfDependency)) ==
            "SelfDependency");
        REQUIRE(std::string(validation_error_kind_name(
            ValidationError::Kind::DuplicateDependencyDeclaration)) == "DuplicateDependencyDeclaration");
    }
}

TEST_CASE("Error codes follow the violation kind", "[core][error]") {
    REQUIRE(Error(ValidationError::duplicate_module_entry("feature")).code() == ErrorCode::InvalidArgument);
    REQUIRE(Error(ValidationError::unknown_module_reference("ghost")).code() == ErrorCode::DependencyMissing);
    REQUIRE(Error(ValidationError::self_dependency("a")).code() == ErrorCode::ValidationError);
    REQUIRE(Error(ManifestError::syntax("bundle.json", "eof")).code() == ErrorCode::ParseError);
    REQUIRE(Error("plain").code() == ErrorCode::Unknown);
}

// =============================================================================
// Manifest Errors
// =============================================================================

TEST_CASE("ManifestError carries the field path", "[core][error]") {
    Error err = ManifestError::missing_field("bundle.json", "modules[0].name");
    REQUIRE(err.is<ManifestError>());
    REQUIRE_FALSE(err.is<ValidationError>());
    REQUIRE(err.as<ManifestError>()->field == "modules[0].name");
    REQUIRE(err.message() == "Missing 'modules[0].name' in bundle.json");
}

// =============================================================================
// Context and Error Chain
// =============================================================================

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = ValidationError::self_dependency("feature");
    err.with_context("validator", "ModuleDependencyValidator");

    REQUIRE(*err.get_context("validator") == "ModuleDependencyValidator");
    REQUIRE(err.get_context("missing") == nullptr);

    auto chain = build_error_chain(err);
    REQUIRE(chain.find("[ValidationError]") != std::string::npos);
    REQUIRE(chain.find("[SelfDependency]") != std::string::npos);
    REQUIRE(chain.find("(module: feature)") != std::string::npos);
    REQUIRE(chain.find("\n  validator: ModuleDependencyValidator") != std::string::npos);
}

// =============================================================================
// Result
// =============================================================================

TEST_CASE("Result of a builder", "[core][result]") {
    SECTION("holds the value") {
        Result<std::vector<std::string>> r = Ok(std::vector<std::string>{"base", "feature"});
        REQUIRE(r.is_ok());
        REQUIRE(r->size() == 2);
        REQUIRE((*r)[1] == "feature");

        auto names = std::move(r).value();
        REQUIRE(names.front() == "base");
    }

    SECTION("holds the error") {
        auto r = Err<std::string>(ManifestError::syntax("bundle.json", "unexpected end"));
        REQUIRE(r.is_err());
        REQUIRE_FALSE(r);
        REQUIRE(r.error().is<ManifestError>());
    }
}

TEST_CASE("Result of a check", "[core][result]") {
    Result<void> passed = Ok();
    REQUIRE(passed.is_ok());
    REQUIRE(passed);

    Result<void> failed = Err(ValidationError::self_dependency("a"));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().as<ValidationError>()->module == "a");
}
