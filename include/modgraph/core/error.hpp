#pragma once

/// @file error.hpp
/// @brief Error handling types for modgraph_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <optional>
#include <utility>
#include <map>

namespace modgraph_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
    DependencyMissing,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Module dependency graph violations
struct ValidationError {
    enum class Kind : std::uint8_t {
        MissingRootModule,               // No module flagged as base
        IdentifierMismatch,              // Declared split ID conflicts with module name
        DuplicateModuleEntry,            // Same module name passed twice
        ExplicitRootDependency,          // Module lists the implicit base dependency
        SelfDependency,                  // Non-base module depends on itself
        DuplicateDependencyDeclaration,  // Dependency listed more than once
        UnknownModuleReference,          // Dependency target does not exist
        CyclicDependency,                // Dependency path returns to itself
        InvalidDeliveryOrdering,         // Install-time module depends on on-demand module
    };

    Kind kind;
    std::string message;
    std::string module;                   // Offending module, when there is one
    std::string dependency;               // Offending dependency, when there is one
    std::vector<std::string> cycle_path;  // For CyclicDependency

    [[nodiscard]] static ValidationError missing_root_module(const std::string& root) {
        return ValidationError{Kind::MissingRootModule,
            "Mandatory '" + root + "' module is missing.", root, {}, {}};
    }

    [[nodiscard]] static ValidationError root_split_id(const std::string& root, const std::string& split_id) {
        return ValidationError{Kind::IdentifierMismatch,
            "The " + root + " module should not declare split ID in the manifest, but it is set to '" +
                split_id + "'.",
            root, split_id, {}};
    }

    [[nodiscard]] static ValidationError split_id_mismatch(const std::string& module, const std::string& split_id) {
        return ValidationError{Kind::IdentifierMismatch,
            "Module '" + module + "' declares in its manifest that the split ID is '" + split_id +
                "'. It needs to be either absent or equal to the module name.",
            module, split_id, {}};
    }

    [[nodiscard]] static ValidationError duplicate_module_entry(const std::string& module) {
        return ValidationError{Kind::DuplicateModuleEntry,
            "Module named '" + module + "' was passed in multiple times.", module, {}, {}};
    }

    [[nodiscard]] static ValidationError explicit_root_dependency(const std::string& module, const std::string& root) {
        return ValidationError{Kind::ExplicitRootDependency,
            "Module '" + module + "' declares dependency on the '" + root + "' module, which is implicit.",
            module, root, {}};
    }

    [[nodiscard]] static ValidationError self_dependency(const std::string& module) {
        return ValidationError{Kind::SelfDependency,
            "Module '" + module + "' depends on itself via <uses-split>.", module, module, {}};
    }

    [[nodiscard]] static ValidationError duplicate_dependency(const std::string& module, const std::string& dep) {
        return ValidationError{Kind::DuplicateDependencyDeclaration,
            "Module '" + module + "' declares dependency on module '" + dep + "' multiple times.",
            module, dep, {}};
    }

    [[nodiscard]] static ValidationError unknown_module_reference(const std::string& dep) {
        return ValidationError{Kind::UnknownModuleReference,
            "Module '" + dep + "' is referenced by <uses-split> but does not exist.", {}, dep, {}};
    }

    /// Cycle path is rendered in traversal order, e.g. "[a, b, c]"
    [[nodiscard]] static ValidationError cyclic_dependency(std::vector<std::string> path) {
        std::string rendered = "[";
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (i > 0) rendered += ", ";
            rendered += path[i];
        }
        rendered += "]";
        std::string first = path.empty() ? std::string() : path.front();
        return ValidationError{Kind::CyclicDependency,
            "Found cyclic dependency between modules: " + rendered, first, {}, std::move(path)};
    }

    [[nodiscard]] static ValidationError invalid_delivery_ordering(const std::string& module, const std::string& dep) {
        return ValidationError{Kind::InvalidDeliveryOrdering,
            "Install-time module '" + module + "' declares dependency on on-demand module '" + dep + "'.",
            module, dep, {}};
    }
};

/// Get validation error kind name
[[nodiscard]] inline const char* validation_error_kind_name(ValidationError::Kind kind) {
    switch (kind) {
        case ValidationError::Kind::MissingRootModule: return "MissingRootModule";
        case ValidationError::Kind::IdentifierMismatch: return "IdentifierMismatch";
        case ValidationError::Kind::DuplicateModuleEntry: return "DuplicateModuleEntry";
        case ValidationError::Kind::ExplicitRootDependency: return "ExplicitRootDependency";
        case ValidationError::Kind::SelfDependency: return "SelfDependency";
        case ValidationError::Kind::DuplicateDependencyDeclaration: return "DuplicateDependencyDeclaration";
        case ValidationError::Kind::UnknownModuleReference: return "UnknownModuleReference";
        case ValidationError::Kind::CyclicDependency: return "CyclicDependency";
        case ValidationError::Kind::InvalidDeliveryOrdering: return "InvalidDeliveryOrdering";
        default: return "Unknown";
    }
}

/// Bundle descriptor errors
struct ManifestError {
    enum class Kind : std::uint8_t {
        Syntax,        // Document is not well-formed
        MissingField,  // Required field absent
        InvalidField,  // Field present with wrong type or value
    };

    Kind kind;
    std::string message;
    std::string source;  // File or stream name
    std::string field;   // JSON path of the offending field

    [[nodiscard]] static ManifestError syntax(const std::string& source, const std::string& reason) {
        return ManifestError{Kind::Syntax, "Malformed descriptor " + source + ": " + reason, source, {}};
    }

    [[nodiscard]] static ManifestError missing_field(const std::string& source, const std::string& field) {
        return ManifestError{Kind::MissingField, "Missing '" + field + "' in " + source, source, field};
    }

    [[nodiscard]] static ManifestError invalid_field(
        const std::string& source, const std::string& field, const std::string& reason) {
        return ManifestError{Kind::InvalidField,
            "Invalid '" + field + "' in " + source + ": " + reason, source, field};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ValidationError,
        ManifestError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ValidationError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ManifestError err) : m_code(ErrorCode::ParseError), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All attached context, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ValidationError::Kind kind) {
        switch (kind) {
            case ValidationError::Kind::DuplicateModuleEntry: return ErrorCode::InvalidArgument;
            case ValidationError::Kind::UnknownModuleReference: return ErrorCode::DependencyMissing;
            default: return ErrorCode::ValidationError;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or the error that prevented producing it
///
/// Checks return Result<void>; builders return the built object. Accessing
/// the value of a failed result (or the error of a successful one) is a
/// caller bug and is not checked.
template<typename T, typename E>
class Result {
public:
    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T* operator->() { return &*m_value; }
    [[nodiscard]] const T* operator->() const { return &*m_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Outcome of a check that produces no value
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    E m_error;
    bool m_failed = false;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, typed details and context
std::string build_error_chain(const Error& error);

} // namespace modgraph_core
