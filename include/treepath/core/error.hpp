#pragma once

/// @file error.hpp
/// @brief Error handling types for treepath_core

#include "fwd.hpp"
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace treepath_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    TypeMismatch,
    NotSupported,
};

/// Name of @p code, e.g. "NotFound"
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    static constexpr const char* names[] = {
        "Unknown", "NotFound", "AlreadyExists", "InvalidArgument", "InvalidState",
        "IOError", "ParseError", "ValidationError", "TypeMismatch", "NotSupported",
    };
    const auto index = static_cast<std::size_t>(code);
    return index < std::size(names) ? names[index] : "Unknown";
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Schema index and leafref resolution errors
struct SchemaError {
    enum class Kind : std::uint8_t {
        Unregistered,   // Path does not name a registered leaf
        DuplicatePath,  // Two schema locations normalize to one path
        InvalidPath,    // Malformed leafref path
        AboveRoot,      // Relative path climbs above the schema root
        ModuleContext,  // Relative path evaluated against a module (or no context)
        NotLeafref,     // Entry has no leafref path
        Parse,          // Malformed schema description
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static SchemaError unregistered(const std::string& p) {
        return SchemaError{Kind::Unregistered, "Could not resolve leafref path: " + p, p};
    }

    [[nodiscard]] static SchemaError duplicate_path(const std::string& p) {
        return SchemaError{Kind::DuplicatePath, "Duplicate schema path registration: " + p, p};
    }

    [[nodiscard]] static SchemaError invalid_path(const std::string& p, const std::string& reason) {
        return SchemaError{Kind::InvalidPath, "Invalid path '" + p + "': " + reason, p};
    }

    [[nodiscard]] static SchemaError above_root(const std::string& p, const std::string& caller) {
        return SchemaError{Kind::AboveRoot,
            "Path '" + p + "' from '" + caller + "' tries to recurse above the root", p};
    }

    [[nodiscard]] static SchemaError module_context(const std::string& p, const std::string& caller) {
        return SchemaError{Kind::ModuleContext,
            "Invalid calling node '" + caller + "' for relative path '" + p + "'", p};
    }

    [[nodiscard]] static SchemaError not_leafref(const std::string& entry) {
        return SchemaError{Kind::NotLeafref, "Entry is not a leafref: " + entry, entry};
    }

    [[nodiscard]] static SchemaError parse(const std::string& reason) {
        return SchemaError{Kind::Parse, "Schema description error: " + reason, {}};
    }
};

/// Path computation errors
struct PathError {
    enum class Kind : std::uint8_t {
        MissingParent,  // Child addressed under a parent that was never addressed
        InvalidKey,     // Missing or malformed list key
        NoSchemaPath,   // Field declares no usable path
        Parse,          // Malformed path string
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static PathError missing_parent(const std::string& f) {
        return PathError{Kind::MissingParent, "Could not find parent address for " + f, f};
    }

    [[nodiscard]] static PathError invalid_key(const std::string& f, const std::string& reason) {
        return PathError{Kind::InvalidKey, "Invalid list key for " + f + ": " + reason, f};
    }

    [[nodiscard]] static PathError no_schema_path(const std::string& f) {
        return PathError{Kind::NoSchemaPath, "Invalid schema path for field " + f, f};
    }

    [[nodiscard]] static PathError parse(const std::string& text, const std::string& reason) {
        return PathError{Kind::Parse, "Cannot parse path '" + text + "': " + reason, {}};
    }
};

/// Two trees of different concrete types
struct TypeMismatchError {
    std::string message;
    std::string expected;
    std::string found;

    [[nodiscard]] static TypeMismatchError between(const std::string& a, const std::string& b) {
        return TypeMismatchError{"Cannot diff trees of different types, original: " + a +
                                 ", modified: " + b, a, b};
    }
};

/// Tree mutation errors
struct MutationError {
    enum class Kind : std::uint8_t {
        UnknownField,   // Path or payload names no field
        ResolveFailed,  // Address could not be resolved
        PrefixJoin,     // Prefix cannot be joined onto a path
        NotANode,       // Prefix addresses a leaf
        InvalidValue,   // Value does not fit the field
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static MutationError unknown_field(const std::string& name, const std::string& type) {
        return MutationError{Kind::UnknownField,
            "Parent container " + type + " contains unexpected field " + name, name};
    }

    [[nodiscard]] static MutationError resolve_failed(const std::string& p, const std::string& reason) {
        return MutationError{Kind::ResolveFailed, "Cannot resolve " + p + ": " + reason, p};
    }

    [[nodiscard]] static MutationError prefix_join(const std::string& reason) {
        return MutationError{Kind::PrefixJoin, "Cannot join prefix with path: " + reason, {}};
    }

    [[nodiscard]] static MutationError not_a_node(const std::string& p) {
        return MutationError{Kind::NotANode, "Prefix path points to a non-node: " + p, p};
    }

    [[nodiscard]] static MutationError invalid_value(const std::string& field, const std::string& reason) {
        return MutationError{Kind::InvalidValue, "Invalid value for " + field + ": " + reason, field};
    }
};

/// List invariant violations
struct ValidationError {
    enum class Kind : std::uint8_t {
        KeyMismatch,    // Embedded key differs from lookup key
        MissingKey,     // Key leaf unset
        Cardinality,    // Entry count outside [min, max]
        DuplicateKey,   // Two entries with one key
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static ValidationError key_mismatch(const std::string& p, const std::string& detail) {
        return ValidationError{Kind::KeyMismatch, p + ": key mismatch: " + detail, p};
    }

    [[nodiscard]] static ValidationError missing_key(const std::string& p, const std::string& leaf) {
        return ValidationError{Kind::MissingKey, p + ": missing key field " + leaf, p};
    }

    [[nodiscard]] static ValidationError cardinality(const std::string& p, const std::string& detail) {
        return ValidationError{Kind::Cardinality, p + ": " + detail, p};
    }

    [[nodiscard]] static ValidationError duplicate_key(const std::string& p, const std::string& key) {
        return ValidationError{Kind::DuplicateKey, p + ": duplicate key " + key, p};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Code reported for each error kind
[[nodiscard]] constexpr ErrorCode code_of(const SchemaError& err) noexcept {
    switch (err.kind) {
        case SchemaError::Kind::Unregistered: return ErrorCode::NotFound;
        case SchemaError::Kind::DuplicatePath: return ErrorCode::AlreadyExists;
        case SchemaError::Kind::Parse: return ErrorCode::ParseError;
        default: return ErrorCode::InvalidArgument;
    }
}

[[nodiscard]] constexpr ErrorCode code_of(const PathError& err) noexcept {
    switch (err.kind) {
        case PathError::Kind::InvalidKey: return ErrorCode::InvalidArgument;
        case PathError::Kind::Parse: return ErrorCode::ParseError;
        default: return ErrorCode::InvalidState;
    }
}

[[nodiscard]] constexpr ErrorCode code_of(const TypeMismatchError&) noexcept {
    return ErrorCode::TypeMismatch;
}

[[nodiscard]] constexpr ErrorCode code_of(const MutationError& err) noexcept {
    switch (err.kind) {
        case MutationError::Kind::UnknownField:
        case MutationError::Kind::ResolveFailed:
            return ErrorCode::NotFound;
        default:
            return ErrorCode::InvalidArgument;
    }
}

[[nodiscard]] constexpr ErrorCode code_of(const ValidationError&) noexcept {
    return ErrorCode::ValidationError;
}

template<typename T>
struct is_error_kind : std::false_type {};
template<> struct is_error_kind<SchemaError> : std::true_type {};
template<> struct is_error_kind<PathError> : std::true_type {};
template<> struct is_error_kind<TypeMismatchError> : std::true_type {};
template<> struct is_error_kind<MutationError> : std::true_type {};
template<> struct is_error_kind<ValidationError> : std::true_type {};

/// A failure: its code, the kind-specific detail (or a plain message) and
/// free-form context added while the error travels up
class Error {
public:
    using Variant = std::variant<
        std::string,
        SchemaError,
        PathError,
        TypeMismatchError,
        MutationError,
        ValidationError
    >;

    Error() : Error(ErrorCode::Unknown, "Unknown error") {}
    Error(ErrorCode code, std::string message) : m_code(code), m_detail(std::move(message)) {}
    Error(const std::string& message) : Error(ErrorCode::Unknown, message) {}
    Error(const char* message) : Error(ErrorCode::Unknown, std::string(message)) {}

    template<typename Kind, typename = std::enable_if_t<is_error_kind<Kind>::value>>
    Error(Kind err) : m_code(code_of(err)), m_detail(std::move(err)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(err)>, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_detail);
    }

    template<typename Kind>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<Kind>(m_detail); }

    /// The detail as @p Kind, or nullptr
    template<typename Kind>
    [[nodiscard]] const Kind* as() const noexcept { return std::get_if<Kind>(&m_detail); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_detail; }

    /// Attach or overwrite a context entry
    Error& with_context(const std::string& key, const std::string& value) & {
        m_context[key] = value;
        return *this;
    }
    Error&& with_context(const std::string& key, const std::string& value) && {
        m_context[key] = value;
        return std::move(*this);
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Variant m_detail;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result
// =============================================================================

/// Either a value or an Error. Library operations report failure through
/// Result and never throw.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Access the value; only valid when is_ok()
    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    /// Access the error; only valid when is_err()
    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }

    [[nodiscard]] T value_or(T fallback) const& { return is_ok() ? value() : std::move(fallback); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

private:
    std::variant<T, E> m_state;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

private:
    std::optional<E> m_error;
};

template<typename T>
[[nodiscard]] Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

/// "[Code] [Kind] message" followed by one "key: value" line per context entry
[[nodiscard]] std::string build_error_chain(const Error& error);

} // namespace treepath_core
