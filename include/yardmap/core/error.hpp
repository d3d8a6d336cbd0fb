#pragma once

/// @file error.hpp
/// @brief Error handling types for yardmap_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace yardmap_core {

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
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Location code errors
struct LocationError {
    enum class Kind : std::uint8_t {
        Empty,               // Nothing but separators
        MissingStack,        // No S<digits> part
        MissingRow,          // No R<digits> part
        MissingTier,         // No H<digits> / T<digits> part
        NonPositive,         // A coordinate is zero
        OutOfRange,          // A coordinate does not fit
        TrailingCharacters,  // Garbage after the tier
    };

    Kind kind;
    std::string message;
    std::string input;

    [[nodiscard]] static LocationError empty() {
        return LocationError{Kind::Empty, "Location code is empty", {}};
    }

    [[nodiscard]] static LocationError missing_stack(const std::string& code) {
        return LocationError{Kind::MissingStack, "Location code has no stack number: '" + code + "'", code};
    }

    [[nodiscard]] static LocationError missing_row(const std::string& code) {
        return LocationError{Kind::MissingRow, "Location code has no row number: '" + code + "'", code};
    }

    [[nodiscard]] static LocationError missing_tier(const std::string& code) {
        return LocationError{Kind::MissingTier, "Location code has no tier number: '" + code + "'", code};
    }

    [[nodiscard]] static LocationError non_positive(const std::string& code, const std::string& field) {
        return LocationError{Kind::NonPositive,
            "Location code " + field + " must be positive: '" + code + "'", code};
    }

    [[nodiscard]] static LocationError out_of_range(const std::string& code, const std::string& field) {
        return LocationError{Kind::OutOfRange,
            "Location code " + field + " is out of range: '" + code + "'", code};
    }

    [[nodiscard]] static LocationError trailing_characters(const std::string& code) {
        return LocationError{Kind::TrailingCharacters,
            "Unexpected characters after tier: '" + code + "'", code};
    }
};

/// Configuration and snapshot input errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        MissingField,   // Required field absent
        InvalidValue,   // Field present with wrong type or value
        Malformed,      // Document could not be parsed
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError missing_field(const std::string& field) {
        return ConfigError{Kind::MissingField, "Missing required field '" + field + "'", field};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& field, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + field + "': " + reason, field};
    }

    [[nodiscard]] static ConfigError malformed(const std::string& reason) {
        return ConfigError{Kind::Malformed, "Malformed document: " + reason, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        LocationError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(LocationError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(LocationError::Kind kind) {
        switch (kind) {
            case LocationError::Kind::OutOfRange: return ErrorCode::InvalidArgument;
            default: return ErrorCode::ParseError;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::MissingField: return ErrorCode::ValidationError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::Malformed: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Chain a fallible step on the success value
    template<typename F>
    auto and_then(F&& func) && -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

} // namespace yardmap_core
