#pragma once

/// @file error.hpp
/// @brief Error handling types for keyfix_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace keyfix_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    OutOfRange,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Scene document errors (fatal for the whole run)
struct FormatError {
    enum class Kind : std::uint8_t {
        Unparseable,        // Document is not valid JSON
        NotAnObject,        // Root value is not a JSON object
        MissingSection,     // Required top-level array absent
        InvalidField,       // Field present with the wrong JSON type
        UnsupportedBuffer,  // Buffer layout not handled (data URI, GLB, several buffers)
        MissingBinary,      // Referenced binary file does not exist
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string section;

    [[nodiscard]] static FormatError unparseable(const std::string& file, const std::string& reason) {
        return FormatError{Kind::Unparseable, "Cannot parse scene document " + file + ": " + reason, file, {}};
    }

    [[nodiscard]] static FormatError not_an_object(const std::string& file) {
        return FormatError{Kind::NotAnObject, "Scene document root is not an object: " + file, file, {}};
    }

    [[nodiscard]] static FormatError missing_section(const std::string& name) {
        return FormatError{Kind::MissingSection, "Missing required section '" + name + "'", {}, name};
    }

    [[nodiscard]] static FormatError invalid_field(const std::string& where, const std::string& reason) {
        return FormatError{Kind::InvalidField, where + ": " + reason, {}, where};
    }

    [[nodiscard]] static FormatError unsupported_buffer(const std::string& reason) {
        return FormatError{Kind::UnsupportedBuffer, "Unsupported buffer layout: " + reason, {}, "buffers"};
    }

    [[nodiscard]] static FormatError missing_binary(const std::string& file) {
        return FormatError{Kind::MissingBinary, "Referenced binary file not found: " + file, file, "buffers"};
    }
};

/// Per-sampler reference and range errors
struct BufferBoundsError {
    enum class Kind : std::uint8_t {
        AccessorIndex,      // Sampler input accessor index out of range
        MissingBufferView,  // Accessor has no bufferView
        BufferViewIndex,    // Accessor bufferView index out of range
        BufferIndex,        // BufferView buffer index out of range
        RangeExceeded,      // Resolved bytes run past the end of the bufferView or buffer
        EmptyAccessor,      // Accessor declares zero elements
    };

    Kind kind;
    std::string message;
    std::int64_t index = -1;
    std::uint64_t required = 0;
    std::uint64_t available = 0;

    [[nodiscard]] static BufferBoundsError accessor_index(std::int64_t idx, std::size_t size) {
        return BufferBoundsError{Kind::AccessorIndex,
            "Accessor index " + std::to_string(idx) + " out of range (" + std::to_string(size) + " accessors)",
            idx, 0, size};
    }

    [[nodiscard]] static BufferBoundsError missing_buffer_view(std::int64_t accessor) {
        return BufferBoundsError{Kind::MissingBufferView,
            "Accessor " + std::to_string(accessor) + " has no bufferView", accessor, 0, 0};
    }

    [[nodiscard]] static BufferBoundsError buffer_view_index(std::int64_t idx, std::size_t size) {
        return BufferBoundsError{Kind::BufferViewIndex,
            "BufferView index " + std::to_string(idx) + " out of range (" + std::to_string(size) + " bufferViews)",
            idx, 0, size};
    }

    [[nodiscard]] static BufferBoundsError buffer_index(std::int64_t idx, std::size_t size) {
        return BufferBoundsError{Kind::BufferIndex,
            "Buffer index " + std::to_string(idx) + " out of range (" + std::to_string(size) + " buffers)",
            idx, 0, size};
    }

    [[nodiscard]] static BufferBoundsError range_exceeded(std::int64_t accessor, std::uint64_t end, std::uint64_t length) {
        return BufferBoundsError{Kind::RangeExceeded,
            "Accessor " + std::to_string(accessor) + " needs bytes up to " + std::to_string(end) +
            " but buffer holds " + std::to_string(length),
            accessor, end, length};
    }

    [[nodiscard]] static BufferBoundsError view_exceeded(
        std::int64_t accessor, std::int64_t view, std::uint64_t end, std::uint64_t length) {
        return BufferBoundsError{Kind::RangeExceeded,
            "Accessor " + std::to_string(accessor) + " needs bytes up to " + std::to_string(end) +
            " of bufferView " + std::to_string(view) + " but the view holds " + std::to_string(length),
            accessor, end, length};
    }

    [[nodiscard]] static BufferBoundsError empty_accessor(std::int64_t accessor) {
        return BufferBoundsError{Kind::EmptyAccessor,
            "Accessor " + std::to_string(accessor) + " declares zero elements", accessor, 0, 0};
    }
};

/// Timestamp accessor with an encoding other than SCALAR float
struct UnsupportedComponentTypeError {
    std::string message;
    std::int64_t accessor = -1;
    std::uint32_t component_type = 0;
    std::string element_type;

    [[nodiscard]] static UnsupportedComponentTypeError make(
        std::int64_t accessor_idx, std::uint32_t component, const std::string& element) {
        return UnsupportedComponentTypeError{
            "Accessor " + std::to_string(accessor_idx) + " uses componentType " + std::to_string(component) +
            " (" + element + "), only SCALAR FLOAT (5126) timestamps are supported",
            accessor_idx, component, element};
    }
};

/// File system errors (fatal)
struct IoError {
    enum class Kind : std::uint8_t {
        OpenFailed,
        ReadFailed,
        WriteFailed,
        WouldOverwriteInput,
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static IoError open_failed(const std::string& file) {
        return IoError{Kind::OpenFailed, "Failed to open file: " + file, file};
    }

    [[nodiscard]] static IoError read_failed(const std::string& file) {
        return IoError{Kind::ReadFailed, "Failed to read file: " + file, file};
    }

    [[nodiscard]] static IoError write_failed(const std::string& file) {
        return IoError{Kind::WriteFailed, "Failed to write file: " + file, file};
    }

    [[nodiscard]] static IoError would_overwrite_input(const std::string& file) {
        return IoError{Kind::WouldOverwriteInput, "Refusing to overwrite input file: " + file, file};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        FormatError,
        BufferBoundsError,
        UnsupportedComponentTypeError,
        IoError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(FormatError err) : m_code(ErrorCode::ParseError), m_error(std::move(err)) {}
    Error(BufferBoundsError err) : m_code(ErrorCode::OutOfRange), m_error(std::move(err)) {}
    Error(UnsupportedComponentTypeError err) : m_code(ErrorCode::NotSupported), m_error(std::move(err)) {}
    Error(IoError err) : m_code(ErrorCode::IOError), m_error(std::move(err)) {}
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

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
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

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
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

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
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

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with its context entries
std::string build_error_chain(const Error& error);

/// Short name of the error kind ("FormatError", "BufferBoundsError", ...)
const char* error_kind_name(const Error& error);

} // namespace keyfix_core
