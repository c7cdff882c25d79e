#pragma once

/// @file error.hpp
/// @brief Error handling types for vfsh_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace vfsh_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// User-visible failure kind reported at the dispatch boundary
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    PathNotFound,
    NotADirectory,
    NameCollision,
    InvalidOperation,
    UnknownCommand,
    UnknownFlag,
    MissingValue,
    InvalidArgument,
    DuplicateCommand,
    IoError,
    ParseError,
    Internal,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::PathNotFound: return "PathNotFound";
        case ErrorCode::NotADirectory: return "NotADirectory";
        case ErrorCode::NameCollision: return "NameCollision";
        case ErrorCode::InvalidOperation: return "InvalidOperation";
        case ErrorCode::UnknownCommand: return "UnknownCommand";
        case ErrorCode::UnknownFlag: return "UnknownFlag";
        case ErrorCode::MissingValue: return "MissingValue";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::DuplicateCommand: return "DuplicateCommand";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Internal: return "Internal";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Virtual filesystem errors
struct VfsError {
    enum class Kind : std::uint8_t {
        PathNotFound,      // A path segment does not exist
        NotADirectory,     // A File was found where a Directory is required
        NameCollision,     // Sibling with the same name already exists
        InvalidOperation,  // Operation not permitted on this node
        InvalidName,       // Empty name or name containing '/'
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static VfsError path_not_found(const std::string& path) {
        return VfsError{Kind::PathNotFound, "No such file or directory: " + path, path};
    }

    [[nodiscard]] static VfsError not_a_directory(const std::string& path) {
        return VfsError{Kind::NotADirectory, "Not a directory: " + path, path};
    }

    [[nodiscard]] static VfsError name_collision(const std::string& name) {
        return VfsError{Kind::NameCollision, "Name already exists: " + name, name};
    }

    [[nodiscard]] static VfsError invalid_operation(const std::string& path, const std::string& reason) {
        return VfsError{Kind::InvalidOperation, reason + ": " + path, path};
    }

    [[nodiscard]] static VfsError invalid_name(const std::string& name) {
        return VfsError{Kind::InvalidName, "Invalid name: '" + name + "'", name};
    }
};

/// Command registration, parsing and argument binding errors
struct CommandError {
    enum class Kind : std::uint8_t {
        UnknownCommand,    // Name not in registry
        UnknownFlag,       // Flag not declared by the command
        MissingValue,      // Flag expects a value but none follows
        InvalidArgument,   // Value failed conversion or arity check
        DuplicateCommand,  // Name already registered
    };

    Kind kind;
    std::string message;
    std::string command;
    std::string flag;  // For UnknownFlag and MissingValue

    [[nodiscard]] static CommandError unknown_command(const std::string& name) {
        return CommandError{Kind::UnknownCommand, "Command not found: " + name, name, {}};
    }

    [[nodiscard]] static CommandError unknown_flag(const std::string& cmd, const std::string& flag) {
        return CommandError{Kind::UnknownFlag, "Unknown option: " + flag, cmd, flag};
    }

    [[nodiscard]] static CommandError missing_value(const std::string& cmd, const std::string& flag) {
        return CommandError{Kind::MissingValue, "Option requires a value: " + flag, cmd, flag};
    }

    [[nodiscard]] static CommandError invalid_argument(const std::string& cmd, const std::string& reason) {
        return CommandError{Kind::InvalidArgument, reason, cmd, {}};
    }

    [[nodiscard]] static CommandError duplicate_command(const std::string& name) {
        return CommandError{Kind::DuplicateCommand, "Command already registered: " + name, name, {}};
    }
};

/// Errors reading external sources (VFS description, scripts, config)
struct LoadError {
    enum class Kind : std::uint8_t {
        Io,     // Source cannot be opened or read
        Parse,  // Source is malformed
    };

    Kind kind;
    std::string message;
    std::string source;

    [[nodiscard]] static LoadError io(const std::string& source, const std::string& reason) {
        return LoadError{Kind::Io, reason + ": " + source, source};
    }

    [[nodiscard]] static LoadError parse(const std::string& source, const std::string& reason) {
        return LoadError{Kind::Parse, "Failed to parse " + source + ": " + reason, source};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        VfsError,
        CommandError,
        LoadError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(VfsError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CommandError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LoadError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(VfsError::Kind kind) {
        switch (kind) {
            case VfsError::Kind::PathNotFound: return ErrorCode::PathNotFound;
            case VfsError::Kind::NotADirectory: return ErrorCode::NotADirectory;
            case VfsError::Kind::NameCollision: return ErrorCode::NameCollision;
            case VfsError::Kind::InvalidOperation: return ErrorCode::InvalidOperation;
            case VfsError::Kind::InvalidName: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(CommandError::Kind kind) {
        switch (kind) {
            case CommandError::Kind::UnknownCommand: return ErrorCode::UnknownCommand;
            case CommandError::Kind::UnknownFlag: return ErrorCode::UnknownFlag;
            case CommandError::Kind::MissingValue: return ErrorCode::MissingValue;
            case CommandError::Kind::InvalidArgument: return ErrorCode::InvalidArgument;
            case CommandError::Kind::DuplicateCommand: return ErrorCode::DuplicateCommand;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(LoadError::Kind kind) {
        switch (kind) {
            case LoadError::Kind::Io: return ErrorCode::IoError;
            case LoadError::Kind::Parse: return ErrorCode::ParseError;
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

/// Result type (similar to Rust's Result<T, E>)
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

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
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

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get error count for one code
std::uint64_t error_count(ErrorCode code);

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace vfsh_core
