#pragma once

/// @file types.hpp
/// @brief Core types for vfsh_shell

#include "fwd.hpp"

#include <any>
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace vfsh_shell {

// =============================================================================
// Token Types
// =============================================================================

/// @brief Token type enumeration
enum class TokenType {
    Word,     // Bare word, may start with '-'
    String,   // Quoted segment (never a flag)
    Eof,
    Error     // Lexing failed, value holds the reason
};

/// @brief Token structure
struct Token {
    TokenType type = TokenType::Error;
    std::string value;
    std::size_t column = 0;

    /// True when any part of the token was quoted
    bool quoted() const { return type == TokenType::String; }

    /// True for an unquoted token that looks like an option
    bool is_flag() const {
        return type == TokenType::Word && value.size() > 1 && value[0] == '-';
    }
};

// =============================================================================
// Argument Types
// =============================================================================

/// @brief Argument type enumeration
enum class ArgType {
    String,
    Integer,
    Boolean,
    Path
};

/// @brief Argument value variant
using ArgValue = std::variant<
    std::monostate,
    std::string,
    std::int64_t,
    bool
>;

/// @brief Positional argument specification
struct ArgSpec {
    std::string name;
    std::string description;
    ArgType type = ArgType::String;
    bool required = true;
    ArgValue default_value;
};

/// @brief Parsed command argument
struct CommandArg {
    std::string name;
    ArgValue value;
    bool is_flag = false;

    std::string as_string() const;
    std::int64_t as_int() const;
    bool as_bool() const;

    bool has_value() const {
        return !std::holds_alternative<std::monostate>(value);
    }
};

/// @brief Parsed command arguments container
///
/// Flags are stored under their long name; positional arguments are stored
/// both in order and under the name of the slot they were bound to.
class CommandArgs {
public:
    CommandArgs() = default;

    void add(const std::string& name, ArgValue value, bool is_flag = false);
    void add_positional(ArgValue value);

    bool has(const std::string& name) const;
    const CommandArg* get(const std::string& name) const;

    std::string get_string(const std::string& name, const std::string& default_val = "") const;
    std::int64_t get_int(const std::string& name, std::int64_t default_val = 0) const;
    bool get_bool(const std::string& name, bool default_val = false) const;

    const std::vector<CommandArg>& positional() const { return positional_args_; }
    std::size_t positional_count() const { return positional_args_.size(); }

    const std::string& raw_input() const { return raw_input_; }
    void set_raw_input(const std::string& input) { raw_input_ = input; }

private:
    std::unordered_map<std::string, CommandArg> named_args_;
    std::vector<CommandArg> positional_args_;
    std::string raw_input_;
};

// =============================================================================
// Command Result
// =============================================================================

/// @brief Command execution status
enum class CommandStatus {
    Success,
    Error,
    Exit      // Session-ending command completed
};

/// @brief Command execution result
///
/// Output never carries a trailing newline; drivers add one when rendering.
struct CommandResult {
    CommandStatus status = CommandStatus::Success;
    vfsh_core::ErrorCode error_code = vfsh_core::ErrorCode::Unknown;
    std::string command;
    std::string output;
    std::string error_message;
    std::any data;  // Optional typed return data
    std::chrono::microseconds execution_time{0};

    static CommandResult success(const std::string& output = "") {
        CommandResult r;
        r.status = CommandStatus::Success;
        r.output = output;
        return r;
    }

    static CommandResult error(vfsh_core::ErrorCode code, const std::string& message) {
        CommandResult r;
        r.status = CommandStatus::Error;
        r.error_code = code;
        r.error_message = message;
        return r;
    }

    static CommandResult error(const vfsh_core::Error& err) {
        return error(err.code(), err.message());
    }

    static CommandResult exit() {
        CommandResult r;
        r.status = CommandStatus::Exit;
        return r;
    }

    bool ok() const { return status != CommandStatus::Error; }
    operator bool() const { return ok(); }
};

/// @brief Structured result of wc, attached to CommandResult::data
struct WcCounts {
    std::size_t lines = 0;
    std::size_t words = 0;
    std::size_t chars = 0;
    std::size_t max_line_length = 0;
};

// =============================================================================
// Invocation
// =============================================================================

/// @brief A command line bound against its CommandInfo
struct Invocation {
    std::string name;
    CommandArgs args;
    bool help_requested = false;  // "--help" or "-h" the command does not declare itself

    bool is_valid() const { return !name.empty(); }
};

// =============================================================================
// Command Metadata
// =============================================================================

/// @brief Command category
enum class CommandCategory {
    General,
    Navigation,
    FileSystem,
    Scripting,
    Help
};

/// @brief Flag specification
struct FlagSpec {
    std::string name;
    char short_name = '\0';
    std::string description;
    bool takes_value = false;
    ArgType value_type = ArgType::String;
};

/// @brief Command metadata
struct CommandInfo {
    std::string name;
    std::string description;
    std::string usage;
    std::vector<std::string> examples;
    CommandCategory category = CommandCategory::General;
    std::vector<ArgSpec> args;
    std::vector<FlagSpec> flags;
    bool hidden = false;

    std::string category_name() const;

    /// @brief Full help page: usage, category, arguments, flags and examples
    std::string help_text() const;

    /// @brief Lookup a flag by long name
    const FlagSpec* find_flag(const std::string& long_name) const;

    /// @brief Lookup a flag by single-letter name
    const FlagSpec* find_short_flag(char short_name) const;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Get string name for argument type
const char* arg_type_name(ArgType type);

/// @brief Get string name for command category
const char* category_name(CommandCategory cat);

/// @brief Parse a string to ArgValue based on type, monostate on failure
ArgValue parse_arg_value(const std::string& str, ArgType type);

/// @brief Convert ArgValue to string
std::string arg_value_to_string(const ArgValue& value);

} // namespace vfsh_shell
