#pragma once

/// @file parser.hpp
/// @brief Shell input lexer and argument binder

#include "types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vfsh_shell {

// =============================================================================
// Lexer
// =============================================================================

/// @brief Tokenizer for one shell input line
///
/// Whitespace separates tokens. Single quotes keep their content literally,
/// double quotes allow backslash escapes, and a backslash outside quotes
/// escapes the next character. Adjacent quoted and unquoted parts join into
/// one token ("ab"'cd' is abcd). An unterminated quote yields an Error token.
class Lexer {
public:
    explicit Lexer(std::string_view input);

    /// @brief Get next token
    Token next();

    /// @brief Check if at end of input
    bool at_end() const;

    /// @brief Tokenize the rest of the input, stopping after Eof or Error
    std::vector<Token> tokenize_all();

private:
    std::string_view input_;
    std::size_t pos_ = 0;

    char current() const;
    void advance();
    void skip_whitespace();

    Token make_token(TokenType type, std::string value, std::size_t column) const;
    Token scan_word();
};

// =============================================================================
// Parser
// =============================================================================

/// @brief Turns a command line into an Invocation using registry metadata
///
/// Flags are recognised only in unquoted tokens and only before "--":
/// `--name`, `--name=value`, `--name value`, `-x`, `-abc` (boolean cluster)
/// and `-n5` / `-n 5` for a short flag taking a value. A bare "-" is a
/// positional argument. Every command also answers `--help` and `-h` unless
/// it declares those flags itself.
class Parser {
public:
    explicit Parser(const CommandRegistry& registry);

    /// @brief Parse a command line
    /// @return Invocation with an empty name for a blank line; UnknownCommand,
    ///         UnknownFlag, MissingValue or InvalidArgument on failure
    [[nodiscard]] vfsh_core::Result<Invocation> parse(std::string_view input) const;

    /// @brief Bind already lexed argument tokens against @p info
    [[nodiscard]] static vfsh_core::Result<CommandArgs> bind(const CommandInfo& info,
                                                             const std::vector<Token>& tokens);

    /// @brief True when @p tokens ask for the command's help page
    [[nodiscard]] static bool wants_help(const CommandInfo& info, const std::vector<Token>& tokens);

    /// @brief Check if input is complete (no unclosed quotes)
    [[nodiscard]] static bool is_complete(std::string_view input);

private:
    const CommandRegistry& registry_;
};

} // namespace vfsh_shell
