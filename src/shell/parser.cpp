/// @file parser.cpp
/// @brief Shell parser implementation for vfsh_shell

#include <vfsh/shell/parser.hpp>
#include <vfsh/shell/command.hpp>

#include <optional>

namespace vfsh_shell {

using vfsh_core::CommandError;
using vfsh_core::Err;
using vfsh_core::Ok;
using vfsh_core::Result;

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Characters a backslash escapes inside double quotes
bool is_dquote_escapable(char c) {
    return c == '"' || c == '\\' || c == '$' || c == '`';
}

} // anonymous namespace

// =============================================================================
// Lexer Implementation
// =============================================================================

Lexer::Lexer(std::string_view input) : input_(input) {}

Token Lexer::next() {
    skip_whitespace();

    if (at_end()) {
        return make_token(TokenType::Eof, "", pos_ + 1);
    }

    return scan_word();
}

bool Lexer::at_end() const {
    return pos_ >= input_.size();
}

std::vector<Token> Lexer::tokenize_all() {
    std::vector<Token> tokens;
    while (true) {
        Token token = next();
        const TokenType type = token.type;
        tokens.push_back(std::move(token));
        if (type == TokenType::Eof || type == TokenType::Error) {
            break;
        }
    }
    return tokens;
}

char Lexer::current() const {
    return at_end() ? '\0' : input_[pos_];
}

void Lexer::advance() {
    if (!at_end()) {
        ++pos_;
    }
}

void Lexer::skip_whitespace() {
    while (!at_end() && is_space(current())) {
        advance();
    }
}

Token Lexer::make_token(TokenType type, std::string value, std::size_t column) const {
    Token token;
    token.type = type;
    token.value = std::move(value);
    token.column = column;
    return token;
}

Token Lexer::scan_word() {
    const std::size_t column = pos_ + 1;
    std::string value;
    bool quoted = false;

    while (!at_end() && !is_space(current())) {
        char c = current();

        if (c == '\'') {
            quoted = true;
            advance();
            while (!at_end() && current() != '\'') {
                value += current();
                advance();
            }
            if (at_end()) {
                return make_token(TokenType::Error, "Unterminated single quote", column);
            }
            advance();
        } else if (c == '"') {
            quoted = true;
            advance();
            while (!at_end() && current() != '"') {
                if (current() == '\\' && pos_ + 1 < input_.size() &&
                    is_dquote_escapable(input_[pos_ + 1])) {
                    advance();
                }
                value += current();
                advance();
            }
            if (at_end()) {
                return make_token(TokenType::Error, "Unterminated double quote", column);
            }
            advance();
        } else if (c == '\\') {
            advance();
            if (at_end()) {
                value += '\\';
            } else {
                // An escaped character is literal, so "\-x" is not a flag
                quoted = true;
                value += current();
                advance();
            }
        } else {
            value += c;
            advance();
        }
    }

    return make_token(quoted ? TokenType::String : TokenType::Word, std::move(value), column);
}

// =============================================================================
// Parser Implementation
// =============================================================================

Parser::Parser(const CommandRegistry& registry) : registry_(registry) {}

Result<Invocation> Parser::parse(std::string_view input) const {
    Lexer lexer(input);
    std::vector<Token> tokens = lexer.tokenize_all();

    if (tokens.back().type == TokenType::Error) {
        const std::string name = tokens.size() > 1 ? tokens.front().value : std::string();
        return Err<Invocation>(CommandError::invalid_argument(name, tokens.back().value));
    }
    tokens.pop_back();  // Eof

    if (tokens.empty()) {
        return Invocation{};
    }

    Invocation invocation;
    invocation.name = tokens.front().value;

    const CommandInfo* info = registry_.get_info(invocation.name);
    if (!info) {
        return Err<Invocation>(CommandError::unknown_command(invocation.name));
    }

    std::vector<Token> arguments(tokens.begin() + 1, tokens.end());
    if (wants_help(*info, arguments)) {
        invocation.help_requested = true;
        return invocation;
    }

    auto bound = bind(*info, arguments);
    if (!bound) {
        return bound.error();
    }

    invocation.args = std::move(bound.value());
    invocation.args.set_raw_input(std::string(input));
    return invocation;
}

bool Parser::wants_help(const CommandInfo& info, const std::vector<Token>& tokens) {
    const bool own_long = info.find_flag("help") != nullptr;
    const bool own_short = info.find_short_flag('h') != nullptr;

    for (const Token& token : tokens) {
        if (!token.is_flag()) {
            continue;
        }
        if (token.value == "--") {
            break;
        }
        if ((token.value == "--help" && !own_long) || (token.value == "-h" && !own_short)) {
            return true;
        }
    }
    return false;
}

Result<CommandArgs> Parser::bind(const CommandInfo& info, const std::vector<Token>& tokens) {
    CommandArgs args;
    std::vector<const Token*> positionals;
    bool flags_done = false;

    auto store_value = [&](const FlagSpec& spec, const std::string& shown,
                           const std::string& raw) -> Result<void> {
        ArgValue value = parse_arg_value(raw, spec.value_type);
        if (std::holds_alternative<std::monostate>(value)) {
            return Err(CommandError::invalid_argument(info.name,
                "Invalid " + std::string(arg_type_name(spec.value_type)) +
                " value for " + shown + ": '" + raw + "'"));
        }
        args.add(spec.name, std::move(value), true);
        return Ok();
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];

        if (flags_done || !token.is_flag()) {
            positionals.push_back(&token);
            continue;
        }

        const std::string& text = token.value;
        if (text == "--") {
            flags_done = true;
            continue;
        }

        // Long form: --name, --name=value, --name value
        if (text.rfind("--", 0) == 0) {
            std::string body = text.substr(2);
            std::optional<std::string> inline_value;
            auto eq = body.find('=');
            if (eq != std::string::npos) {
                inline_value = body.substr(eq + 1);
                body.erase(eq);
            }

            const std::string shown = "--" + body;
            const FlagSpec* spec = info.find_flag(body);
            if (!spec) {
                return Err<CommandArgs>(CommandError::unknown_flag(info.name, shown));
            }

            if (!spec->takes_value) {
                if (inline_value) {
                    return Err<CommandArgs>(CommandError::invalid_argument(info.name,
                        "Option " + shown + " does not take a value"));
                }
                args.add(spec->name, true, true);
                continue;
            }

            std::string raw;
            if (inline_value) {
                raw = *inline_value;
            } else if (i + 1 < tokens.size()) {
                raw = tokens[++i].value;
            } else {
                return Err<CommandArgs>(CommandError::missing_value(info.name, shown));
            }

            auto stored = store_value(*spec, shown, raw);
            if (!stored) {
                return stored.error();
            }
            continue;
        }

        // Short form: -x, -abc, -n5, -n 5
        for (std::size_t j = 1; j < text.size(); ++j) {
            const std::string shown = std::string("-") + text[j];
            const FlagSpec* spec = info.find_short_flag(text[j]);
            if (!spec) {
                return Err<CommandArgs>(CommandError::unknown_flag(info.name, shown));
            }

            if (!spec->takes_value) {
                args.add(spec->name, true, true);
                continue;
            }

            std::string raw = text.substr(j + 1);
            if (raw.empty()) {
                if (i + 1 >= tokens.size()) {
                    return Err<CommandArgs>(CommandError::missing_value(info.name, shown));
                }
                raw = tokens[++i].value;
            }

            auto stored = store_value(*spec, shown, raw);
            if (!stored) {
                return stored.error();
            }
            break;
        }
    }

    if (positionals.size() > info.args.size()) {
        return Err<CommandArgs>(CommandError::invalid_argument(info.name,
            "Too many arguments (expected at most " + std::to_string(info.args.size()) + ")"));
    }

    for (std::size_t k = 0; k < info.args.size(); ++k) {
        const ArgSpec& spec = info.args[k];

        if (k >= positionals.size()) {
            if (spec.required) {
                return Err<CommandArgs>(CommandError::invalid_argument(info.name,
                    "Missing required argument: " + spec.name));
            }
            if (!std::holds_alternative<std::monostate>(spec.default_value)) {
                args.add(spec.name, spec.default_value);
            }
            continue;
        }

        const std::string& raw = positionals[k]->value;
        ArgValue value = parse_arg_value(raw, spec.type);
        if (std::holds_alternative<std::monostate>(value)) {
            return Err<CommandArgs>(CommandError::invalid_argument(info.name,
                "Invalid " + std::string(arg_type_name(spec.type)) +
                " value for " + spec.name + ": '" + raw + "'"));
        }

        args.add(spec.name, value);
        args.add_positional(std::move(value));
    }

    return args;
}

bool Parser::is_complete(std::string_view input) {
    Lexer lexer(input);
    std::vector<Token> tokens = lexer.tokenize_all();
    return tokens.back().type != TokenType::Error;
}

} // namespace vfsh_shell
