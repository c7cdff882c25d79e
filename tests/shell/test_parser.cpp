// vfsh_shell lexer and parser tests

#include <catch2/catch.hpp>
#include <vfsh/shell/command.hpp>
#include <vfsh/shell/parser.hpp>

using namespace vfsh_shell;
using vfsh_core::CommandError;
using vfsh_core::ErrorCode;

namespace {

CommandResult noop(const CommandArgs&, CommandContext&) {
    return CommandResult::success();
}

/// probe <first> [second] [-v] [-n N] [--name S]
void register_probe(CommandRegistry& registry) {
    auto r = CommandBuilder("probe")
        .arg("first", ArgType::String, "First argument")
        .arg("second", ArgType::String, "Second argument", false)
        .flag("verbose", 'v', "Verbose")
        .flag("all", 'a', "All")
        .flag_with_value("count", 'n', ArgType::Integer, "Count")
        .flag_with_value("name", '\0', ArgType::String, "Name")
        .function(noop)
        .register_to(registry);
    REQUIRE(r.is_ok());
}

} // anonymous namespace

// =============================================================================
// Lexer Tests
// =============================================================================

TEST_CASE("Lexer tokenization", "[shell][lexer]") {
    SECTION("whitespace separated words") {
        Lexer lexer("  ls   -l\t/home ");
        auto tokens = lexer.tokenize_all();
        REQUIRE(tokens.size() == 4);
        REQUIRE(tokens[0].value == "ls");
        REQUIRE(tokens[1].value == "-l");
        REQUIRE(tokens[1].is_flag());
        REQUIRE(tokens[2].value == "/home");
        REQUIRE(tokens[3].type == TokenType::Eof);
    }

    SECTION("quotes group one token") {
        Lexer lexer(R"(echo "a b" 'c d')");
        auto tokens = lexer.tokenize_all();
        REQUIRE(tokens.size() == 4);
        REQUIRE(tokens[1].value == "a b");
        REQUIRE(tokens[1].quoted());
        REQUIRE(tokens[2].value == "c d");
    }

    SECTION("adjacent parts join") {
        Lexer lexer(R"(a"b c"'d')");
        auto tokens = lexer.tokenize_all();
        REQUIRE(tokens.size() == 2);
        REQUIRE(tokens[0].value == "ab cd");
    }

    SECTION("escapes") {
        Lexer lexer(R"("say \"hi\"" a\ b 'no\escape')");
        auto tokens = lexer.tokenize_all();
        REQUIRE(tokens.size() == 4);
        REQUIRE(tokens[0].value == "say \"hi\"");
        REQUIRE(tokens[1].value == "a b");
        REQUIRE(tokens[2].value == "no\\escape");
    }

    SECTION("quoted dash is not a flag") {
        Lexer lexer(R"("-v" \-v - -v)");
        auto tokens = lexer.tokenize_all();
        REQUIRE_FALSE(tokens[0].is_flag());
        REQUIRE_FALSE(tokens[1].is_flag());
        REQUIRE_FALSE(tokens[2].is_flag());
        REQUIRE(tokens[3].is_flag());
    }

    SECTION("unterminated quotes") {
        auto dq = Lexer(R"(cat "oops)").tokenize_all();
        REQUIRE(dq.back().type == TokenType::Error);
        REQUIRE(dq.back().value == "Unterminated double quote");

        auto sq = Lexer("cat 'oops").tokenize_all();
        REQUIRE(sq.back().value == "Unterminated single quote");
    }

    SECTION("completeness") {
        REQUIRE(Parser::is_complete("ls \"a b\""));
        REQUIRE_FALSE(Parser::is_complete("ls \"a b"));
    }
}

// =============================================================================
// Parser Tests
// =============================================================================

TEST_CASE("Parser binds positionals", "[shell][parser]") {
    CommandRegistry registry;
    register_probe(registry);
    Parser parser(registry);

    SECTION("required only") {
        auto inv = parser.parse("probe a");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().name == "probe");
        REQUIRE(inv.value().args.get_string("first") == "a");
        REQUIRE_FALSE(inv.value().args.has("second"));
        REQUIRE(inv.value().args.positional_count() == 1);
        REQUIRE(inv.value().args.raw_input() == "probe a");
    }

    SECTION("quoted positionals") {
        auto inv = parser.parse(R"(probe "a b" 'c d')");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().args.get_string("first") == "a b");
        REQUIRE(inv.value().args.get_string("second") == "c d");
    }

    SECTION("too many arguments") {
        auto inv = parser.parse("probe a b c");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(inv.error().message() == "Too many arguments (expected at most 2)");
    }

    SECTION("missing required argument") {
        auto inv = parser.parse("probe -v");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(inv.error().message() == "Missing required argument: first");
    }

    SECTION("blank line") {
        auto inv = parser.parse("   ");
        REQUIRE(inv.is_ok());
        REQUIRE_FALSE(inv.value().is_valid());
    }

    SECTION("unknown command") {
        auto inv = parser.parse("nope a");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::UnknownCommand);
        REQUIRE(inv.error().message() == "Command not found: nope");
    }

    SECTION("unterminated quote") {
        auto inv = parser.parse("probe \"a");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(inv.error().as<CommandError>()->command == "probe");
    }
}

TEST_CASE("Parser binds flags", "[shell][parser]") {
    CommandRegistry registry;
    register_probe(registry);
    Parser parser(registry);

    SECTION("boolean short and long") {
        auto inv = parser.parse("probe -v a --all");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().args.get_bool("verbose"));
        REQUIRE(inv.value().args.get_bool("all"));
        REQUIRE(inv.value().args.get("verbose")->is_flag);
    }

    SECTION("combined short flags with an attached value") {
        auto inv = parser.parse("probe -van5 a");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().args.get_bool("verbose"));
        REQUIRE(inv.value().args.get_bool("all"));
        REQUIRE(inv.value().args.get_int("count") == 5);
    }

    SECTION("value in the next token") {
        auto inv = parser.parse("probe -n 3 a");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().args.get_int("count") == 3);
        REQUIRE(inv.value().args.get_string("first") == "a");
    }

    SECTION("negative value") {
        auto inv = parser.parse("probe -n -2 a");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().args.get_int("count") == -2);
    }

    SECTION("long forms") {
        auto eq = parser.parse("probe --count=7 --name=x a");
        REQUIRE(eq.is_ok());
        REQUIRE(eq.value().args.get_int("count") == 7);
        REQUIRE(eq.value().args.get_string("name") == "x");

        auto spaced = parser.parse("probe --count 8 a");
        REQUIRE(spaced.is_ok());
        REQUIRE(spaced.value().args.get_int("count") == 8);
    }

    SECTION("double dash ends flags") {
        auto inv = parser.parse("probe -- -v");
        REQUIRE(inv.is_ok());
        REQUIRE(inv.value().args.get_string("first") == "-v");
        REQUIRE_FALSE(inv.value().args.has("verbose"));
    }

    SECTION("unknown flags") {
        auto shorty = parser.parse("probe -x a");
        REQUIRE(shorty.is_err());
        REQUIRE(shorty.error().code() == ErrorCode::UnknownFlag);
        REQUIRE(shorty.error().as<CommandError>()->flag == "-x");

        auto longy = parser.parse("probe --bogus a");
        REQUIRE(longy.is_err());
        REQUIRE(longy.error().message() == "Unknown option: --bogus");
    }

    SECTION("missing value") {
        auto inv = parser.parse("probe a -n");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::MissingValue);

        auto longy = parser.parse("probe a --name");
        REQUIRE(longy.is_err());
        REQUIRE(longy.error().code() == ErrorCode::MissingValue);
    }

    SECTION("value that does not convert") {
        auto inv = parser.parse("probe -n abc a");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(inv.error().message() == "Invalid integer value for -n: 'abc'");
    }

    SECTION("boolean flag given a value") {
        auto inv = parser.parse("probe --verbose=yes a");
        REQUIRE(inv.is_err());
        REQUIRE(inv.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Argument value conversion", "[shell][parser]") {
    REQUIRE(std::get<std::int64_t>(parse_arg_value("42", ArgType::Integer)) == 42);
    REQUIRE(std::holds_alternative<std::monostate>(parse_arg_value("4x", ArgType::Integer)));
    REQUIRE(std::holds_alternative<std::monostate>(parse_arg_value("", ArgType::Integer)));
    REQUIRE(std::get<bool>(parse_arg_value("Yes", ArgType::Boolean)));
    REQUIRE(std::get<std::string>(parse_arg_value("/a b", ArgType::Path)) == "/a b");
    REQUIRE(arg_value_to_string(ArgValue{std::int64_t(5)}) == "5");
}

TEST_CASE("Parser recognises help requests", "[shell][parser]") {
    CommandRegistry registry;
    register_probe(registry);
    REQUIRE(CommandBuilder("hflag")
        .flag("human", 'h', "Human readable sizes")
        .function(noop)
        .register_to(registry).is_ok());
    Parser parser(registry);

    SECTION("long and short forms skip argument checks") {
        for (const char* line : {"probe --help", "probe -h", "probe a b c --help", "probe --bogus -h"}) {
            auto inv = parser.parse(line);
            REQUIRE(inv.is_ok());
            REQUIRE(inv.value().help_requested);
            REQUIRE(inv.value().name == "probe");
        }
    }

    SECTION("after -- or quoted it is an argument") {
        auto inv = parser.parse("probe -- --help");
        REQUIRE(inv.is_ok());
        REQUIRE_FALSE(inv.value().help_requested);
        REQUIRE(inv.value().args.get_string("first") == "--help");

        REQUIRE_FALSE(parser.parse("probe '-h'").value().help_requested);
    }

    SECTION("a declared -h keeps its meaning") {
        auto inv = parser.parse("hflag -h");
        REQUIRE(inv.is_ok());
        REQUIRE_FALSE(inv.value().help_requested);
        REQUIRE(inv.value().args.get_bool("human"));

        REQUIRE(parser.parse("hflag --help").value().help_requested);
    }
}
