// vfsh_shell registry and dispatcher tests

#include <catch2/catch.hpp>
#include <vfsh/shell/command.hpp>
#include <vfsh/shell/dispatcher.hpp>
#include <vfsh/shell/runner.hpp>

#include <stdexcept>

using namespace vfsh_shell;
using vfsh_core::ErrorCode;

namespace {

CommandResult say_hi(const CommandArgs&, CommandContext&) {
    return CommandResult::success("hi");
}

} // anonymous namespace

TEST_CASE("Command registration", "[shell][registry]") {
    CommandRegistry registry;

    SECTION("register and find") {
        REQUIRE(registry.register_command("hi", "Say hi", say_hi).is_ok());
        REQUIRE(registry.exists("hi"));
        REQUIRE(registry.find("hi") != nullptr);
        REQUIRE(registry.get_info("hi")->description == "Say hi");
        REQUIRE(registry.count() == 1);
    }

    SECTION("duplicate names are rejected") {
        REQUIRE(registry.register_command("hi", "Say hi", say_hi).is_ok());
        auto again = registry.register_command("hi", "Again", say_hi);
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::DuplicateCommand);
        REQUIRE(registry.get_info("hi")->description == "Say hi");
    }

    SECTION("null and nameless commands are rejected") {
        REQUIRE(registry.register_command(nullptr).is_err());
        REQUIRE(registry.register_command("", "Nameless", say_hi).is_err());
        REQUIRE(registry.count() == 0);
    }

    SECTION("unregister") {
        REQUIRE(registry.register_command("hi", "Say hi", say_hi).is_ok());
        REQUIRE(registry.unregister_command("hi"));
        REQUIRE_FALSE(registry.unregister_command("hi"));
        REQUIRE(registry.find("hi") == nullptr);
    }

    SECTION("listing is sorted and skips hidden commands") {
        REQUIRE(CommandBuilder("zz").function(say_hi).register_to(registry).is_ok());
        REQUIRE(CommandBuilder("aa").category(CommandCategory::Help).function(say_hi)
            .register_to(registry).is_ok());
        REQUIRE(CommandBuilder("secret").hidden().function(say_hi).register_to(registry).is_ok());

        auto names = registry.command_names();
        REQUIRE((names == std::vector<std::string>{"aa", "zz"}));
        REQUIRE(registry.count() == 3);
        REQUIRE(registry.commands_in_category(CommandCategory::Help).size() == 1);
        REQUIRE(registry.search("z").size() == 1);
    }
}

TEST_CASE("Command builder metadata", "[shell][registry]") {
    CommandBuilder builder("head");
    builder.description("Print the first lines")
        .arg("path", ArgType::Path, "File")
        .flag_with_value("lines", 'n', ArgType::Integer, "Count")
        .flag("quiet", 'q', "Quiet");

    const CommandInfo& info = builder.get_info();
    REQUIRE(info.usage == "head");
    REQUIRE(info.args.size() == 1);
    REQUIRE(info.find_flag("lines")->takes_value);
    REQUIRE(info.find_short_flag('n')->name == "lines");
    REQUIRE_FALSE(info.find_short_flag('q')->takes_value);
    REQUIRE(info.find_flag("missing") == nullptr);
}

TEST_CASE("Dispatcher outcomes", "[shell][dispatcher]") {
    CommandRegistry registry;
    REQUIRE(registry.register_command("hi", "Say hi", say_hi).is_ok());
    REQUIRE(registry.register_command("boom", "Throws", [](const CommandArgs&, CommandContext&) -> CommandResult {
        throw std::runtime_error("kaboom");
    }).is_ok());
    REQUIRE(CommandBuilder("picky")
        .flag("yes", 'y', "Confirm")
        .validator([](const CommandArgs& args, std::string& error) {
            if (!args.has("yes")) {
                error = "Refusing without -y";
                return false;
            }
            return true;
        })
        .function(say_hi)
        .register_to(registry).is_ok());

    Dispatcher dispatcher(registry);
    CommandContext ctx;

    SECTION("success") {
        auto result = dispatcher.execute("hi", ctx);
        REQUIRE(result.ok());
        REQUIRE(result.output == "hi");
        REQUIRE(result.command == "hi");
    }

    SECTION("blank line succeeds with no output") {
        auto result = dispatcher.execute("", ctx);
        REQUIRE(result.ok());
        REQUIRE(result.output.empty());
    }

    SECTION("unknown command") {
        auto result = dispatcher.execute("nope", ctx);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error_code == ErrorCode::UnknownCommand);
        REQUIRE(format_failure(result) == "Command not found: nope");
    }

    SECTION("exceptions become internal errors") {
        auto result = dispatcher.execute("boom", ctx);
        REQUIRE(result.status == CommandStatus::Error);
        REQUIRE(result.error_code == ErrorCode::Internal);
        REQUIRE(result.error_message == "Internal error: kaboom");
        REQUIRE(format_failure(result) == "boom: Internal error: kaboom");
    }

    SECTION("validator") {
        auto refused = dispatcher.execute("picky", ctx);
        REQUIRE(refused.error_code == ErrorCode::InvalidArgument);
        REQUIRE(refused.error_message == "Refusing without -y");
        REQUIRE(dispatcher.execute("picky -y", ctx).ok());
    }

    SECTION("parse failures keep the command name") {
        auto result = dispatcher.execute("hi extra", ctx);
        REQUIRE(result.error_code == ErrorCode::InvalidArgument);
        REQUIRE(result.command == "hi");
        REQUIRE(format_failure(result) == "hi: Too many arguments (expected at most 0)");
    }
}
