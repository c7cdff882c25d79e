// vfsh_shell session, environment and user tests

#include "shell_fixture.hpp"

#include <vfsh/shell/runner.hpp>

using namespace vfsh_shell;
using vfsh_core::ErrorCode;
using vfsh_test::ShellFixture;

TEST_CASE("Environment variables", "[shell][session]") {
    Environment env;

    SECTION("set, get and unset") {
        env.set("A", "1");
        REQUIRE(env.has("A"));
        REQUIRE(env.get("A") == std::string("1"));
        REQUIRE(env.unset("A"));
        REQUIRE_FALSE(env.unset("A"));
        REQUIRE_FALSE(env.get("A").has_value());
    }

    SECTION("keys are sorted") {
        env.set("B", "2");
        env.set("A", "1");
        REQUIRE((env.keys() == std::vector<std::string>{"A", "B"}));
        env.clear();
        REQUIRE(env.keys().empty());
    }

    SECTION("user falls back through USER") {
        env.set("USER", "bob");
        REQUIRE(env.user() == "bob");
    }
}

TEST_CASE("User and prompt", "[shell][session]") {
    SECTION("prompt format") {
        User user("alice", "sandbox");
        REQUIRE(user.prompt("/") == "alice@sandbox:~/$ ");
        REQUIRE(user.prompt("/home") == "alice@sandbox:~/home$ ");
    }

    SECTION("config wins over the environment") {
        Environment env;
        env.set("USER", "bob");
        User user = User::from_config(vfsh_test::sample_config(), env);
        REQUIRE(user.name() == "alice");
        REQUIRE(user.host() == "sandbox");
    }

    SECTION("environment fills a blank config") {
        Environment env;
        env.set("USER", "bob");
        User user = User::from_config(ShellConfig{}, env);
        REQUIRE(user.name() == "bob");
        REQUIRE_FALSE(user.host().empty());
    }
}

TEST_CASE("Session submit", "[shell][session]") {
    ShellFixture f;

    SECTION("prompt follows the working directory") {
        REQUIRE(f.session->prompt() == "alice@sandbox:~/$ ");
        REQUIRE(f.run("cd home").ok());
        REQUIRE(f.session->prompt() == "alice@sandbox:~/home$ ");
        REQUIRE(f.session->env().get("PWD") == std::string("/home"));
    }

    SECTION("blank lines succeed quietly") {
        auto result = f.run("   ");
        REQUIRE(result.ok());
        REQUIRE(result.output.empty());
        REQUIRE(f.session->stats().commands_executed == 0);
    }

    SECTION("variable as the first token") {
        f.session->env().set("GREETING", "hello there");
        auto result = f.run("$GREETING");
        REQUIRE(result.ok());
        REQUIRE(result.output == "hello there");
    }

    SECTION("missing variable") {
        auto result = f.run("$NOT_SET_ANYWHERE_42");
        REQUIRE(result.error_code == ErrorCode::InvalidArgument);
        REQUIRE(result.error_message == "Environment variable not found: NOT_SET_ANYWHERE_42");
    }

    SECTION("shell variables are set at startup") {
        REQUIRE(f.run("$SHELL").output == "vfsh");
        REQUIRE(f.run("$PWD").output == "/");
    }

    SECTION("statistics") {
        REQUIRE(f.run("pwd").ok());
        REQUIRE_FALSE(f.run("nope").ok());
        auto stats = f.session->stats();
        REQUIRE(stats.commands_executed == 2);
        REQUIRE(stats.commands_succeeded == 1);
        REQUIRE(stats.commands_failed == 1);
        REQUIRE(f.session->last_result().error_code == ErrorCode::UnknownCommand);
    }

    SECTION("exit stops the session") {
        REQUIRE(f.session->is_running());
        REQUIRE(f.run("exit").status == CommandStatus::Exit);
        REQUIRE_FALSE(f.session->is_running());
    }
}

TEST_CASE("Running scripts", "[shell][session]") {
    ShellFixture f;
    Session& session = *f.session;

    SECTION("the same file cannot run twice at once") {
        REQUIRE(session.enter_script("/scripts/setup.txt").is_ok());
        auto again = session.check_script("/scripts/../scripts/setup.txt");
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::InvalidOperation);

        session.leave_script();
        REQUIRE(session.check_script("/scripts/setup.txt").is_ok());
    }

    SECTION("nesting depth is bounded") {
        for (std::size_t i = 0; i < Session::k_max_script_depth; ++i) {
            REQUIRE(session.enter_script("/scripts/s" + std::to_string(i)).is_ok());
        }
        REQUIRE(session.script_depth() == Session::k_max_script_depth);

        auto deeper = session.enter_script("/scripts/one_more");
        REQUIRE(deeper.is_err());
        REQUIRE(deeper.error().message() == "Script recursion too deep: /scripts/one_more");
        REQUIRE(session.script_depth() == Session::k_max_script_depth);
    }
}

TEST_CASE("Session tree replacement", "[shell][session]") {
    ShellFixture f;
    REQUIRE(f.run("cd home").ok());

    auto fresh = std::make_unique<vfsh_vfs::FileSystemTree>();
    REQUIRE(fresh->make_directory("/srv", fresh->root()).is_ok());
    f.session->replace_tree(std::move(fresh));

    REQUIRE(f.run("pwd").output == "/");
    REQUIRE(f.run("ls").output == "srv");
    REQUIRE(f.session->prompt() == "alice@sandbox:~/$ ");

    f.session->replace_tree(nullptr);
    REQUIRE(f.session->tree().root().empty());
}
