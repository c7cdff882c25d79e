/// @file main.cpp
/// @brief vfsh entry point
///
/// Startup order:
/// - Command line and optional JSON config
/// - Logging
/// - Initial VFS (empty tree when none is given)
/// - Builtin registration and session
/// - Startup script, then the interactive loop unless the script exited

#include <vfsh/core/log.hpp>
#include <vfsh/shell/builtins.hpp>
#include <vfsh/shell/config.hpp>
#include <vfsh/shell/runner.hpp>
#include <vfsh/shell/session.hpp>
#include <vfsh/vfs/xml_loader.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kVersion = "0.1.0";

vfsh_core::LogConfig make_log_config(const vfsh_shell::ShellConfig& config) {
    vfsh_core::LogConfig log_config;
    log_config.level = vfsh_core::parse_log_level(config.log_level).value_or(spdlog::level::warn);
    if (!config.log_directory.empty()) {
        log_config.file_enabled = true;
        log_config.log_directory = config.log_directory;
    }
    return log_config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "vfsh";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto options = vfsh_shell::parse_command_line(args);
    if (!options) {
        std::cerr << "vfsh: " << options.error().message() << "\n";
        std::cerr << "Try '" << program << " --help' for more information.\n";
        return 1;
    }

    if (options->show_help) {
        std::cout << vfsh_shell::usage_text(program);
        return 0;
    }
    if (options->show_version) {
        std::cout << "vfsh " << kVersion << "\n";
        return 0;
    }

    const vfsh_shell::ShellConfig& config = options->config;
    vfsh_core::configure_logging(make_log_config(config));
    VFSH_LOG_INFO("vfsh {} starting", kVersion);

    std::unique_ptr<vfsh_vfs::FileSystemTree> tree;
    if (!config.vfs_path.empty()) {
        auto loaded = vfsh_vfs::XmlLoader::load_file(config.vfs_path);
        if (!loaded) {
            VFSH_LOG_ERROR("Failed to load {}: {}", config.vfs_path, loaded.error().message());
            std::cerr << "vfsh: " << loaded.error().message() << "\n";
            vfsh_core::shutdown_logging();
            return 1;
        }
        tree = std::move(*loaded);
    }

    vfsh_shell::CommandRegistry registry;
    if (auto registered = vfsh_shell::builtins::register_all(registry); !registered) {
        std::cerr << "vfsh: " << registered.error().message() << "\n";
        vfsh_core::shutdown_logging();
        return 1;
    }

    vfsh_shell::Session session(registry, config, std::move(tree));

    int exit_code = 0;
    if (!config.script_path.empty()) {
        vfsh_shell::ScriptRunner runner(session, std::cout, std::cerr);
        auto report = runner.run_file(config.script_path);
        if (!report) {
            VFSH_LOG_ERROR("Startup script failed: {}", report.error().message());
            exit_code = 1;
        } else if (report->lines_failed > 0) {
            VFSH_LOG_WARN("Startup script had {} failing lines", report->lines_failed);
        }
        std::cout.flush();
    }

    if (exit_code == 0 && session.is_running()) {
        vfsh_shell::InteractiveRunner interactive(session, std::cin, std::cout, std::cerr);
        exit_code = interactive.run();
    }

    VFSH_LOG_INFO("vfsh exiting with code {}", exit_code);
    vfsh_core::shutdown_logging();
    return exit_code;
}
