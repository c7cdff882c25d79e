/// @file dispatcher.cpp
/// @brief Dispatcher implementation for vfsh_shell

#include <vfsh/shell/dispatcher.hpp>
#include <vfsh/core/log.hpp>

#include <chrono>
#include <exception>

namespace vfsh_shell {

using vfsh_core::CommandError;
using vfsh_core::Error;
using vfsh_core::ErrorCode;
using vfsh_core::Result;

namespace {

CommandResult failure(const Error& err, const std::string& command) {
    CommandResult result = CommandResult::error(err);
    result.command = command;
    vfsh_core::debug::record_error(err);
    return result;
}

} // anonymous namespace

Dispatcher::Dispatcher(CommandRegistry& registry)
    : registry_(registry), parser_(registry) {}

Result<Invocation> Dispatcher::parse(std::string_view line) const {
    return parser_.parse(line);
}

CommandResult Dispatcher::dispatch(const Invocation& invocation, CommandContext& ctx) const {
    if (!invocation.is_valid()) {
        return CommandResult::success();
    }

    ICommand* cmd = registry_.find(invocation.name);
    if (!cmd) {
        return failure(CommandError::unknown_command(invocation.name), invocation.name);
    }

    if (invocation.help_requested) {
        CommandResult result = CommandResult::success(cmd->info().help_text());
        result.command = invocation.name;
        return result;
    }

    std::string reason;
    if (!cmd->validate(invocation.args, reason)) {
        return failure(CommandError::invalid_argument(invocation.name, reason), invocation.name);
    }

    const auto start = std::chrono::steady_clock::now();

    CommandResult result;
    try {
        result = cmd->execute(invocation.args, ctx);
    } catch (const std::exception& e) {
        vfsh_core::shell_logger()->error("Command '{}' threw: {}", invocation.name, e.what());
        result = CommandResult::error(ErrorCode::Internal, std::string("Internal error: ") + e.what());
    }

    result.command = invocation.name;
    result.execution_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.status == CommandStatus::Error) {
        vfsh_core::debug::record_error(Error(result.error_code, result.error_message));
        vfsh_core::shell_logger()->debug("{} failed [{}]: {}", invocation.name,
            vfsh_core::error_code_name(result.error_code), result.error_message);
    } else {
        vfsh_core::shell_logger()->trace("{} finished in {}us", invocation.name,
            result.execution_time.count());
    }

    return result;
}

CommandResult Dispatcher::execute(std::string_view line, CommandContext& ctx) const {
    auto parsed = parse(line);
    if (!parsed) {
        std::string command;
        if (const auto* err = parsed.error().as<CommandError>()) {
            command = err->command;
        }
        return failure(parsed.error(), command);
    }
    return dispatch(parsed.value(), ctx);
}

} // namespace vfsh_shell
