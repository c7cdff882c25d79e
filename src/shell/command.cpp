/// @file command.cpp
/// @brief Command system implementation for vfsh_shell

#include <vfsh/shell/command.hpp>
#include <vfsh/core/log.hpp>

#include <algorithm>

namespace vfsh_shell {

using vfsh_core::CommandError;
using vfsh_core::Err;
using vfsh_core::ErrorCode;
using vfsh_core::Ok;
using vfsh_core::Result;

// =============================================================================
// FunctionCommand Implementation
// =============================================================================

FunctionCommand::FunctionCommand(CommandInfo info, CommandFunction func)
    : info_(std::move(info)), function_(std::move(func)) {}

CommandResult FunctionCommand::execute(const CommandArgs& args, CommandContext& ctx) {
    if (function_) {
        return function_(args, ctx);
    }
    return CommandResult::error(ErrorCode::Internal, "Command has no function bound");
}

bool FunctionCommand::validate(const CommandArgs& args, std::string& error) const {
    // Arity is enforced by the parser; only command-specific rules remain
    if (validator_) {
        return validator_(args, error);
    }
    return true;
}

// =============================================================================
// CommandBuilder Implementation
// =============================================================================

CommandBuilder::CommandBuilder(const std::string& name) {
    info_.name = name;
    info_.usage = name;
    info_.category = CommandCategory::General;
}

CommandBuilder& CommandBuilder::description(const std::string& desc) {
    info_.description = desc;
    return *this;
}

CommandBuilder& CommandBuilder::usage(const std::string& usage) {
    info_.usage = usage;
    return *this;
}

CommandBuilder& CommandBuilder::example(const std::string& example) {
    info_.examples.push_back(example);
    return *this;
}

CommandBuilder& CommandBuilder::category(CommandCategory cat) {
    info_.category = cat;
    return *this;
}

CommandBuilder& CommandBuilder::hidden(bool h) {
    info_.hidden = h;
    return *this;
}

CommandBuilder& CommandBuilder::arg(const std::string& name, ArgType type,
                                    const std::string& desc, bool required) {
    ArgSpec spec;
    spec.name = name;
    spec.type = type;
    spec.description = desc;
    spec.required = required;
    info_.args.push_back(std::move(spec));
    return *this;
}

CommandBuilder& CommandBuilder::arg_with_default(const std::string& name, ArgType type,
                                                 const std::string& desc,
                                                 const ArgValue& default_val) {
    ArgSpec spec;
    spec.name = name;
    spec.type = type;
    spec.description = desc;
    spec.required = false;
    spec.default_value = default_val;
    info_.args.push_back(std::move(spec));
    return *this;
}

CommandBuilder& CommandBuilder::flag(const std::string& name, char short_name,
                                     const std::string& desc) {
    FlagSpec spec;
    spec.name = name;
    spec.short_name = short_name;
    spec.description = desc;
    spec.takes_value = false;
    spec.value_type = ArgType::Boolean;
    info_.flags.push_back(std::move(spec));
    return *this;
}

CommandBuilder& CommandBuilder::flag_with_value(const std::string& name, char short_name,
                                                ArgType type, const std::string& desc) {
    FlagSpec spec;
    spec.name = name;
    spec.short_name = short_name;
    spec.description = desc;
    spec.takes_value = true;
    spec.value_type = type;
    info_.flags.push_back(std::move(spec));
    return *this;
}

CommandBuilder& CommandBuilder::function(CommandFunction func) {
    function_ = std::move(func);
    return *this;
}

CommandBuilder& CommandBuilder::validator(ValidateFunction validator) {
    validator_ = std::move(validator);
    return *this;
}

std::unique_ptr<ICommand> CommandBuilder::build() {
    auto cmd = std::make_unique<FunctionCommand>(std::move(info_), std::move(function_));
    if (validator_) {
        cmd->set_validator(std::move(validator_));
    }
    return cmd;
}

Result<void> CommandBuilder::register_to(CommandRegistry& registry) {
    return registry.register_command(build());
}

// =============================================================================
// CommandRegistry Implementation
// =============================================================================

CommandRegistry::CommandRegistry() = default;
CommandRegistry::~CommandRegistry() = default;

Result<void> CommandRegistry::register_command(std::unique_ptr<ICommand> command) {
    if (!command) {
        return Err(CommandError::invalid_argument("", "Cannot register a null command"));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string name = command->info().name;
    if (name.empty()) {
        return Err(CommandError::invalid_argument("", "Command name must not be empty"));
    }
    if (commands_.count(name) > 0) {
        return Err(CommandError::duplicate_command(name));
    }

    commands_.emplace(name, std::move(command));
    VFSH_LOG_TRACE("Registered command '{}'", name);
    return Ok();
}

Result<void> CommandRegistry::register_command(const std::string& name,
                                               const std::string& description,
                                               CommandFunction func) {
    return CommandBuilder(name)
        .description(description)
        .function(std::move(func))
        .register_to(*this);
}

bool CommandRegistry::unregister_command(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.erase(name) > 0;
}

bool CommandRegistry::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.count(name) > 0;
}

ICommand* CommandRegistry::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commands_.find(name);
    return it != commands_.end() ? it->second.get() : nullptr;
}

const ICommand* CommandRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commands_.find(name);
    return it != commands_.end() ? it->second.get() : nullptr;
}

const CommandInfo* CommandRegistry::get_info(const std::string& name) const {
    const ICommand* cmd = find(name);
    return cmd ? &cmd->info() : nullptr;
}

std::vector<const CommandInfo*> CommandRegistry::all_commands() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const CommandInfo*> result;
    result.reserve(commands_.size());

    for (const auto& [name, cmd] : commands_) {
        if (!cmd->info().hidden) {
            result.push_back(&cmd->info());
        }
    }

    // Sort by name
    std::sort(result.begin(), result.end(),
              [](const CommandInfo* a, const CommandInfo* b) {
                  return a->name < b->name;
              });

    return result;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> result;
    for (const CommandInfo* info : all_commands()) {
        result.push_back(info->name);
    }
    return result;
}

std::vector<const CommandInfo*> CommandRegistry::commands_in_category(CommandCategory cat) const {
    std::vector<const CommandInfo*> result;
    for (const CommandInfo* info : all_commands()) {
        if (info->category == cat) {
            result.push_back(info);
        }
    }
    return result;
}

std::size_t CommandRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.size();
}

std::vector<const CommandInfo*> CommandRegistry::search(const std::string& query) const {
    std::vector<const CommandInfo*> result;
    for (const CommandInfo* info : all_commands()) {
        if (info->name.find(query) != std::string::npos ||
            info->description.find(query) != std::string::npos) {
            result.push_back(info);
        }
    }
    return result;
}

} // namespace vfsh_shell
