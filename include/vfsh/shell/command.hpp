#pragma once

/// @file command.hpp
/// @brief Command interface and registry

#include "types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vfsh_vfs {
class Directory;
class FileSystemTree;
} // namespace vfsh_vfs

namespace vfsh_shell {

// =============================================================================
// Command Interface
// =============================================================================

/// @brief Command execution context
///
/// Built by the Session for each dispatch. The tree and cwd pointers are only
/// valid for the duration of one execute() call.
struct CommandContext {
    Session* session = nullptr;
    vfsh_vfs::FileSystemTree* tree = nullptr;
    vfsh_vfs::Directory* cwd = nullptr;
    Environment* env = nullptr;
    const CommandRegistry* registry = nullptr;
    const ShellConfig* config = nullptr;
    OutputCallback output;
    ErrorCallback error;
};

/// @brief Command interface
class ICommand {
public:
    virtual ~ICommand() = default;

    /// @brief Execute the command
    virtual CommandResult execute(const CommandArgs& args, CommandContext& ctx) = 0;

    /// @brief Get command metadata
    virtual const CommandInfo& info() const = 0;

    /// @brief Validate bound arguments before execution
    virtual bool validate(const CommandArgs& args, std::string& error) const {
        (void)args;
        (void)error;
        return true;
    }
};

// =============================================================================
// Function Command
// =============================================================================

/// @brief Command function type
using CommandFunction = std::function<CommandResult(const CommandArgs&, CommandContext&)>;

/// @brief Validation function type
using ValidateFunction = std::function<bool(const CommandArgs&, std::string& error)>;

/// @brief Function-based command implementation
class FunctionCommand : public ICommand {
public:
    FunctionCommand(CommandInfo info, CommandFunction func);

    CommandResult execute(const CommandArgs& args, CommandContext& ctx) override;
    const CommandInfo& info() const override { return info_; }

    bool validate(const CommandArgs& args, std::string& error) const override;

    void set_validator(ValidateFunction validator) { validator_ = std::move(validator); }

private:
    CommandInfo info_;
    CommandFunction function_;
    ValidateFunction validator_;
};

// =============================================================================
// Command Builder
// =============================================================================

/// @brief Fluent builder for commands
///
/// ```cpp
/// CommandBuilder("head")
///     .description("Print the first lines of a file")
///     .arg("path", ArgType::Path, "File to read")
///     .flag_with_value("lines", 'n', ArgType::Integer, "Number of lines")
///     .function(cmd_head)
///     .register_to(registry);
/// ```
class CommandBuilder {
public:
    explicit CommandBuilder(const std::string& name);

    CommandBuilder& description(const std::string& desc);
    CommandBuilder& usage(const std::string& usage);
    CommandBuilder& example(const std::string& example);
    CommandBuilder& category(CommandCategory cat);
    CommandBuilder& hidden(bool h = true);

    // Argument builders
    CommandBuilder& arg(const std::string& name, ArgType type,
                        const std::string& desc, bool required = true);
    CommandBuilder& arg_with_default(const std::string& name, ArgType type,
                                     const std::string& desc, const ArgValue& default_val);
    CommandBuilder& flag(const std::string& name, char short_name,
                         const std::string& desc);
    CommandBuilder& flag_with_value(const std::string& name, char short_name,
                                    ArgType type, const std::string& desc);

    // Callback setters
    CommandBuilder& function(CommandFunction func);
    CommandBuilder& validator(ValidateFunction validator);

    // Build and register
    std::unique_ptr<ICommand> build();
    [[nodiscard]] vfsh_core::Result<void> register_to(CommandRegistry& registry);

    // Get info for inspection
    const CommandInfo& get_info() const { return info_; }

private:
    CommandInfo info_;
    CommandFunction function_;
    ValidateFunction validator_;
};

// =============================================================================
// Command Registry
// =============================================================================

/// @brief Name -> command table
///
/// Populated once at startup, then read by the parser (for flag metadata) and
/// the dispatcher. Lookups are guarded so one registry can back several sessions.
class CommandRegistry {
public:
    CommandRegistry();
    ~CommandRegistry();

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // ==========================================================================
    // Command Registration
    // ==========================================================================

    /// @brief Register a command
    /// @return DuplicateCommand if the name is taken
    [[nodiscard]] vfsh_core::Result<void> register_command(std::unique_ptr<ICommand> command);

    /// @brief Register a flag-less, argument-less command
    [[nodiscard]] vfsh_core::Result<void> register_command(const std::string& name,
                                                           const std::string& description,
                                                           CommandFunction callback);

    /// @brief Unregister by name
    bool unregister_command(const std::string& name);

    /// @brief Check if command exists
    bool exists(const std::string& name) const;

    /// @brief Find command by name (non-const)
    ICommand* find(const std::string& name);

    /// @brief Find command by name (const)
    const ICommand* find(const std::string& name) const;

    /// @brief Get command info
    const CommandInfo* get_info(const std::string& name) const;

    // ==========================================================================
    // Querying
    // ==========================================================================

    /// @brief All visible commands sorted by name
    std::vector<const CommandInfo*> all_commands() const;

    /// @brief All visible command names, sorted
    std::vector<std::string> command_names() const;

    /// @brief Visible commands in one category, sorted by name
    std::vector<const CommandInfo*> commands_in_category(CommandCategory cat) const;

    /// @brief Get command count
    std::size_t count() const;

    /// @brief Search commands by name/description substring
    std::vector<const CommandInfo*> search(const std::string& query) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<ICommand>> commands_;
};

} // namespace vfsh_shell
