#pragma once

/// @file session.hpp
/// @brief Shell session: tree ownership, working directory, environment, prompt

#include "config.hpp"
#include "dispatcher.hpp"
#include "types.hpp"

#include <vfsh/vfs/tree.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vfsh_shell {

// =============================================================================
// Environment
// =============================================================================

/// @brief Shell environment variables
class Environment {
public:
    Environment() = default;

    /// @brief Get a variable value
    std::optional<std::string> get(const std::string& name) const;

    /// @brief Set a variable value
    void set(const std::string& name, const std::string& value);

    /// @brief Unset a variable
    bool unset(const std::string& name);

    /// @brief Check if variable exists
    bool has(const std::string& name) const;

    /// @brief Get all variable names, sorted
    std::vector<std::string> keys() const;

    /// @brief Remove every variable
    void clear();

    /// @brief Copy the process environment
    void import_system_env();

    /// @brief $USER, then $USERNAME, then the passwd entry
    std::string user() const;

private:
    std::unordered_map<std::string, std::string> variables_;
    mutable std::mutex mutex_;
};

// =============================================================================
// User
// =============================================================================

/// @brief Identity shown in the prompt
class User {
public:
    User() = default;
    User(std::string name, std::string host);

    /// @brief Resolve from config, falling back to the environment and the host
    static User from_config(const ShellConfig& config, const Environment& env);

    const std::string& name() const { return name_; }
    const std::string& host() const { return host_; }

    /// @brief "name@host:~<path>$ " for the directory at @p path
    std::string prompt(const std::string& path) const;

private:
    std::string name_ = "user";
    std::string host_ = "localhost";
};

// =============================================================================
// Session
// =============================================================================

/// @brief One interactive shell over one virtual filesystem
///
/// The session owns the tree and keeps a non-owning pointer to the current
/// directory inside it. FileSystemTree::remove refuses to delete the current
/// directory or its ancestors, and replace_tree() resets the pointer, so it
/// never dangles.
class Session {
public:
    Session(CommandRegistry& registry, ShellConfig config = {},
            std::unique_ptr<vfsh_vfs::FileSystemTree> tree = nullptr);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ==========================================================================
    // Execution
    // ==========================================================================

    /// @brief Execute one command line
    ///
    /// Blank lines succeed with no output. A first token "$NAME" prints the
    /// variable. Everything else goes through the dispatcher.
    CommandResult submit(const std::string& line);

    /// @brief False once a session-ending command ran
    bool is_running() const { return running_; }

    /// @brief Mark the session as finished
    void request_exit() { running_ = false; }

    const CommandResult& last_result() const { return last_result_; }

    // ==========================================================================
    // Scripts
    // ==========================================================================

    /// @brief Deepest allowed nesting of running scripts
    static constexpr std::size_t k_max_script_depth = 16;

    /// @brief Check that @p path may start running
    ///
    /// Fails with InvalidOperation when the script is already running further
    /// up the stack, or when k_max_script_depth scripts are running.
    [[nodiscard]] vfsh_core::Result<void> check_script(const std::string& path) const;

    /// @brief check_script(), then push @p path onto the running scripts
    [[nodiscard]] vfsh_core::Result<void> enter_script(const std::string& path);

    /// @brief Pop the innermost running script
    void leave_script();

    std::size_t script_depth() const { return active_scripts_.size(); }

    // ==========================================================================
    // Filesystem
    // ==========================================================================

    vfsh_vfs::FileSystemTree& tree() { return *tree_; }
    const vfsh_vfs::FileSystemTree& tree() const { return *tree_; }

    vfsh_vfs::Directory& cwd() { return *cwd_; }
    const vfsh_vfs::Directory& cwd() const { return *cwd_; }

    /// @brief Set the current directory; @p dir must belong to tree()
    void set_cwd(vfsh_vfs::Directory& dir);

    /// @brief Swap in a new tree and move to its root
    void replace_tree(std::unique_ptr<vfsh_vfs::FileSystemTree> tree);

    // ==========================================================================
    // Environment & Identity
    // ==========================================================================

    Environment& env() { return env_; }
    const Environment& env() const { return env_; }

    const User& user() const { return user_; }

    const ShellConfig& config() const { return config_; }

    CommandRegistry& registry() { return registry_; }
    const Dispatcher& dispatcher() const { return dispatcher_; }

    /// @brief Prompt for the current directory
    std::string prompt() const;

    // ==========================================================================
    // I/O
    // ==========================================================================

    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }
    void set_error_callback(ErrorCallback cb) { error_callback_ = std::move(cb); }

    const OutputCallback& output_callback() const { return output_callback_; }
    const ErrorCallback& error_callback() const { return error_callback_; }

    // ==========================================================================
    // Statistics
    // ==========================================================================

    struct Stats {
        std::size_t commands_executed = 0;
        std::size_t commands_succeeded = 0;
        std::size_t commands_failed = 0;
    };

    Stats stats() const { return stats_; }

private:
    CommandRegistry& registry_;
    Dispatcher dispatcher_;
    ShellConfig config_;

    std::unique_ptr<vfsh_vfs::FileSystemTree> tree_;
    vfsh_vfs::Directory* cwd_ = nullptr;

    Environment env_;
    User user_;

    OutputCallback output_callback_;
    ErrorCallback error_callback_;

    bool running_ = true;
    std::vector<std::string> active_scripts_;
    CommandResult last_result_;
    Stats stats_;

    CommandContext make_context();
    CommandResult echo_variable(const std::string& token) const;
    void update_stats(const CommandResult& result);
};

} // namespace vfsh_shell
