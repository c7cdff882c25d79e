#pragma once

/// @file builtins.hpp
/// @brief Built-in shell commands

#include "command.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vfsh_shell {
namespace builtins {

// =============================================================================
// Command Registration
// =============================================================================

/// @brief Register all built-in commands
/// @return DuplicateCommand if any name is already taken
[[nodiscard]] vfsh_core::Result<void> register_all(CommandRegistry& registry);

/// @brief Register cd, pwd, ls, tree
[[nodiscard]] vfsh_core::Result<void> register_navigation_commands(CommandRegistry& registry);

/// @brief Register head, tac, wc, rm, mkdir, touch, mv, cp
[[nodiscard]] vfsh_core::Result<void> register_filesystem_commands(CommandRegistry& registry);

/// @brief Register sc, exit
[[nodiscard]] vfsh_core::Result<void> register_session_commands(CommandRegistry& registry);

/// @brief Register help
[[nodiscard]] vfsh_core::Result<void> register_help_commands(CommandRegistry& registry);

// =============================================================================
// Navigation Commands
// =============================================================================

/// @brief cd - Change directory (no argument goes to /)
CommandResult cmd_cd(const CommandArgs& args, CommandContext& ctx);

/// @brief pwd - Print working directory
CommandResult cmd_pwd(const CommandArgs& args, CommandContext& ctx);

/// @brief ls - List directory contents in insertion order
CommandResult cmd_ls(const CommandArgs& args, CommandContext& ctx);

/// @brief tree - Render a directory subtree
CommandResult cmd_tree(const CommandArgs& args, CommandContext& ctx);

// =============================================================================
// File Commands
// =============================================================================

/// @brief head - First N lines of a file
CommandResult cmd_head(const CommandArgs& args, CommandContext& ctx);

/// @brief tac - Lines of a file in reverse order
CommandResult cmd_tac(const CommandArgs& args, CommandContext& ctx);

/// @brief wc - Line, word, character and longest-line counts
CommandResult cmd_wc(const CommandArgs& args, CommandContext& ctx);

/// @brief rm - Remove a file or directory recursively
CommandResult cmd_rm(const CommandArgs& args, CommandContext& ctx);

/// @brief mkdir - Create a directory
CommandResult cmd_mkdir(const CommandArgs& args, CommandContext& ctx);

/// @brief touch - Create an empty file
CommandResult cmd_touch(const CommandArgs& args, CommandContext& ctx);

/// @brief mv - Move or rename
CommandResult cmd_mv(const CommandArgs& args, CommandContext& ctx);

/// @brief cp - Deep copy
CommandResult cmd_cp(const CommandArgs& args, CommandContext& ctx);

// =============================================================================
// Session Commands
// =============================================================================

/// @brief sc - Load a VFS, replace the session tree, run a script
CommandResult cmd_sc(const CommandArgs& args, CommandContext& ctx);

/// @brief exit - End the session
CommandResult cmd_exit(const CommandArgs& args, CommandContext& ctx);

// =============================================================================
// Help Commands
// =============================================================================

/// @brief help - List commands or describe one
CommandResult cmd_help(const CommandArgs& args, CommandContext& ctx);

// =============================================================================
// Text Helpers
// =============================================================================

/// @brief Split on '\n'; a trailing newline terminates the last line
///        instead of starting an empty one
std::vector<std::string> split_lines(std::string_view content);

/// @brief Number of UTF-8 code points (continuation bytes are not counted)
std::size_t count_code_points(std::string_view text);

/// @brief Number of whitespace separated words
std::size_t count_words(std::string_view text);

/// @brief Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace builtins
} // namespace vfsh_shell
