/// @file builtins.cpp
/// @brief Built-in shell commands implementation for vfsh_shell

#include <vfsh/shell/builtins.hpp>
#include <vfsh/shell/config.hpp>
#include <vfsh/shell/runner.hpp>
#include <vfsh/shell/session.hpp>
#include <vfsh/vfs/tree.hpp>
#include <vfsh/vfs/xml_loader.hpp>
#include <vfsh/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace vfsh_shell {
namespace builtins {

using vfsh_core::Err;
using vfsh_core::ErrorCode;
using vfsh_core::LoadError;
using vfsh_core::Ok;
using vfsh_core::Result;
using vfsh_core::VfsError;
using vfsh_vfs::Directory;
using vfsh_vfs::File;
using vfsh_vfs::Node;

namespace {

/// Resolve @p path and require a File
Result<const File*> resolve_file(const CommandContext& ctx, const std::string& path) {
    auto node = ctx.tree->resolve(path, *ctx.cwd);
    if (!node) {
        return Err<const File*>(node.error());
    }
    if ((*node)->is_directory()) {
        return Err<const File*>(VfsError::invalid_operation(path, "Is a directory"));
    }
    return Ok<const File*>((*node)->as_file());
}

} // anonymous namespace

// =============================================================================
// Registration Functions
// =============================================================================

Result<void> register_all(CommandRegistry& registry) {
    if (auto r = register_navigation_commands(registry); !r) return r;
    if (auto r = register_filesystem_commands(registry); !r) return r;
    if (auto r = register_session_commands(registry); !r) return r;
    if (auto r = register_help_commands(registry); !r) return r;

    VFSH_LOG_DEBUG("Registered {} builtin commands", registry.count());
    return Ok();
}

Result<void> register_navigation_commands(CommandRegistry& registry) {
    // cd
    auto r = CommandBuilder("cd")
        .description("Change the current directory")
        .usage("cd [path]")
        .example("cd /home")
        .example("cd ..")
        .category(CommandCategory::Navigation)
        .arg_with_default("path", ArgType::Path, "Target directory", std::string("/"))
        .function(cmd_cd)
        .register_to(registry);
    if (!r) return r;

    // pwd
    r = CommandBuilder("pwd")
        .description("Print the current directory")
        .category(CommandCategory::Navigation)
        .function(cmd_pwd)
        .register_to(registry);
    if (!r) return r;

    // ls
    r = CommandBuilder("ls")
        .description("List directory contents")
        .usage("ls [path]")
        .example("ls /home")
        .category(CommandCategory::Navigation)
        .arg("path", ArgType::Path, "Directory to list", false)
        .function(cmd_ls)
        .register_to(registry);
    if (!r) return r;

    // tree
    return CommandBuilder("tree")
        .description("Show a directory subtree")
        .usage("tree [path]")
        .category(CommandCategory::Navigation)
        .arg("path", ArgType::Path, "Root of the listing", false)
        .function(cmd_tree)
        .register_to(registry);
}

Result<void> register_filesystem_commands(CommandRegistry& registry) {
    // head
    auto r = CommandBuilder("head")
        .description("Print the first lines of a file")
        .usage("head [-n N] <path>")
        .example("head -n 1 /home/hello.txt")
        .category(CommandCategory::FileSystem)
        .arg("path", ArgType::Path, "File to read")
        .flag_with_value("lines", 'n', ArgType::Integer, "Number of lines")
        .function(cmd_head)
        .register_to(registry);
    if (!r) return r;

    // tac
    r = CommandBuilder("tac")
        .description("Print the lines of a file in reverse order")
        .usage("tac <path>")
        .category(CommandCategory::FileSystem)
        .arg("path", ArgType::Path, "File to read")
        .function(cmd_tac)
        .register_to(registry);
    if (!r) return r;

    // wc
    r = CommandBuilder("wc")
        .description("Count lines, words and characters")
        .usage("wc [-l] [-w] [-m] [-L] <path>")
        .example("wc -l LICENSE")
        .example("wc -lw LICENSE")
        .category(CommandCategory::FileSystem)
        .arg("path", ArgType::Path, "File to count")
        .flag("lines", 'l', "Print the newline count")
        .flag("words", 'w', "Print the word count")
        .flag("chars", 'm', "Print the character count")
        .flag("max-line-length", 'L', "Print the longest line length")
        .function(cmd_wc)
        .register_to(registry);
    if (!r) return r;

    // rm
    r = CommandBuilder("rm")
        .description("Remove a file or directory")
        .usage("rm <path>")
        .example("rm /home/hello.txt")
        .category(CommandCategory::FileSystem)
        .arg("path", ArgType::Path, "Node to remove")
        .function(cmd_rm)
        .register_to(registry);
    if (!r) return r;

    // mkdir
    r = CommandBuilder("mkdir")
        .description("Create a directory")
        .usage("mkdir <path>")
        .category(CommandCategory::FileSystem)
        .arg("path", ArgType::Path, "Directory to create")
        .function(cmd_mkdir)
        .register_to(registry);
    if (!r) return r;

    // touch
    r = CommandBuilder("touch")
        .description("Create an empty file")
        .usage("touch <path>")
        .category(CommandCategory::FileSystem)
        .arg("path", ArgType::Path, "File to create")
        .function(cmd_touch)
        .register_to(registry);
    if (!r) return r;

    // mv
    r = CommandBuilder("mv")
        .description("Move or rename a file or directory")
        .usage("mv <source> <destination>")
        .example("mv notes.txt /home")
        .example("mv notes.txt todo.txt")
        .category(CommandCategory::FileSystem)
        .arg("source", ArgType::Path, "Node to move")
        .arg("destination", ArgType::Path, "Target directory or new name")
        .function(cmd_mv)
        .register_to(registry);
    if (!r) return r;

    // cp
    return CommandBuilder("cp")
        .description("Copy a file or directory")
        .usage("cp <source> <destination>")
        .example("cp home backup")
        .category(CommandCategory::FileSystem)
        .arg("source", ArgType::Path, "Node to copy")
        .arg("destination", ArgType::Path, "Target directory or new name")
        .function(cmd_cp)
        .register_to(registry);
}

Result<void> register_session_commands(CommandRegistry& registry) {
    // sc
    auto r = CommandBuilder("sc")
        .description("Load a VFS and run a script against it")
        .usage("sc --vfs <file.xml> --script <file>")
        .example("sc --vfs vfs.xml --script start.sh")
        .category(CommandCategory::Scripting)
        .flag_with_value("vfs", '\0', ArgType::Path, "VFS description to load")
        .flag_with_value("script", '\0', ArgType::Path, "Script to run")
        .validator([](const CommandArgs& args, std::string& error) {
            if (!args.has("vfs") || !args.has("script")) {
                error = "Both --vfs and --script are required";
                return false;
            }
            return true;
        })
        .function(cmd_sc)
        .register_to(registry);
    if (!r) return r;

    // exit
    return CommandBuilder("exit")
        .description("Exit the shell")
        .category(CommandCategory::General)
        .function(cmd_exit)
        .register_to(registry);
}

Result<void> register_help_commands(CommandRegistry& registry) {
    // help
    return CommandBuilder("help")
        .description("Show help for commands")
        .usage("help [command]")
        .example("help wc")
        .category(CommandCategory::Help)
        .arg("command", ArgType::String, "Command to get help for", false)
        .function(cmd_help)
        .register_to(registry);
}

// =============================================================================
// Navigation Commands Implementation
// =============================================================================

CommandResult cmd_cd(const CommandArgs& args, CommandContext& ctx) {
    std::string path = args.get_string("path", "/");

    auto dir = ctx.tree->change_directory(path, *ctx.cwd);
    if (!dir) {
        return CommandResult::error(dir.error());
    }

    ctx.cwd = *dir;
    if (ctx.session) {
        ctx.session->set_cwd(**dir);
    }
    return CommandResult::success();
}

CommandResult cmd_pwd(const CommandArgs& /*args*/, CommandContext& ctx) {
    return CommandResult::success(ctx.cwd->absolute_path());
}

CommandResult cmd_ls(const CommandArgs& args, CommandContext& ctx) {
    std::vector<Node*> nodes;
    if (args.has("path")) {
        auto listed = ctx.tree->list(args.get_string("path"), *ctx.cwd);
        if (!listed) {
            return CommandResult::error(listed.error());
        }
        nodes = std::move(*listed);
    } else {
        nodes = ctx.tree->list(*ctx.cwd);
    }

    std::vector<std::string> names;
    names.reserve(nodes.size());
    for (const Node* node : nodes) {
        names.push_back(node->name());
    }

    CommandResult result = CommandResult::success(join(names, "\n"));
    result.data = names;
    return result;
}

CommandResult cmd_tree(const CommandArgs& args, CommandContext& ctx) {
    const Directory* dir = ctx.cwd;
    if (args.has("path")) {
        auto target = ctx.tree->change_directory(args.get_string("path"), *ctx.cwd);
        if (!target) {
            return CommandResult::error(target.error());
        }
        dir = *target;
    }
    return CommandResult::success(ctx.tree->render_tree(*dir));
}

// =============================================================================
// File Commands Implementation
// =============================================================================

CommandResult cmd_head(const CommandArgs& args, CommandContext& ctx) {
    const std::int64_t fallback = ctx.config ? ctx.config->head_lines : 5;
    const std::int64_t count = args.get_int("lines", fallback);

    auto file = resolve_file(ctx, args.get_string("path"));
    if (!file) {
        return CommandResult::error(file.error());
    }

    if (count <= 0) {
        return CommandResult::success();
    }

    std::vector<std::string> lines = split_lines((*file)->read());
    if (static_cast<std::size_t>(count) < lines.size()) {
        lines.resize(static_cast<std::size_t>(count));
    }
    return CommandResult::success(join(lines, "\n"));
}

CommandResult cmd_tac(const CommandArgs& args, CommandContext& ctx) {
    auto file = resolve_file(ctx, args.get_string("path"));
    if (!file) {
        return CommandResult::error(file.error());
    }

    std::vector<std::string> lines = split_lines((*file)->read());
    std::reverse(lines.begin(), lines.end());
    return CommandResult::success(join(lines, "\n"));
}

CommandResult cmd_wc(const CommandArgs& args, CommandContext& ctx) {
    const std::string path = args.get_string("path");
    auto file = resolve_file(ctx, path);
    if (!file) {
        return CommandResult::error(file.error());
    }

    const std::string& content = (*file)->read();

    WcCounts counts;
    counts.lines = static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n'));
    counts.words = count_words(content);
    counts.chars = count_code_points(content);
    for (const auto& line : split_lines(content)) {
        counts.max_line_length = std::max(counts.max_line_length, count_code_points(line));
    }

    bool show_lines = args.get_bool("lines");
    bool show_words = args.get_bool("words");
    bool show_chars = args.get_bool("chars");
    bool show_max = args.get_bool("max-line-length");
    if (!show_lines && !show_words && !show_chars && !show_max) {
        show_lines = show_words = show_chars = show_max = true;
    }

    std::vector<std::string> parts;
    if (show_lines) parts.push_back(std::to_string(counts.lines));
    if (show_words) parts.push_back(std::to_string(counts.words));
    if (show_chars) parts.push_back(std::to_string(counts.chars));
    if (show_max) parts.push_back(std::to_string(counts.max_line_length));
    parts.push_back(path);

    CommandResult result = CommandResult::success(join(parts, " "));
    result.data = counts;
    return result;
}

CommandResult cmd_rm(const CommandArgs& args, CommandContext& ctx) {
    auto removed = ctx.tree->remove(args.get_string("path"), *ctx.cwd);
    if (!removed) {
        return CommandResult::error(removed.error());
    }
    return CommandResult::success();
}

CommandResult cmd_mkdir(const CommandArgs& args, CommandContext& ctx) {
    auto dir = ctx.tree->make_directory(args.get_string("path"), *ctx.cwd);
    if (!dir) {
        return CommandResult::error(dir.error());
    }
    return CommandResult::success();
}

CommandResult cmd_touch(const CommandArgs& args, CommandContext& ctx) {
    auto node = ctx.tree->create_file(args.get_string("path"), *ctx.cwd);
    if (!node) {
        return CommandResult::error(node.error());
    }
    return CommandResult::success();
}

CommandResult cmd_mv(const CommandArgs& args, CommandContext& ctx) {
    auto moved = ctx.tree->move(args.get_string("source"), args.get_string("destination"), *ctx.cwd);
    if (!moved) {
        return CommandResult::error(moved.error());
    }
    return CommandResult::success();
}

CommandResult cmd_cp(const CommandArgs& args, CommandContext& ctx) {
    auto copied = ctx.tree->copy(args.get_string("source"), args.get_string("destination"), *ctx.cwd);
    if (!copied) {
        return CommandResult::error(copied.error());
    }
    return CommandResult::success();
}

// =============================================================================
// Session Commands Implementation
// =============================================================================

CommandResult cmd_sc(const CommandArgs& args, CommandContext& ctx) {
    if (!ctx.session) {
        return CommandResult::error(ErrorCode::Internal, "No session");
    }

    const std::string vfs_path = args.get_string("vfs");
    const std::string script_path = args.get_string("script");

    // Everything that can fail is checked before the session is touched
    auto tree = vfsh_vfs::XmlLoader::load_file(vfs_path);
    if (!tree) {
        return CommandResult::error(tree.error());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(script_path, ec)) {
        return CommandResult::error(LoadError::io(script_path, "Script file not found"));
    }
    if (auto allowed = ctx.session->check_script(script_path); !allowed) {
        return CommandResult::error(allowed.error());
    }

    // ctx.tree and ctx.cwd dangle from here on
    Session& session = *ctx.session;
    session.replace_tree(std::move(*tree));

    ScriptRunner runner(session, ctx.output, ctx.error);
    auto report = runner.run_file(script_path);
    if (!report) {
        return CommandResult::error(report.error());
    }

    CommandResult result = CommandResult::success();
    result.data = *report;
    return result;
}

CommandResult cmd_exit(const CommandArgs& /*args*/, CommandContext& ctx) {
    if (ctx.session) {
        ctx.session->request_exit();
    }
    return CommandResult::exit();
}

// =============================================================================
// Help Commands Implementation
// =============================================================================

CommandResult cmd_help(const CommandArgs& args, CommandContext& ctx) {
    if (args.positional().empty()) {
        std::ostringstream ss;
        ss << "vfsh - virtual filesystem shell\n\n";
        ss << "Usage: <command> [options] [arguments...]\n";
        ss << "Type 'help <command>' for help on a specific command\n\n";
        bool first = true;
        for (CommandCategory cat : {CommandCategory::Navigation, CommandCategory::FileSystem,
                                    CommandCategory::Scripting, CommandCategory::General,
                                    CommandCategory::Help}) {
            auto commands = ctx.registry->commands_in_category(cat);
            if (commands.empty()) {
                continue;
            }
            if (!first) {
                ss << "\n\n";
            }
            first = false;
            ss << category_name(cat) << ":";
            for (const CommandInfo* info : commands) {
                ss << "\n  " << info->name;
                ss << std::string(info->name.size() < 8 ? 8 - info->name.size() : 1, ' ');
                ss << info->description;
            }
        }
        return CommandResult::success(ss.str());
    }

    // Help for specific command
    std::string cmd_name = args.positional()[0].as_string();
    const CommandInfo* info = ctx.registry->get_info(cmd_name);
    if (!info) {
        return CommandResult::error(vfsh_core::CommandError::unknown_command(cmd_name));
    }

    return CommandResult::success(info->help_text());
}

// =============================================================================
// Text Helpers
// =============================================================================

std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        std::size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(content.substr(start));
            break;
        }
        lines.emplace_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::size_t count_code_points(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::size_t count_words(std::string_view text) {
    std::size_t words = 0;
    bool in_word = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

} // namespace builtins
} // namespace vfsh_shell
