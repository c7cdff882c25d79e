#pragma once

/// @file config.hpp
/// @brief Shell configuration (JSON file + command line)

#include "fwd.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace vfsh_shell {

// =============================================================================
// Shell Configuration
// =============================================================================

/// @brief Shell configuration
///
/// JSON layout (all keys optional, unknown keys ignored):
/// ```json
/// {
///   "user": "alice",
///   "host": "sandbox",
///   "vfs": "fs.xml",
///   "script": "start.txt",
///   "echo_script": true,
///   "head_lines": 5,
///   "log": { "level": "warn", "directory": "logs" }
/// }
/// ```
struct ShellConfig {
    std::string user_name;       // Empty: taken from the environment
    std::string host_name;       // Empty: gethostname()
    std::string vfs_path;        // Empty: start with an empty tree
    std::string script_path;
    bool echo_script = true;     // Print "<prompt><line>" before each script line
    std::int64_t head_lines = 5;
    std::string log_level = "warn";
    std::string log_directory;   // Empty: console logging only

    /// @brief Serialize to the JSON layout above
    [[nodiscard]] nlohmann::json to_json() const;

    /// @brief Read a JSON object over the current values
    /// @return ParseError on a key with the wrong type
    [[nodiscard]] vfsh_core::Result<void> merge_json(const nlohmann::json& j, const std::string& source);
};

/// @brief Load a configuration file
/// @return IoError if unreadable, ParseError if malformed
[[nodiscard]] vfsh_core::Result<ShellConfig> load_config(const std::string& path);

/// @brief Parse a configuration document held in memory
[[nodiscard]] vfsh_core::Result<ShellConfig> parse_config(const std::string& text,
                                                          const std::string& source = "<memory>");

// =============================================================================
// Command Line
// =============================================================================

/// @brief Outcome of command line parsing
struct CommandLineOptions {
    ShellConfig config;
    std::string config_path;
    bool show_help = false;
    bool show_version = false;
};

/// @brief Parse process arguments (without argv[0])
///
/// `--config PATH` is loaded first; every other option overrides the file.
/// @return InvalidArgument on an unknown option or a missing value
[[nodiscard]] vfsh_core::Result<CommandLineOptions> parse_command_line(const std::vector<std::string>& args);

/// @brief Usage text for --help
[[nodiscard]] std::string usage_text(const std::string& program_name);

} // namespace vfsh_shell
