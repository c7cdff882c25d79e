/// @file config.cpp
/// @brief Shell configuration implementation

#include <vfsh/shell/config.hpp>
#include <vfsh/core/log.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace vfsh_shell {

using vfsh_core::CommandError;
using vfsh_core::Err;
using vfsh_core::LoadError;
using vfsh_core::Ok;
using vfsh_core::Result;

namespace {

constexpr const char* k_program = "vfsh";

Result<void> wrong_type(const std::string& source, const std::string& key, const char* expected) {
    return Err(LoadError::parse(source, "'" + key + "' must be " + expected));
}

Result<void> read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                         const std::string& source) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_string()) {
        return wrong_type(source, key, "a string");
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> read_bool(const nlohmann::json& j, const std::string& key, bool& out,
                       const std::string& source) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return wrong_type(source, key, "a boolean");
    }
    out = it->get<bool>();
    return Ok();
}

Result<void> read_int(const nlohmann::json& j, const std::string& key, std::int64_t& out,
                      const std::string& source) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_number_integer()) {
        return wrong_type(source, key, "an integer");
    }
    out = it->get<std::int64_t>();
    return Ok();
}

Result<void> check_log_level(const std::string& level) {
    if (!vfsh_core::parse_log_level(level)) {
        return Err(CommandError::invalid_argument(k_program, "Unknown log level: " + level));
    }
    return Ok();
}

} // anonymous namespace

// =============================================================================
// ShellConfig
// =============================================================================

nlohmann::json ShellConfig::to_json() const {
    nlohmann::json j;
    j["user"] = user_name;
    j["host"] = host_name;
    j["vfs"] = vfs_path;
    j["script"] = script_path;
    j["echo_script"] = echo_script;
    j["head_lines"] = head_lines;
    j["log"] = {
        {"level", log_level},
        {"directory", log_directory},
    };
    return j;
}

Result<void> ShellConfig::merge_json(const nlohmann::json& j, const std::string& source) {
    if (!j.is_object()) {
        return Err(LoadError::parse(source, "top level must be a JSON object"));
    }

    auto user = read_string(j, "user", user_name, source);
    if (!user) {
        return user;
    }
    auto host = read_string(j, "host", host_name, source);
    if (!host) {
        return host;
    }
    auto vfs = read_string(j, "vfs", vfs_path, source);
    if (!vfs) {
        return vfs;
    }
    auto script = read_string(j, "script", script_path, source);
    if (!script) {
        return script;
    }
    auto echo = read_bool(j, "echo_script", echo_script, source);
    if (!echo) {
        return echo;
    }
    auto head = read_int(j, "head_lines", head_lines, source);
    if (!head) {
        return head;
    }

    auto log = j.find("log");
    if (log != j.end() && !log->is_null()) {
        if (!log->is_object()) {
            return wrong_type(source, "log", "an object");
        }
        auto level = read_string(*log, "level", log_level, source);
        if (!level) {
            return level;
        }
        auto directory = read_string(*log, "directory", log_directory, source);
        if (!directory) {
            return directory;
        }
    }

    if (!vfsh_core::parse_log_level(log_level)) {
        return Err(LoadError::parse(source, "unknown log level '" + log_level + "'"));
    }

    return Ok();
}

Result<ShellConfig> parse_config(const std::string& text, const std::string& source) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<ShellConfig>(LoadError::parse(source, e.what()));
    }

    ShellConfig config;
    auto merged = config.merge_json(j, source);
    if (!merged) {
        return merged.error();
    }
    return config;
}

Result<ShellConfig> load_config(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err<ShellConfig>(LoadError::io(path, "Config file not found"));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<ShellConfig>(LoadError::io(path, "Cannot open config file"));
    }

    std::stringstream ss;
    ss << file.rdbuf();

    vfsh_core::shell_logger()->debug("Loading config {}", path);
    return parse_config(ss.str(), path);
}

// =============================================================================
// Command Line
// =============================================================================

Result<CommandLineOptions> parse_command_line(const std::vector<std::string>& args) {
    CommandLineOptions options;

    // Split "--key=value" so both spellings are handled the same way
    std::vector<std::string> words;
    for (const auto& arg : args) {
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            words.push_back(arg.substr(0, eq));
            words.push_back(arg.substr(eq + 1));
        } else {
            words.push_back(arg);
        }
    }

    // The config file is the base layer, so load it before anything else
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (words[i] == "--config") {
            if (i + 1 >= words.size()) {
                return Err<CommandLineOptions>(CommandError::missing_value(k_program, "--config"));
            }
            options.config_path = words[i + 1];
        }
    }
    if (!options.config_path.empty()) {
        auto loaded = load_config(options.config_path);
        if (!loaded) {
            return loaded.error();
        }
        options.config = std::move(loaded.value());
    }

    ShellConfig& config = options.config;
    for (std::size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];

        auto take_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= words.size()) {
                return std::nullopt;
            }
            return words[++i];
        };

        if (word == "--help" || word == "-h") {
            options.show_help = true;
        } else if (word == "--version" || word == "-v") {
            options.show_version = true;
        } else if (word == "--no-echo") {
            config.echo_script = false;
        } else if (word == "--config" || word == "--vfs" || word == "--script" ||
                   word == "--log-level" || word == "--log-dir") {
            auto value = take_value();
            if (!value) {
                return Err<CommandLineOptions>(CommandError::missing_value(k_program, word));
            }
            if (word == "--vfs") {
                config.vfs_path = *value;
            } else if (word == "--script") {
                config.script_path = *value;
            } else if (word == "--log-level") {
                auto valid = check_log_level(*value);
                if (!valid) {
                    return valid.error();
                }
                config.log_level = *value;
            } else if (word == "--log-dir") {
                config.log_directory = *value;
            }
        } else {
            return Err<CommandLineOptions>(CommandError::invalid_argument(k_program, "Unknown option: " + word));
        }
    }

    return options;
}

std::string usage_text(const std::string& program_name) {
    std::ostringstream ss;
    ss << "Usage: " << program_name << " [options]\n"
       << "\n"
       << "Options:\n"
       << "  --vfs PATH          Load the virtual filesystem from an XML file\n"
       << "  --script PATH       Run a script before the interactive prompt\n"
       << "  --config PATH       Read settings from a JSON file\n"
       << "  --log-level LEVEL   trace, debug, info, warn, error, critical or off\n"
       << "  --log-dir DIR       Also write rotating log files under DIR\n"
       << "  --no-echo           Do not print script lines before running them\n"
       << "  -h, --help          Show this help\n"
       << "  -v, --version       Show version information\n";
    return ss.str();
}

} // namespace vfsh_shell
