/// @file types.cpp
/// @brief Core types implementation for vfsh_shell

#include <vfsh/shell/types.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace vfsh_shell {

// =============================================================================
// CommandArg Implementation
// =============================================================================

std::string CommandArg::as_string() const {
    if (std::holds_alternative<std::string>(value)) {
        return std::get<std::string>(value);
    }
    if (std::holds_alternative<std::int64_t>(value)) {
        return std::to_string(std::get<std::int64_t>(value));
    }
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? "true" : "false";
    }
    return "";
}

std::int64_t CommandArg::as_int() const {
    if (std::holds_alternative<std::int64_t>(value)) {
        return std::get<std::int64_t>(value);
    }
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? 1 : 0;
    }
    if (std::holds_alternative<std::string>(value)) {
        const auto& str = std::get<std::string>(value);
        std::int64_t result = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
        if (ec == std::errc() && ptr == str.data() + str.size()) {
            return result;
        }
    }
    return 0;
}

bool CommandArg::as_bool() const {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value);
    }
    if (std::holds_alternative<std::int64_t>(value)) {
        return std::get<std::int64_t>(value) != 0;
    }
    if (std::holds_alternative<std::string>(value)) {
        std::string s = std::get<std::string>(value);
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "true" || s == "1" || s == "yes" || s == "on";
    }
    return false;
}

// =============================================================================
// CommandArgs Implementation
// =============================================================================

void CommandArgs::add(const std::string& name, ArgValue value, bool is_flag) {
    CommandArg arg;
    arg.name = name;
    arg.value = std::move(value);
    arg.is_flag = is_flag;
    named_args_[name] = std::move(arg);
}

void CommandArgs::add_positional(ArgValue value) {
    CommandArg arg;
    arg.value = std::move(value);
    positional_args_.push_back(std::move(arg));
}

bool CommandArgs::has(const std::string& name) const {
    return named_args_.count(name) > 0;
}

const CommandArg* CommandArgs::get(const std::string& name) const {
    auto it = named_args_.find(name);
    if (it != named_args_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::string CommandArgs::get_string(const std::string& name, const std::string& default_val) const {
    auto* arg = get(name);
    return arg ? arg->as_string() : default_val;
}

std::int64_t CommandArgs::get_int(const std::string& name, std::int64_t default_val) const {
    auto* arg = get(name);
    return arg ? arg->as_int() : default_val;
}

bool CommandArgs::get_bool(const std::string& name, bool default_val) const {
    auto* arg = get(name);
    return arg ? arg->as_bool() : default_val;
}

// =============================================================================
// CommandInfo Implementation
// =============================================================================

std::string CommandInfo::category_name() const {
    return vfsh_shell::category_name(category);
}

std::string CommandInfo::help_text() const {
    std::ostringstream ss;
    ss << name << " - " << description << "\n\n";
    ss << "Usage: " << usage << "\n";
    ss << "Category: " << category_name();

    if (!args.empty()) {
        ss << "\n\nArguments:";
        for (const auto& arg : args) {
            ss << "\n  " << arg.name << " (" << arg_type_name(arg.type) << ")";
            if (arg.required) {
                ss << " [required]";
            } else if (!std::holds_alternative<std::monostate>(arg.default_value)) {
                ss << " [default: " << arg_value_to_string(arg.default_value) << "]";
            }
            ss << "\n    " << arg.description;
        }
    }

    if (!flags.empty()) {
        ss << "\n\nFlags:";
        for (const auto& flag : flags) {
            ss << "\n  --" << flag.name;
            if (flag.short_name) ss << ", -" << flag.short_name;
            if (flag.takes_value) ss << " <" << arg_type_name(flag.value_type) << ">";
            ss << "\n    " << flag.description;
        }
    }

    if (!examples.empty()) {
        ss << "\n\nExamples:";
        for (const auto& example : examples) {
            ss << "\n  " << example;
        }
    }

    return ss.str();
}

const FlagSpec* CommandInfo::find_flag(const std::string& long_name) const {
    for (const auto& flag : flags) {
        if (flag.name == long_name) {
            return &flag;
        }
    }
    return nullptr;
}

const FlagSpec* CommandInfo::find_short_flag(char short_name) const {
    if (short_name == '\0') {
        return nullptr;
    }
    for (const auto& flag : flags) {
        if (flag.short_name == short_name) {
            return &flag;
        }
    }
    return nullptr;
}

// =============================================================================
// Utility Functions
// =============================================================================

const char* arg_type_name(ArgType type) {
    switch (type) {
        case ArgType::String: return "string";
        case ArgType::Integer: return "integer";
        case ArgType::Boolean: return "boolean";
        case ArgType::Path: return "path";
        default: return "unknown";
    }
}

const char* category_name(CommandCategory cat) {
    switch (cat) {
        case CommandCategory::General: return "General";
        case CommandCategory::Navigation: return "Navigation";
        case CommandCategory::FileSystem: return "File System";
        case CommandCategory::Scripting: return "Scripting";
        case CommandCategory::Help: return "Help";
        default: return "Unknown";
    }
}

ArgValue parse_arg_value(const std::string& str, ArgType type) {
    switch (type) {
        case ArgType::String:
        case ArgType::Path:
            return str;

        case ArgType::Integer: {
            std::int64_t value = 0;
            auto result = std::from_chars(str.data(), str.data() + str.size(), value);
            if (!str.empty() && result.ec == std::errc() && result.ptr == str.data() + str.size()) {
                return value;
            }
            return std::monostate{};
        }

        case ArgType::Boolean: {
            std::string lower = str;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
                return true;
            }
            if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
                return false;
            }
            return std::monostate{};
        }

        default:
            return std::monostate{};
    }
}

std::string arg_value_to_string(const ArgValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else {
            return "";
        }
    }, value);
}

} // namespace vfsh_shell
