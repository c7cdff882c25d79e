/// @file session.cpp
/// @brief Shell session implementation for vfsh_shell

#include <vfsh/shell/session.hpp>
#include <vfsh/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <pwd.h>
#include <unistd.h>

extern char** environ;

namespace vfsh_shell {

using vfsh_core::CommandError;
using vfsh_core::Err;
using vfsh_core::Ok;
using vfsh_core::Result;
using vfsh_core::VfsError;
using vfsh_vfs::Directory;
using vfsh_vfs::FileSystemTree;

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

// Two spellings of one script file compare equal
std::string script_key(const std::string& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : canonical.string();
}

} // anonymous namespace

// =============================================================================
// Environment Implementation
// =============================================================================

std::optional<std::string> Environment::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = variables_.find(name);
    if (it != variables_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Environment::set(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    variables_[name] = value;
}

bool Environment::unset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return variables_.erase(name) > 0;
}

bool Environment::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return variables_.count(name) > 0;
}

std::vector<std::string> Environment::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    result.reserve(variables_.size());
    for (const auto& [key, value] : variables_) {
        result.push_back(key);
    }

    std::sort(result.begin(), result.end());
    return result;
}

void Environment::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    variables_.clear();
}

void Environment::import_system_env() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        std::size_t eq_pos = entry.find('=');
        if (eq_pos != std::string::npos && eq_pos > 0) {
            variables_[entry.substr(0, eq_pos)] = entry.substr(eq_pos + 1);
        }
    }
}

std::string Environment::user() const {
    auto val = get("USER");
    if (val && !val->empty()) return *val;

    val = get("USERNAME");
    if (val && !val->empty()) return *val;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "user";
}

// =============================================================================
// User Implementation
// =============================================================================

User::User(std::string name, std::string host)
    : name_(std::move(name)), host_(std::move(host)) {}

User User::from_config(const ShellConfig& config, const Environment& env) {
    std::string name = config.user_name.empty() ? env.user() : config.user_name;

    std::string host = config.host_name;
    if (host.empty()) {
        char buffer[256] = {};
        if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
            host = buffer;
        } else {
            host = "localhost";
        }
    }

    return User(std::move(name), std::move(host));
}

std::string User::prompt(const std::string& path) const {
    return name_ + "@" + host_ + ":~" + path + "$ ";
}

// =============================================================================
// Session Implementation
// =============================================================================

Session::Session(CommandRegistry& registry, ShellConfig config, std::unique_ptr<FileSystemTree> tree)
    : registry_(registry)
    , dispatcher_(registry)
    , config_(std::move(config))
    , tree_(tree ? std::move(tree) : std::make_unique<FileSystemTree>())
    , cwd_(&tree_->root())
{
    env_.import_system_env();
    env_.set("SHELL", "vfsh");
    env_.set("PWD", "/");
    user_ = User::from_config(config_, env_);

    vfsh_core::shell_logger()->debug("Session started for {}@{} ({} nodes)",
        user_.name(), user_.host(), tree_->node_count());
}

Session::~Session() = default;

CommandResult Session::submit(const std::string& line) {
    const std::string input = trim(line);
    if (input.empty()) {
        return CommandResult::success();
    }

    CommandResult result;
    if (input.front() == '$') {
        auto end = std::find_if(input.begin(), input.end(),
                                [](unsigned char c) { return std::isspace(c); });
        result = echo_variable(std::string(input.begin(), end));
    } else {
        CommandContext ctx = make_context();
        result = dispatcher_.execute(input, ctx);
    }

    if (result.status == CommandStatus::Exit) {
        running_ = false;
    }

    update_stats(result);
    last_result_ = result;
    return result;
}

void Session::set_cwd(Directory& dir) {
    cwd_ = &dir;
    env_.set("PWD", dir.absolute_path());
}

void Session::replace_tree(std::unique_ptr<FileSystemTree> tree) {
    if (!tree) {
        tree = std::make_unique<FileSystemTree>();
    }

    // Move to the new root before the old tree (and the old cwd) is destroyed
    tree_.swap(tree);
    set_cwd(tree_->root());

    vfsh_core::shell_logger()->info("Filesystem replaced ({} nodes)", tree_->node_count());
}

Result<void> Session::check_script(const std::string& path) const {
    const std::string key = script_key(path);
    const bool active = std::find(active_scripts_.begin(), active_scripts_.end(), key)
        != active_scripts_.end();

    if (active || active_scripts_.size() >= k_max_script_depth) {
        vfsh_core::shell_logger()->warn("Refusing to run {} at script depth {}", path, active_scripts_.size());
        return Err(VfsError::invalid_operation(path, "Script recursion too deep"));
    }
    return Ok();
}

Result<void> Session::enter_script(const std::string& path) {
    auto allowed = check_script(path);
    if (!allowed) {
        return allowed;
    }
    active_scripts_.push_back(script_key(path));
    return Ok();
}

void Session::leave_script() {
    if (!active_scripts_.empty()) {
        active_scripts_.pop_back();
    }
}

std::string Session::prompt() const {
    return user_.prompt(cwd_->absolute_path());
}

CommandContext Session::make_context() {
    CommandContext ctx;
    ctx.session = this;
    ctx.tree = tree_.get();
    ctx.cwd = cwd_;
    ctx.env = &env_;
    ctx.registry = &registry_;
    ctx.config = &config_;
    ctx.output = output_callback_;
    ctx.error = error_callback_;
    return ctx;
}

CommandResult Session::echo_variable(const std::string& token) const {
    const std::string name = token.substr(1);

    auto value = env_.get(name);
    if (!value) {
        CommandResult result = CommandResult::error(
            CommandError::invalid_argument(token, "Environment variable not found: " + name));
        result.command = token;
        return result;
    }

    CommandResult result = CommandResult::success(*value);
    result.command = token;
    return result;
}

void Session::update_stats(const CommandResult& result) {
    ++stats_.commands_executed;
    if (result.ok()) {
        ++stats_.commands_succeeded;
    } else {
        ++stats_.commands_failed;
    }
}

} // namespace vfsh_shell
