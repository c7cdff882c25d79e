/// @file runner.cpp
/// @brief Interactive and script drivers

#include <vfsh/shell/runner.hpp>
#include <vfsh/shell/session.hpp>
#include <vfsh/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>

namespace vfsh_shell {

using vfsh_core::Err;
using vfsh_core::ErrorCode;
using vfsh_core::LoadError;
using vfsh_core::Result;

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

void emit(const std::function<void(const std::string&)>& sink, const std::string& text) {
    if (sink) {
        sink(text);
    }
}

/// Keeps a script on the session's running stack for one run_file() call
class ActiveScript {
public:
    explicit ActiveScript(Session& session) : session_(session) {}
    ~ActiveScript() { session_.leave_script(); }

    ActiveScript(const ActiveScript&) = delete;
    ActiveScript& operator=(const ActiveScript&) = delete;

private:
    Session& session_;
};

} // anonymous namespace

std::string format_failure(const CommandResult& result) {
    if (result.command.empty() || result.error_code == ErrorCode::UnknownCommand) {
        return result.error_message;
    }
    return result.command + ": " + result.error_message;
}

// =============================================================================
// InteractiveRunner
// =============================================================================

InteractiveRunner::InteractiveRunner(Session& session, std::istream& in, std::ostream& out, std::ostream& err)
    : session_(session), in_(in), out_(out), err_(err)
    , saved_out_(session.output_callback())
    , saved_err_(session.error_callback())
{
    session_.set_output_callback([this](const std::string& text) { out_ << text; });
    session_.set_error_callback([this](const std::string& text) { err_ << text; });
}

InteractiveRunner::~InteractiveRunner() {
    session_.set_output_callback(std::move(saved_out_));
    session_.set_error_callback(std::move(saved_err_));
}

int InteractiveRunner::run() {
    while (session_.is_running()) {
        out_ << session_.prompt() << std::flush;

        std::string line;
        if (!std::getline(in_, line)) {
            out_ << '\n';
            break;
        }

        CommandResult result = session_.submit(line);
        if (!result.ok()) {
            err_ << format_failure(result) << '\n';
        } else if (!result.output.empty()) {
            out_ << result.output << '\n';
        }
        out_.flush();
    }

    vfsh_core::shell_logger()->debug("Interactive session finished ({} commands)",
        session_.stats().commands_executed);
    return 0;
}

// =============================================================================
// ScriptRunner
// =============================================================================

ScriptRunner::ScriptRunner(Session& session, std::ostream& out, std::ostream& err)
    : ScriptRunner(session,
                   [&out](const std::string& text) { out << text; },
                   [&err](const std::string& text) { err << text; })
{
}

ScriptRunner::ScriptRunner(Session& session, OutputCallback out, ErrorCallback err)
    : session_(session)
    , out_(std::move(out))
    , err_(std::move(err))
    , saved_out_(session.output_callback())
    , saved_err_(session.error_callback())
    , echo_(session.config().echo_script)
{
    session_.set_output_callback(out_);
    session_.set_error_callback(err_);
}

ScriptRunner::~ScriptRunner() {
    session_.set_output_callback(std::move(saved_out_));
    session_.set_error_callback(std::move(saved_err_));
}

Result<ScriptReport> ScriptRunner::run_file(const std::string& path) {
    std::error_code ec;
    std::ifstream file;
    if (std::filesystem::is_regular_file(path, ec)) {
        file.open(path);
    }

    if (!file.is_open()) {
        emit(err_, "Script file not found: " + path + "\n");
        return Err<ScriptReport>(LoadError::io(path, "Script file not found"));
    }

    if (auto entered = session_.enter_script(path); !entered) {
        return Err<ScriptReport>(entered.error());
    }
    ActiveScript active(session_);

    vfsh_core::shell_logger()->info("Running script {}", path);
    ScriptReport report = run_stream(file);
    vfsh_core::shell_logger()->info("Script {} done: {} lines, {} failed", path,
        report.lines_executed, report.lines_failed);
    return report;
}

ScriptReport ScriptRunner::run_string(const std::string& text) {
    std::istringstream in(text);
    return run_stream(in);
}

ScriptReport ScriptRunner::run_stream(std::istream& in) {
    ScriptReport report;
    std::string pending;
    std::size_t start_line = 0;
    std::size_t line_number = 0;

    std::string raw;
    while (std::getline(in, raw)) {
        ++line_number;
        if (!session_.is_running()) {
            break;
        }

        std::string line = trim(raw);
        if (pending.empty()) {
            if (line.empty() || line.front() == '#') {
                continue;
            }
            start_line = line_number;
        }

        if (!line.empty() && line.back() == '\\') {
            line.pop_back();
            pending += line;
            continue;
        }

        pending += line;
        std::string command = trim(pending);
        pending.clear();
        if (!command.empty()) {
            run_line(command, start_line, report);
        }
    }

    // A continuation on the last line still runs
    std::string command = trim(pending);
    if (!command.empty() && session_.is_running()) {
        run_line(command, start_line, report);
    }

    report.exited = !session_.is_running();
    return report;
}

void ScriptRunner::run_line(const std::string& command, std::size_t line_number, ScriptReport& report) {
    if (echo_) {
        emit(out_, session_.prompt() + command + "\n");
    }

    CommandResult result = session_.submit(command);
    ++report.lines_executed;

    if (!result.ok()) {
        ++report.lines_failed;
        emit(err_, "Error on line " + std::to_string(line_number) + ": " + result.error_message + "\n");
    } else if (!result.output.empty()) {
        emit(out_, result.output + "\n");
    }
}

} // namespace vfsh_shell
