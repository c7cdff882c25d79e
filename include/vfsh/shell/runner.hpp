#pragma once

/// @file runner.hpp
/// @brief Interactive and script drivers over a Session

#include "fwd.hpp"
#include "types.hpp"

#include <iosfwd>
#include <string>

namespace vfsh_shell {

// =============================================================================
// Rendering
// =============================================================================

/// @brief "<command>: <message>", or the bare message when no command applies
std::string format_failure(const CommandResult& result);

// =============================================================================
// InteractiveRunner
// =============================================================================

/// @brief Read-eval-print loop
///
/// Prints the prompt, reads a line, submits it and renders the result:
/// output to @p out, failures to @p err. Stops on exit or end of input.
/// The session's output callbacks point at the streams until the runner is
/// destroyed, then the previous ones come back.
class InteractiveRunner {
public:
    InteractiveRunner(Session& session, std::istream& in, std::ostream& out, std::ostream& err);
    ~InteractiveRunner();

    InteractiveRunner(const InteractiveRunner&) = delete;
    InteractiveRunner& operator=(const InteractiveRunner&) = delete;

    /// @brief Run until the session ends
    /// @return Process exit code
    int run();

private:
    Session& session_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    OutputCallback saved_out_;
    ErrorCallback saved_err_;
};

// =============================================================================
// ScriptRunner
// =============================================================================

/// @brief Summary of one script run
struct ScriptReport {
    std::size_t lines_executed = 0;
    std::size_t lines_failed = 0;
    bool exited = false;  // Session ended during the script
};

/// @brief Batch driver
///
/// Lines are trimmed; blank lines and lines starting with '#' are skipped; a
/// trailing backslash joins the next line. With echo enabled each command is
/// printed after the prompt before it runs. A failing line is reported as
/// "Error on line N: <message>" and the script continues. A file already
/// running further up the stack is refused (see Session::enter_script).
class ScriptRunner {
public:
    ScriptRunner(Session& session, std::ostream& out, std::ostream& err);
    ScriptRunner(Session& session, OutputCallback out, ErrorCallback err);
    ~ScriptRunner();

    ScriptRunner(const ScriptRunner&) = delete;
    ScriptRunner& operator=(const ScriptRunner&) = delete;

    /// @brief Print "<prompt><line>" before each command (defaults to the session config)
    void set_echo(bool echo) { echo_ = echo; }

    /// @brief Run a script file
    /// @return IoError if the file cannot be read, InvalidOperation if it is already running
    [[nodiscard]] vfsh_core::Result<ScriptReport> run_file(const std::string& path);

    /// @brief Run script text held in memory
    ScriptReport run_string(const std::string& text);

private:
    Session& session_;
    OutputCallback out_;
    ErrorCallback err_;
    OutputCallback saved_out_;
    ErrorCallback saved_err_;
    bool echo_ = true;

    ScriptReport run_stream(std::istream& in);
    void run_line(const std::string& command, std::size_t line_number, ScriptReport& report);
};

} // namespace vfsh_shell
