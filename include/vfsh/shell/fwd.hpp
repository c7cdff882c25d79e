#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vfsh_shell

#include <vfsh/core/error.hpp>

#include <functional>
#include <string>

namespace vfsh_shell {

// =============================================================================
// Forward Declarations
// =============================================================================

// Types
struct CommandArg;
struct CommandResult;
struct CommandInfo;
struct Invocation;
struct Token;

// Commands
class ICommand;
class CommandRegistry;
class CommandBuilder;
struct CommandContext;

// Parsing and dispatch
class Lexer;
class Parser;
class Dispatcher;

// Session
class Environment;
class User;
class Session;

// Drivers
class InteractiveRunner;
class ScriptRunner;
struct ScriptReport;

// Configuration
struct ShellConfig;

// =============================================================================
// Callback Types
// =============================================================================

/// @brief Output callback for shell output
using OutputCallback = std::function<void(const std::string&)>;

/// @brief Error callback for shell errors
using ErrorCallback = std::function<void(const std::string&)>;

} // namespace vfsh_shell
