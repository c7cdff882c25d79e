#pragma once

/// @file dispatcher.hpp
/// @brief Resolves invocations against the registry and runs them

#include "command.hpp"
#include "parser.hpp"

#include <string_view>

namespace vfsh_shell {

// =============================================================================
// Dispatcher
// =============================================================================

/// @brief Stateless parse + dispatch front end over a CommandRegistry
///
/// Every outcome is a CommandResult: parse failures, unknown commands and
/// exceptions thrown by a command implementation (reported as Internal).
class Dispatcher {
public:
    explicit Dispatcher(CommandRegistry& registry);

    /// @brief Lex and bind a raw line
    [[nodiscard]] vfsh_core::Result<Invocation> parse(std::string_view line) const;

    /// @brief Run a bound invocation
    CommandResult dispatch(const Invocation& invocation, CommandContext& ctx) const;

    /// @brief parse() followed by dispatch()
    CommandResult execute(std::string_view line, CommandContext& ctx) const;

    [[nodiscard]] const CommandRegistry& registry() const { return registry_; }

private:
    CommandRegistry& registry_;
    Parser parser_;
};

} // namespace vfsh_shell
