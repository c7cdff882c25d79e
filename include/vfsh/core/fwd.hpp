#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vfsh_core module

#include <cstdint>

namespace vfsh_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct VfsError;
struct CommandError;
struct LoadError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace vfsh_core
