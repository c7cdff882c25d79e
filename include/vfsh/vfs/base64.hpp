#pragma once

/// @file base64.hpp
/// @brief Base64 decoding for file content embedded in VFS descriptions

#include <optional>
#include <string>
#include <string_view>

namespace vfsh_vfs::base64 {

/// @brief Decode standard (RFC 4648) base64 into raw bytes
///
/// ASCII whitespace is skipped. Returns std::nullopt for characters outside
/// the alphabet, misplaced padding, or a length that is not a multiple of 4.
[[nodiscard]] std::optional<std::string> decode(std::string_view encoded);

} // namespace vfsh_vfs::base64
