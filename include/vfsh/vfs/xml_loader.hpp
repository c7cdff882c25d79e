#pragma once

/// @file xml_loader.hpp
/// @brief Builds a FileSystemTree from an XML description
///
/// Format:
/// ```xml
/// <filesystem>
///   <folder name="home">
///     <file name="hello.txt" content="SGVsbG8gV29ybGQh"/>
///   </folder>
///   <file name="LICENSE" content="..."/>
/// </filesystem>
/// ```
/// Children of the document element become children of "/". File content is
/// base64; content that does not decode is stored verbatim.

#include "tree.hpp"

#include <vfsh/core/error.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace vfsh_vfs {

/// @brief XML + base64 VFS loader
class XmlLoader {
public:
    /// @brief Parse the file at @p path
    /// @return IoError if unreadable, ParseError if malformed, NameCollision on duplicate siblings
    [[nodiscard]] static vfsh_core::Result<std::unique_ptr<FileSystemTree>>
    load_file(const std::string& path);

    /// @brief Parse an in-memory document; @p source_name is used in messages
    [[nodiscard]] static vfsh_core::Result<std::unique_ptr<FileSystemTree>>
    load_string(std::string_view xml, const std::string& source_name = "<memory>");
};

} // namespace vfsh_vfs
