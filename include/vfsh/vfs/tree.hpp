#pragma once

/// @file tree.hpp
/// @brief FileSystemTree - path resolution and structural mutation of the VFS
///
/// Paths use '/' as separator. A leading '/' starts at the root, anything else
/// is relative to a caller-supplied directory. "." is a no-op and ".." moves to
/// the parent; ".." at the root stays at the root. Empty segments are ignored.

#include "node.hpp"

#include <vfsh/core/error.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vfsh_vfs {

// =============================================================================
// FileSystemTree
// =============================================================================

/// @brief Single-rooted tree of Nodes owned through its root Directory
///
/// Usage:
/// ```cpp
/// FileSystemTree tree;
/// auto home = tree.make_directory("/home", tree.root());
/// auto file = tree.create_file("/home/notes.txt", tree.root());
/// auto node = tree.resolve("home/../home/notes.txt", tree.root());
/// ```
class FileSystemTree {
public:
    /// @brief Empty tree containing only the root
    FileSystemTree();

    /// @brief Adopt an already built root directory
    explicit FileSystemTree(std::unique_ptr<Directory> root);

    ~FileSystemTree();

    // Non-copyable, non-movable (Nodes are referenced by raw pointer)
    FileSystemTree(const FileSystemTree&) = delete;
    FileSystemTree& operator=(const FileSystemTree&) = delete;
    FileSystemTree(FileSystemTree&&) = delete;
    FileSystemTree& operator=(FileSystemTree&&) = delete;

    [[nodiscard]] Directory& root() noexcept { return *m_root; }
    [[nodiscard]] const Directory& root() const noexcept { return *m_root; }

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    /// @brief Resolve @p path starting at @p from
    /// @return PathNotFound if a segment is missing, NotADirectory if a File
    ///         appears before the last segment
    [[nodiscard]] vfsh_core::Result<Node*> resolve(std::string_view path, Directory& from) const;

    /// @brief Resolve @p path starting at the root
    [[nodiscard]] vfsh_core::Result<Node*> resolve(std::string_view path) const;

    /// @brief Resolve and require a Directory
    [[nodiscard]] vfsh_core::Result<Directory*> change_directory(std::string_view path, Directory& from) const;

    /// @brief Children of @p dir in insertion order
    [[nodiscard]] std::vector<Node*> list(const Directory& dir) const;

    /// @brief Children of the directory at @p path
    [[nodiscard]] vfsh_core::Result<std::vector<Node*>> list(std::string_view path, Directory& from) const;

    [[nodiscard]] bool exists(std::string_view path, Directory& from) const;

    /// @brief Total number of nodes, root included
    [[nodiscard]] std::size_t node_count() const;

    // -------------------------------------------------------------------------
    // Mutation
    // -------------------------------------------------------------------------

    /// @brief Detach and destroy the node at @p path (recursive for directories)
    ///
    /// The root, and any directory containing @p from, cannot be removed.
    [[nodiscard]] vfsh_core::Result<void> remove(std::string_view path, Directory& from);

    /// @brief Rename @p node within its parent
    [[nodiscard]] vfsh_core::Result<void> rename(Node& node, const std::string& new_name);

    /// @brief Deep copy @p node and insert the copy under @p new_parent
    [[nodiscard]] vfsh_core::Result<Node*> clone(const Node& node, Directory& new_parent);

    /// @brief Create an empty directory; the parent must exist
    [[nodiscard]] vfsh_core::Result<Directory*> make_directory(std::string_view path, Directory& from);

    /// @brief Create an empty file; an existing node at @p path is returned unchanged
    [[nodiscard]] vfsh_core::Result<Node*> create_file(std::string_view path, Directory& from);

    /// @brief Move @p source into the directory @p destination, or to the new
    ///        name @p destination when it does not exist yet
    [[nodiscard]] vfsh_core::Result<Node*> move(std::string_view source, std::string_view destination,
                                                Directory& from);

    /// @brief Deep copy with the same destination rules as move()
    [[nodiscard]] vfsh_core::Result<Node*> copy(std::string_view source, std::string_view destination,
                                                Directory& from);

    // -------------------------------------------------------------------------
    // Rendering
    // -------------------------------------------------------------------------

    /// @brief Unix tree style listing, directories first, both groups sorted by name
    [[nodiscard]] std::string render_tree(const Directory& dir, std::size_t indent = 2) const;

    /// @brief Split "a/b/c" into {"a/b", "c"}; trailing slashes are ignored
    [[nodiscard]] static std::pair<std::string, std::string> split_parent(std::string_view path);

private:
    /// Parent directory and leaf name for a node about to be created
    [[nodiscard]] vfsh_core::Result<std::pair<Directory*, std::string>>
    resolve_new_entry(std::string_view path, Directory& from) const;

    /// Target directory and name for move/copy
    [[nodiscard]] vfsh_core::Result<std::pair<Directory*, std::string>>
    resolve_destination(const Node& source, std::string_view destination, Directory& from) const;

    void render_directory(const Directory& dir, std::size_t indent, std::size_t level,
                          std::string& out) const;

    std::unique_ptr<Directory> m_root;
};

} // namespace vfsh_vfs
