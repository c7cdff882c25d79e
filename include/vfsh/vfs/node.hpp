#pragma once

/// @file node.hpp
/// @brief Node, File and Directory - elements of the virtual filesystem tree
///
/// Ownership model:
/// - A Directory exclusively owns its children (std::unique_ptr)
/// - Every node keeps a raw, non-owning pointer to its parent Directory
/// - Destroying a Directory destroys its whole subtree
///
/// Children are kept in insertion order so listings are deterministic.

#include <vfsh/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vfsh_vfs {

class Directory;
class File;
class FileSystemTree;

// =============================================================================
// Node
// =============================================================================

/// @brief Node variant tag
enum class NodeKind : std::uint8_t {
    File,
    Directory,
};

/// @brief Abstract tree element
class Node {
public:
    virtual ~Node() = default;

    // Non-copyable, non-movable (identity matters, use clone())
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;

    [[nodiscard]] NodeKind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool is_file() const noexcept { return m_kind == NodeKind::File; }
    [[nodiscard]] bool is_directory() const noexcept { return m_kind == NodeKind::Directory; }

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// @brief Owning directory, nullptr for a detached node or the root
    [[nodiscard]] Directory* parent() const noexcept { return m_parent; }

    /// @brief Join of names from the root, "/" for the root itself
    [[nodiscard]] std::string absolute_path() const;

    /// @brief True if this node is @p other or one of its ancestors
    [[nodiscard]] bool is_ancestor_of(const Node& other) const noexcept;

    /// @brief Deep copy, detached from any parent
    [[nodiscard]] virtual std::unique_ptr<Node> clone() const = 0;

    [[nodiscard]] File* as_file() noexcept;
    [[nodiscard]] const File* as_file() const noexcept;
    [[nodiscard]] Directory* as_directory() noexcept;
    [[nodiscard]] const Directory* as_directory() const noexcept;

    /// @brief Check a candidate node name (non-empty, no '/', not "." or "..")
    [[nodiscard]] static bool is_valid_name(std::string_view name) noexcept;

protected:
    Node(NodeKind kind, std::string name);

private:
    friend class Directory;
    friend class FileSystemTree;

    NodeKind m_kind;
    std::string m_name;
    Directory* m_parent = nullptr;
};

// =============================================================================
// File
// =============================================================================

/// @brief Leaf node holding opaque byte content
class File final : public Node {
public:
    explicit File(std::string name, std::string content = {});

    /// @brief Raw content bytes
    [[nodiscard]] const std::string& read() const noexcept { return m_content; }

    /// @brief Replace the whole content
    void write(std::string content) { m_content = std::move(content); }

    /// @brief Truncate to empty
    void clear() noexcept { m_content.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return m_content.size(); }

    [[nodiscard]] std::unique_ptr<Node> clone() const override;

private:
    std::string m_content;
};

// =============================================================================
// Directory
// =============================================================================

/// @brief Interior node owning an ordered set of uniquely named children
class Directory final : public Node {
public:
    explicit Directory(std::string name);
    ~Directory() override;

    /// @brief Take ownership of @p child and append it
    /// @return Non-owning pointer to the inserted child, NameCollision on duplicate name
    [[nodiscard]] vfsh_core::Result<Node*> add_child(std::unique_ptr<Node> child);

    /// @brief Detach a child and hand its ownership back to the caller
    [[nodiscard]] vfsh_core::Result<std::unique_ptr<Node>> remove_child(const std::string& name);

    /// @brief Rename a child in place, keeping its position
    [[nodiscard]] vfsh_core::Result<void> rename_child(const std::string& name, const std::string& new_name);

    /// @brief Lookup by name, nullptr if absent
    [[nodiscard]] Node* get_child(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const { return m_index.count(name) > 0; }

    /// @brief Children in insertion order
    [[nodiscard]] std::vector<Node*> children() const;

    [[nodiscard]] std::size_t child_count() const noexcept { return m_children.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_children.empty(); }

    /// @brief Visit children in insertion order
    template<typename F>
    void for_each_child(F&& func) const {
        for (const auto& child : m_children) {
            func(*child);
        }
    }

    [[nodiscard]] std::unique_ptr<Node> clone() const override;

private:
    std::vector<std::unique_ptr<Node>> m_children;
    std::unordered_map<std::string, Node*> m_index;
};

} // namespace vfsh_vfs
