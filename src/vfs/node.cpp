/// @file node.cpp
/// @brief Node, File and Directory implementation

#include <vfsh/vfs/node.hpp>

#include <algorithm>

namespace vfsh_vfs {

using vfsh_core::Err;
using vfsh_core::Error;
using vfsh_core::Ok;
using vfsh_core::Result;
using vfsh_core::VfsError;

// =============================================================================
// Node
// =============================================================================

Node::Node(NodeKind kind, std::string name)
    : m_kind(kind)
    , m_name(std::move(name))
{
}

std::string Node::absolute_path() const {
    if (!m_parent) {
        return "/";
    }

    std::vector<const std::string*> names;
    for (const Node* node = this; node->m_parent; node = node->m_parent) {
        names.push_back(&node->m_name);
    }

    std::string path;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        path += '/';
        path += **it;
    }
    return path;
}

bool Node::is_ancestor_of(const Node& other) const noexcept {
    for (const Node* node = &other; node; node = node->m_parent) {
        if (node == this) {
            return true;
        }
    }
    return false;
}

File* Node::as_file() noexcept {
    return is_file() ? static_cast<File*>(this) : nullptr;
}

const File* Node::as_file() const noexcept {
    return is_file() ? static_cast<const File*>(this) : nullptr;
}

Directory* Node::as_directory() noexcept {
    return is_directory() ? static_cast<Directory*>(this) : nullptr;
}

const Directory* Node::as_directory() const noexcept {
    return is_directory() ? static_cast<const Directory*>(this) : nullptr;
}

bool Node::is_valid_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string_view::npos;
}

// =============================================================================
// File
// =============================================================================

File::File(std::string name, std::string content)
    : Node(NodeKind::File, std::move(name))
    , m_content(std::move(content))
{
}

std::unique_ptr<Node> File::clone() const {
    return std::make_unique<File>(name(), m_content);
}

// =============================================================================
// Directory
// =============================================================================

Directory::Directory(std::string name)
    : Node(NodeKind::Directory, std::move(name))
{
}

Directory::~Directory() = default;

Result<Node*> Directory::add_child(std::unique_ptr<Node> child) {
    if (!child) {
        return Error(vfsh_core::ErrorCode::InvalidArgument, "Cannot add a null node");
    }
    if (!is_valid_name(child->name())) {
        return Error(VfsError::invalid_name(child->name()));
    }
    if (m_index.count(child->name()) > 0) {
        return Error(VfsError::name_collision(child->name()));
    }

    Node* raw = child.get();
    raw->m_parent = this;
    m_index.emplace(raw->name(), raw);
    m_children.push_back(std::move(child));
    return raw;
}

Result<std::unique_ptr<Node>> Directory::remove_child(const std::string& name) {
    auto index_it = m_index.find(name);
    if (index_it == m_index.end()) {
        return Error(VfsError::path_not_found(name));
    }

    Node* target = index_it->second;
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [target](const std::unique_ptr<Node>& child) { return child.get() == target; });

    std::unique_ptr<Node> detached = std::move(*it);
    m_children.erase(it);
    m_index.erase(index_it);

    detached->m_parent = nullptr;
    return std::move(detached);
}

Result<void> Directory::rename_child(const std::string& name, const std::string& new_name) {
    auto index_it = m_index.find(name);
    if (index_it == m_index.end()) {
        return Err(VfsError::path_not_found(name));
    }
    if (name == new_name) {
        return Ok();
    }
    if (!is_valid_name(new_name)) {
        return Err(VfsError::invalid_name(new_name));
    }
    if (m_index.count(new_name) > 0) {
        return Err(VfsError::name_collision(new_name));
    }

    Node* target = index_it->second;
    m_index.erase(index_it);
    target->m_name = new_name;
    m_index.emplace(new_name, target);
    return Ok();
}

Node* Directory::get_child(const std::string& name) const {
    auto it = m_index.find(name);
    return it != m_index.end() ? it->second : nullptr;
}

std::vector<Node*> Directory::children() const {
    std::vector<Node*> result;
    result.reserve(m_children.size());
    for (const auto& child : m_children) {
        result.push_back(child.get());
    }
    return result;
}

std::unique_ptr<Node> Directory::clone() const {
    auto copy = std::make_unique<Directory>(name());
    for (const auto& child : m_children) {
        // Names are already unique here, so insertion cannot collide
        auto child_copy = child->clone();
        child_copy->m_parent = copy.get();
        copy->m_index.emplace(child_copy->name(), child_copy.get());
        copy->m_children.push_back(std::move(child_copy));
    }
    return copy;
}

} // namespace vfsh_vfs
