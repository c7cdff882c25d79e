/// @file tree.cpp
/// @brief FileSystemTree implementation

#include <vfsh/vfs/tree.hpp>
#include <vfsh/core/log.hpp>

#include <algorithm>

namespace vfsh_vfs {

using vfsh_core::Err;
using vfsh_core::Error;
using vfsh_core::ErrorCode;
using vfsh_core::Ok;
using vfsh_core::Result;
using vfsh_core::VfsError;

namespace {

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t pos = 0;

    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            segments.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }

    return segments;
}

std::size_t count_nodes(const Node& node) {
    std::size_t count = 1;
    if (const auto* dir = node.as_directory()) {
        dir->for_each_child([&count](const Node& child) {
            count += count_nodes(child);
        });
    }
    return count;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

FileSystemTree::FileSystemTree()
    : m_root(std::make_unique<Directory>("/"))
{
}

FileSystemTree::FileSystemTree(std::unique_ptr<Directory> root)
    : m_root(root ? std::move(root) : std::make_unique<Directory>("/"))
{
}

FileSystemTree::~FileSystemTree() = default;

// =============================================================================
// Lookup
// =============================================================================

Result<Node*> FileSystemTree::resolve(std::string_view path, Directory& from) const {
    Node* current = &from;
    if (!path.empty() && path.front() == '/') {
        current = m_root.get();
    }

    for (std::string_view segment : split_segments(path)) {
        Directory* dir = current->as_directory();
        if (!dir) {
            return Error(VfsError::not_a_directory(std::string(path)));
        }

        if (segment == ".") {
            continue;
        }

        if (segment == "..") {
            // The root is its own parent
            current = dir->parent() ? static_cast<Node*>(dir->parent()) : dir;
            continue;
        }

        Node* child = dir->get_child(std::string(segment));
        if (!child) {
            return Error(VfsError::path_not_found(std::string(path)));
        }
        current = child;
    }

    return current;
}

Result<Node*> FileSystemTree::resolve(std::string_view path) const {
    return resolve(path, *m_root);
}

Result<Directory*> FileSystemTree::change_directory(std::string_view path, Directory& from) const {
    auto resolved = resolve(path, from);
    if (!resolved) {
        return resolved.error();
    }

    Directory* dir = resolved.value()->as_directory();
    if (!dir) {
        return Error(VfsError::not_a_directory(std::string(path)));
    }
    return dir;
}

std::vector<Node*> FileSystemTree::list(const Directory& dir) const {
    return dir.children();
}

Result<std::vector<Node*>> FileSystemTree::list(std::string_view path, Directory& from) const {
    auto dir = change_directory(path, from);
    if (!dir) {
        return dir.error();
    }
    return list(*dir.value());
}

bool FileSystemTree::exists(std::string_view path, Directory& from) const {
    return resolve(path, from).is_ok();
}

std::size_t FileSystemTree::node_count() const {
    return count_nodes(*m_root);
}

// =============================================================================
// Mutation
// =============================================================================

Result<void> FileSystemTree::remove(std::string_view path, Directory& from) {
    auto resolved = resolve(path, from);
    if (!resolved) {
        return resolved.error();
    }

    Node* node = resolved.value();
    if (node == m_root.get()) {
        return Err(VfsError::invalid_operation(std::string(path), "Cannot remove root directory"));
    }
    if (node->is_ancestor_of(from)) {
        return Err(VfsError::invalid_operation(std::string(path),
            "Cannot remove the current directory or one of its parents"));
    }

    std::string absolute = node->absolute_path();
    auto detached = node->parent()->remove_child(node->name());
    if (!detached) {
        return detached.error();
    }

    vfsh_core::vfs_logger()->debug("Removed {} ({} nodes)", absolute, count_nodes(*detached.value()));
    return Ok();
}

Result<void> FileSystemTree::rename(Node& node, const std::string& new_name) {
    Directory* parent = node.parent();
    if (!parent) {
        return Err(VfsError::invalid_operation(node.absolute_path(), "Cannot rename root directory"));
    }

    std::string current = node.name();
    return parent->rename_child(current, new_name);
}

Result<Node*> FileSystemTree::clone(const Node& node, Directory& new_parent) {
    return new_parent.add_child(node.clone());
}

Result<std::pair<Directory*, std::string>>
FileSystemTree::resolve_new_entry(std::string_view path, Directory& from) const {
    auto [parent_path, name] = split_parent(path);
    if (!Node::is_valid_name(name)) {
        return Error(VfsError::invalid_name(name));
    }

    if (parent_path.empty()) {
        return std::make_pair(&from, name);
    }

    auto parent = change_directory(parent_path, from);
    if (!parent) {
        return parent.error();
    }
    return std::make_pair(parent.value(), name);
}

Result<Directory*> FileSystemTree::make_directory(std::string_view path, Directory& from) {
    if (auto leaf = split_parent(path).second; !Node::is_valid_name(leaf)) {
        return Error(VfsError::invalid_name(leaf));
    }

    auto existing = resolve(path, from);
    if (existing) {
        return Error(VfsError::name_collision(std::string(path)));
    }
    if (existing.error().code() != ErrorCode::PathNotFound) {
        return existing.error();
    }

    auto entry = resolve_new_entry(path, from);
    if (!entry) {
        return entry.error();
    }

    auto& [parent, name] = entry.value();
    auto added = parent->add_child(std::make_unique<Directory>(name));
    if (!added) {
        return added.error();
    }
    return added.value()->as_directory();
}

Result<Node*> FileSystemTree::create_file(std::string_view path, Directory& from) {
    if (auto leaf = split_parent(path).second; !Node::is_valid_name(leaf)) {
        return Error(VfsError::invalid_name(leaf));
    }

    auto existing = resolve(path, from);
    if (existing) {
        return existing;
    }
    if (existing.error().code() != ErrorCode::PathNotFound) {
        return existing.error();
    }

    auto entry = resolve_new_entry(path, from);
    if (!entry) {
        return entry.error();
    }

    auto& [parent, name] = entry.value();
    return parent->add_child(std::make_unique<File>(name));
}

Result<std::pair<Directory*, std::string>>
FileSystemTree::resolve_destination(const Node& source, std::string_view destination, Directory& from) const {
    auto target = resolve(destination, from);
    if (target) {
        if (Directory* dir = target.value()->as_directory()) {
            return std::make_pair(dir, source.name());
        }
        return Error(VfsError::name_collision(std::string(destination)));
    }
    if (target.error().code() != ErrorCode::PathNotFound) {
        return target.error();
    }
    return resolve_new_entry(destination, from);
}

Result<Node*> FileSystemTree::move(std::string_view source, std::string_view destination, Directory& from) {
    auto resolved = resolve(source, from);
    if (!resolved) {
        return resolved.error();
    }

    Node* node = resolved.value();
    Directory* old_parent = node->parent();
    if (!old_parent) {
        return Error(VfsError::invalid_operation(std::string(source), "Cannot move root directory"));
    }

    auto dest = resolve_destination(*node, destination, from);
    if (!dest) {
        return dest.error();
    }

    auto& [target_dir, new_name] = dest.value();
    if (node->is_ancestor_of(*target_dir)) {
        return Error(VfsError::invalid_operation(std::string(source), "Cannot move a directory into itself"));
    }

    // Same parent: a rename keeps the node's position
    if (target_dir == old_parent) {
        auto renamed = rename(*node, new_name);
        if (!renamed) {
            return renamed.error();
        }
        return node;
    }

    if (target_dir->contains(new_name)) {
        return Error(VfsError::name_collision(new_name));
    }

    auto detached = old_parent->remove_child(node->name());
    if (!detached) {
        return detached.error();
    }

    std::unique_ptr<Node> owned = std::move(detached.value());
    owned->m_name = new_name;
    auto added = target_dir->add_child(std::move(owned));
    if (!added) {
        return added.error();
    }

    vfsh_core::vfs_logger()->debug("Moved {} -> {}", source, added.value()->absolute_path());
    return added;
}

Result<Node*> FileSystemTree::copy(std::string_view source, std::string_view destination, Directory& from) {
    auto resolved = resolve(source, from);
    if (!resolved) {
        return resolved.error();
    }

    const Node* node = resolved.value();
    auto dest = resolve_destination(*node, destination, from);
    if (!dest) {
        return dest.error();
    }

    auto& [target_dir, new_name] = dest.value();
    if (node->is_directory() && node->is_ancestor_of(*target_dir)) {
        return Error(VfsError::invalid_operation(std::string(source), "Cannot copy a directory into itself"));
    }
    if (target_dir->contains(new_name)) {
        return Error(VfsError::name_collision(new_name));
    }

    std::unique_ptr<Node> duplicate = node->clone();
    duplicate->m_name = new_name;
    return target_dir->add_child(std::move(duplicate));
}

// =============================================================================
// Rendering
// =============================================================================

std::pair<std::string, std::string> FileSystemTree::split_parent(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }

    std::size_t slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return {std::string(), std::string(path)};
    }
    if (slash == 0) {
        return {"/", std::string(path.substr(1))};
    }
    return {std::string(path.substr(0, slash)), std::string(path.substr(slash + 1))};
}

std::string FileSystemTree::render_tree(const Directory& dir, std::size_t indent) const {
    std::string out;
    render_directory(dir, indent, 0, out);
    if (!out.empty() && out.back() == '\n') {
        out.pop_back();
    }
    return out;
}

void FileSystemTree::render_directory(const Directory& dir, std::size_t indent, std::size_t level,
                                      std::string& out) const {
    out += std::string(indent * level, ' ');
    out += dir.parent() ? dir.name() + "/" : std::string("/");
    out += '\n';

    std::vector<Node*> sorted = dir.children();
    std::sort(sorted.begin(), sorted.end(), [](const Node* a, const Node* b) {
        if (a->is_directory() != b->is_directory()) {
            return a->is_directory();
        }
        return a->name() < b->name();
    });

    for (const Node* child : sorted) {
        if (const auto* sub = child->as_directory()) {
            render_directory(*sub, indent, level + 1, out);
        } else {
            out += std::string(indent * (level + 1), ' ');
            out += child->name();
            out += '\n';
        }
    }
}

} // namespace vfsh_vfs
