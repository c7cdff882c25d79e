/// @file xml_loader.cpp
/// @brief XML VFS loader implementation (libxml2)

#include <vfsh/vfs/xml_loader.hpp>
#include <vfsh/vfs/base64.hpp>
#include <vfsh/core/log.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace vfsh_vfs {

using vfsh_core::Err;
using vfsh_core::Error;
using vfsh_core::LoadError;
using vfsh_core::Ok;
using vfsh_core::Result;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

std::optional<std::string> attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, BAD_CAST name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

bool has_tag(const xmlNode* node, const char* tag) {
    return xmlStrcmp(node->name, BAD_CAST tag) == 0;
}

std::string last_xml_error() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) {
        return "malformed XML";
    }

    std::string message = err->message;
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    if (err->line > 0) {
        message += " (line " + std::to_string(err->line) + ")";
    }
    return message;
}

/// Append the element children of @p element to @p dir, recursing into folders
Result<void> populate(Directory& dir, const xmlNode* element, const std::string& source) {
    for (const xmlNode* child = element->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }

        auto name = attribute(child, "name");
        if (!name || name->empty()) {
            vfsh_core::vfs_logger()->warn("{}:{}: <{}> without a name ignored",
                source, child->line, reinterpret_cast<const char*>(child->name));
            continue;
        }

        std::unique_ptr<Node> node;
        if (has_tag(child, "folder")) {
            auto folder = std::make_unique<Directory>(*name);
            auto filled = populate(*folder, child, source);
            if (!filled) {
                return filled;
            }
            node = std::move(folder);
        } else if (has_tag(child, "file")) {
            std::string encoded = attribute(child, "content").value_or("");
            auto decoded = base64::decode(encoded);
            if (!decoded) {
                vfsh_core::vfs_logger()->warn("{}: content of '{}' is not base64, stored verbatim",
                    source, *name);
            }
            node = std::make_unique<File>(*name, decoded ? std::move(*decoded) : encoded);
        } else {
            vfsh_core::vfs_logger()->warn("{}:{}: unknown element <{}> ignored",
                source, child->line, reinterpret_cast<const char*>(child->name));
            continue;
        }

        auto added = dir.add_child(std::move(node));
        if (!added) {
            return Err(added.error().with_context("source", source));
        }
    }

    return Ok();
}

} // anonymous namespace

Result<std::unique_ptr<FileSystemTree>> XmlLoader::load_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error(LoadError::io(path, "VFS file not found"));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(LoadError::io(path, "Cannot open VFS file"));
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return load_string(ss.str(), path);
}

Result<std::unique_ptr<FileSystemTree>> XmlLoader::load_string(std::string_view xml, const std::string& source_name) {
    if (xml.size() > static_cast<std::size_t>(INT_MAX)) {
        return Error(LoadError::parse(source_name, "document too large"));
    }

    xmlInitParser();
    xmlResetLastError();

    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), source_name.c_str(), nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        return Error(LoadError::parse(source_name, last_xml_error()));
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        return Error(LoadError::parse(source_name, "document has no root element"));
    }

    auto root_dir = std::make_unique<Directory>("/");
    auto filled = populate(*root_dir, root, source_name);
    if (!filled) {
        return filled.error();
    }

    auto tree = std::make_unique<FileSystemTree>(std::move(root_dir));
    vfsh_core::vfs_logger()->info("Loaded {} ({} nodes)", source_name, tree->node_count());
    return std::move(tree);
}

} // namespace vfsh_vfs
