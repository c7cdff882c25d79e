// vfsh_vfs FileSystemTree tests

#include <catch2/catch.hpp>
#include <vfsh/vfs/tree.hpp>

using namespace vfsh_vfs;
using vfsh_core::ErrorCode;

namespace {

/// root{home{hello.txt="Hello World!"}, LICENSE}
void populate(FileSystemTree& tree) {
    Directory& root = tree.root();
    auto home = root.add_child(std::make_unique<Directory>("home"));
    REQUIRE(home.is_ok());
    REQUIRE(home.value()->as_directory()->add_child(
        std::make_unique<File>("hello.txt", "Hello World!")).is_ok());
    REQUIRE(root.add_child(std::make_unique<File>("LICENSE", "MIT\n")).is_ok());
}

} // anonymous namespace

TEST_CASE("Tree path resolution", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);
    Directory& root = tree.root();
    Directory* home = root.get_child("home")->as_directory();

    SECTION("absolute and relative paths") {
        auto abs = tree.resolve("/home/hello.txt", root);
        REQUIRE(abs.is_ok());
        REQUIRE(abs.value()->name() == "hello.txt");

        auto rel = tree.resolve("hello.txt", *home);
        REQUIRE(rel.is_ok());
        REQUIRE(rel.value() == abs.value());
    }

    SECTION("dot segments") {
        auto node = tree.resolve("./home/../home/./hello.txt", root);
        REQUIRE(node.is_ok());
        REQUIRE(node.value()->absolute_path() == "/home/hello.txt");
    }

    SECTION("dot dot at root stays at root") {
        auto node = tree.resolve("../../..", root);
        REQUIRE(node.is_ok());
        REQUIRE(node.value() == &root);
    }

    SECTION("repeated slashes are ignored") {
        auto node = tree.resolve("//home///hello.txt", root);
        REQUIRE(node.is_ok());
    }

    SECTION("empty path is the starting directory") {
        auto node = tree.resolve("", *home);
        REQUIRE(node.is_ok());
        REQUIRE(node.value() == home);
    }

    SECTION("missing segment") {
        auto node = tree.resolve("/home/missing.txt", root);
        REQUIRE(node.is_err());
        REQUIRE(node.error().code() == ErrorCode::PathNotFound);
    }

    SECTION("file in the middle of a path") {
        auto node = tree.resolve("/LICENSE/x", root);
        REQUIRE(node.is_err());
        REQUIRE(node.error().code() == ErrorCode::NotADirectory);
    }

    SECTION("absolute path of every node resolves back to it") {
        for (Node* child : tree.list(*home)) {
            auto again = tree.resolve(child->absolute_path());
            REQUIRE(again.is_ok());
            REQUIRE(again.value() == child);
        }
        REQUIRE(tree.resolve(home->absolute_path()).value() == home);
    }
}

TEST_CASE("Tree change directory and listing", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);
    Directory& root = tree.root();

    SECTION("cd into a directory") {
        auto dir = tree.change_directory("home", root);
        REQUIRE(dir.is_ok());
        REQUIRE(dir.value()->absolute_path() == "/home");
    }

    SECTION("cd into a file") {
        auto dir = tree.change_directory("LICENSE", root);
        REQUIRE(dir.is_err());
        REQUIRE(dir.error().code() == ErrorCode::NotADirectory);
    }

    SECTION("listing keeps insertion order") {
        auto names = tree.list(root);
        REQUIRE(names.size() == 2);
        REQUIRE(names[0]->name() == "home");
        REQUIRE(names[1]->name() == "LICENSE");
    }

    SECTION("empty directory lists nothing") {
        auto made = tree.make_directory("/empty", root);
        REQUIRE(made.is_ok());
        auto listed = tree.list("/empty", root);
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().empty());
    }

    SECTION("listing a file fails") {
        auto listed = tree.list("/LICENSE", root);
        REQUIRE(listed.is_err());
        REQUIRE(listed.error().code() == ErrorCode::NotADirectory);
    }

    SECTION("node count includes the root") {
        REQUIRE(tree.node_count() == 4);
    }
}

TEST_CASE("Tree removal", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);
    Directory& root = tree.root();

    SECTION("remove then resolve fails") {
        REQUIRE(tree.remove("/home/hello.txt", root).is_ok());
        auto node = tree.resolve("/home/hello.txt");
        REQUIRE(node.is_err());
        REQUIRE(node.error().code() == ErrorCode::PathNotFound);
    }

    SECTION("directories are removed recursively") {
        REQUIRE(tree.remove("home", root).is_ok());
        REQUIRE(tree.node_count() == 2);
    }

    SECTION("missing path leaves the tree unchanged") {
        auto removed = tree.remove("/nope", root);
        REQUIRE(removed.is_err());
        REQUIRE(removed.error().code() == ErrorCode::PathNotFound);
        REQUIRE(tree.node_count() == 4);
    }

    SECTION("root cannot be removed") {
        auto removed = tree.remove("/", root);
        REQUIRE(removed.is_err());
        REQUIRE(removed.error().code() == ErrorCode::InvalidOperation);
    }

    SECTION("current directory and its parents cannot be removed") {
        Directory* home = root.get_child("home")->as_directory();
        auto removed = tree.remove("/home", *home);
        REQUIRE(removed.is_err());
        REQUIRE(removed.error().code() == ErrorCode::InvalidOperation);
        REQUIRE(tree.remove(".", *home).is_err());
    }
}

TEST_CASE("Tree rename and clone", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);
    Directory& root = tree.root();
    Node* license = root.get_child("LICENSE");

    SECTION("rename") {
        REQUIRE(tree.rename(*license, "COPYING").is_ok());
        REQUIRE(tree.resolve("/COPYING").value() == license);
    }

    SECTION("rename collision") {
        auto renamed = tree.rename(*license, "home");
        REQUIRE(renamed.is_err());
        REQUIRE(renamed.error().code() == ErrorCode::NameCollision);
    }

    SECTION("rename root is invalid") {
        REQUIRE(tree.rename(root, "x").is_err());
    }

    SECTION("clone into another directory") {
        Directory* home = root.get_child("home")->as_directory();
        auto cloned = tree.clone(*license, *home);
        REQUIRE(cloned.is_ok());
        REQUIRE(cloned.value() != license);
        REQUIRE(cloned.value()->absolute_path() == "/home/LICENSE");
        REQUIRE(cloned.value()->as_file()->read() == "MIT\n");

        cloned.value()->as_file()->write("changed");
        REQUIRE(license->as_file()->read() == "MIT\n");
    }

    SECTION("clone into the same directory collides") {
        auto cloned = tree.clone(*license, root);
        REQUIRE(cloned.is_err());
        REQUIRE(cloned.error().code() == ErrorCode::NameCollision);
    }
}

TEST_CASE("Tree creation", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);
    Directory& root = tree.root();

    SECTION("make directory") {
        auto made = tree.make_directory("/home/docs", root);
        REQUIRE(made.is_ok());
        REQUIRE(made.value()->absolute_path() == "/home/docs");
    }

    SECTION("make directory with a missing parent") {
        auto made = tree.make_directory("/a/b", root);
        REQUIRE(made.is_err());
        REQUIRE(made.error().code() == ErrorCode::PathNotFound);
    }

    SECTION("make existing directory") {
        auto made = tree.make_directory("home", root);
        REQUIRE(made.is_err());
        REQUIRE(made.error().code() == ErrorCode::NameCollision);
    }

    SECTION("empty or dotted names are rejected before lookup") {
        for (const char* path : {"", ".", "..", "home/.."}) {
            auto made = tree.make_directory(path, root);
            REQUIRE(made.is_err());
            REQUIRE(made.error().code() == ErrorCode::InvalidArgument);
        }
        REQUIRE(tree.create_file("", root).error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("create file") {
        auto created = tree.create_file("home/new.txt", root);
        REQUIRE(created.is_ok());
        REQUIRE(created.value()->is_file());
        REQUIRE(created.value()->as_file()->read().empty());
    }

    SECTION("create existing file is a no-op") {
        auto created = tree.create_file("/home/hello.txt", root);
        REQUIRE(created.is_ok());
        REQUIRE(created.value()->as_file()->read() == "Hello World!");
    }
}

TEST_CASE("Tree move and copy", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);
    Directory& root = tree.root();

    SECTION("move into a directory") {
        auto moved = tree.move("LICENSE", "home", root);
        REQUIRE(moved.is_ok());
        REQUIRE(moved.value()->absolute_path() == "/home/LICENSE");
        REQUIRE(tree.resolve("/LICENSE").is_err());
    }

    SECTION("move to a new name") {
        auto moved = tree.move("/home/hello.txt", "/greeting.txt", root);
        REQUIRE(moved.is_ok());
        REQUIRE(tree.resolve("/greeting.txt").value()->as_file()->read() == "Hello World!");
        REQUIRE(tree.list(root).back()->name() == "greeting.txt");
    }

    SECTION("rename in place keeps position") {
        REQUIRE(tree.move("home", "users", root).is_ok());
        REQUIRE(tree.list(root).front()->name() == "users");
    }

    SECTION("move onto an existing file collides") {
        REQUIRE(tree.create_file("/home/LICENSE", root).is_ok());
        auto moved = tree.move("LICENSE", "home", root);
        REQUIRE(moved.is_err());
        REQUIRE(moved.error().code() == ErrorCode::NameCollision);
        REQUIRE(tree.resolve("/LICENSE").is_ok());
    }

    SECTION("move a directory into itself") {
        auto moved = tree.move("/home", "/home", root);
        REQUIRE(moved.is_err());
        REQUIRE(moved.error().code() == ErrorCode::InvalidOperation);
    }

    SECTION("copy a directory") {
        auto copied = tree.copy("home", "backup", root);
        REQUIRE(copied.is_ok());
        REQUIRE(tree.resolve("/backup/hello.txt").is_ok());
        REQUIRE(tree.resolve("/home/hello.txt").is_ok());
        REQUIRE(tree.node_count() == 6);
    }

    SECTION("copy onto an existing name collides") {
        auto copied = tree.copy("LICENSE", "/LICENSE", root);
        REQUIRE(copied.is_err());
        REQUIRE(copied.error().code() == ErrorCode::NameCollision);
    }
}

TEST_CASE("Tree rendering", "[vfs][tree]") {
    FileSystemTree tree;
    populate(tree);

    std::string expected =
        "/\n"
        "  home/\n"
        "    hello.txt\n"
        "  LICENSE";
    REQUIRE(tree.render_tree(tree.root()) == expected);
}

TEST_CASE("Tree split parent", "[vfs][tree]") {
    using Pair = std::pair<std::string, std::string>;
    REQUIRE(FileSystemTree::split_parent("a/b/c") == Pair{"a/b", "c"});
    REQUIRE(FileSystemTree::split_parent("/a") == Pair{"/", "a"});
    REQUIRE(FileSystemTree::split_parent("a") == Pair{"", "a"});
    REQUIRE(FileSystemTree::split_parent("a/b/") == Pair{"a", "b"});
}
