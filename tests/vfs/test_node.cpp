// vfsh_vfs Node, File and Directory tests

#include <catch2/catch.hpp>
#include <vfsh/vfs/node.hpp>

using namespace vfsh_vfs;
using vfsh_core::ErrorCode;

TEST_CASE("File content", "[vfs][node]") {
    File file("notes.txt", "abc");
    REQUIRE(file.is_file());
    REQUIRE_FALSE(file.is_directory());
    REQUIRE(file.read() == "abc");
    REQUIRE(file.size() == 3);

    SECTION("write replaces") {
        file.write("xyz!");
        REQUIRE(file.read() == "xyz!");
    }

    SECTION("clear truncates") {
        file.clear();
        REQUIRE(file.read().empty());
    }

    SECTION("binary content is kept as is") {
        std::string bytes("\0\x01\xff", 3);
        file.write(bytes);
        REQUIRE(file.size() == 3);
        REQUIRE(file.read() == bytes);
    }
}

TEST_CASE("Directory children", "[vfs][node]") {
    Directory root("/");

    SECTION("insertion order is kept") {
        REQUIRE(root.add_child(std::make_unique<Directory>("zeta")).is_ok());
        REQUIRE(root.add_child(std::make_unique<File>("alpha")).is_ok());
        REQUIRE(root.add_child(std::make_unique<File>("mid")).is_ok());

        auto children = root.children();
        REQUIRE(children.size() == 3);
        REQUIRE(children[0]->name() == "zeta");
        REQUIRE(children[1]->name() == "alpha");
        REQUIRE(children[2]->name() == "mid");
    }

    SECTION("duplicate names are rejected") {
        REQUIRE(root.add_child(std::make_unique<File>("a")).is_ok());
        auto dup = root.add_child(std::make_unique<Directory>("a"));
        REQUIRE(dup.is_err());
        REQUIRE(dup.error().code() == ErrorCode::NameCollision);
        REQUIRE(root.child_count() == 1);
    }

    SECTION("names are case sensitive") {
        REQUIRE(root.add_child(std::make_unique<File>("readme")).is_ok());
        REQUIRE(root.add_child(std::make_unique<File>("README")).is_ok());
        REQUIRE(root.child_count() == 2);
    }

    SECTION("invalid names are rejected") {
        REQUIRE(root.add_child(std::make_unique<File>("")).is_err());
        REQUIRE(root.add_child(std::make_unique<File>("a/b")).is_err());
        REQUIRE(root.add_child(std::make_unique<File>("..")).is_err());
        REQUIRE(root.empty());
    }

    SECTION("parent is set on insertion and cleared on removal") {
        auto added = root.add_child(std::make_unique<File>("f"));
        REQUIRE(added.is_ok());
        REQUIRE(added.value()->parent() == &root);

        auto removed = root.remove_child("f");
        REQUIRE(removed.is_ok());
        REQUIRE(removed.value()->parent() == nullptr);
        REQUIRE(root.get_child("f") == nullptr);
        REQUIRE_FALSE(root.contains("f"));
    }

    SECTION("removing a missing child fails") {
        auto removed = root.remove_child("ghost");
        REQUIRE(removed.is_err());
        REQUIRE(removed.error().code() == ErrorCode::PathNotFound);
    }

    SECTION("rename keeps position") {
        REQUIRE(root.add_child(std::make_unique<File>("a")).is_ok());
        REQUIRE(root.add_child(std::make_unique<File>("b")).is_ok());
        REQUIRE(root.rename_child("a", "c").is_ok());

        auto children = root.children();
        REQUIRE(children[0]->name() == "c");
        REQUIRE(root.get_child("a") == nullptr);
        REQUIRE(root.get_child("c") == children[0]);
    }

    SECTION("rename onto a sibling collides") {
        REQUIRE(root.add_child(std::make_unique<File>("a")).is_ok());
        REQUIRE(root.add_child(std::make_unique<File>("b")).is_ok());
        auto renamed = root.rename_child("a", "b");
        REQUIRE(renamed.is_err());
        REQUIRE(renamed.error().code() == ErrorCode::NameCollision);
    }
}

TEST_CASE("Node absolute path", "[vfs][node]") {
    Directory root("/");
    auto home = root.add_child(std::make_unique<Directory>("home"));
    REQUIRE(home.is_ok());
    auto file = home.value()->as_directory()->add_child(std::make_unique<File>("hello.txt"));
    REQUIRE(file.is_ok());

    REQUIRE(root.absolute_path() == "/");
    REQUIRE(home.value()->absolute_path() == "/home");
    REQUIRE(file.value()->absolute_path() == "/home/hello.txt");

    REQUIRE(root.is_ancestor_of(*file.value()));
    REQUIRE(home.value()->is_ancestor_of(*home.value()));
    REQUIRE_FALSE(file.value()->is_ancestor_of(root));
}

TEST_CASE("Node clone", "[vfs][node]") {
    Directory src("src");
    auto sub = src.add_child(std::make_unique<Directory>("sub"));
    REQUIRE(sub.is_ok());
    REQUIRE(sub.value()->as_directory()->add_child(std::make_unique<File>("f", "data")).is_ok());

    auto copy = src.clone();
    Directory* copy_dir = copy->as_directory();
    REQUIRE(copy_dir != nullptr);
    REQUIRE(copy_dir->parent() == nullptr);
    REQUIRE(copy_dir->name() == "src");

    Node* copy_sub = copy_dir->get_child("sub");
    REQUIRE(copy_sub != nullptr);
    REQUIRE(copy_sub != sub.value());
    REQUIRE(copy_sub->parent() == copy_dir);

    File* copy_file = copy_sub->as_directory()->get_child("f")->as_file();
    REQUIRE(copy_file->read() == "data");

    copy_file->write("changed");
    REQUIRE(sub.value()->as_directory()->get_child("f")->as_file()->read() == "data");
}

TEST_CASE("Node name validation", "[vfs][node]") {
    REQUIRE(Node::is_valid_name("file.txt"));
    REQUIRE(Node::is_valid_name(".hidden"));
    REQUIRE_FALSE(Node::is_valid_name(""));
    REQUIRE_FALSE(Node::is_valid_name("."));
    REQUIRE_FALSE(Node::is_valid_name(".."));
    REQUIRE_FALSE(Node::is_valid_name("a/b"));
}
