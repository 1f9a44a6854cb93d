#include "loader.hpp"

#include <doctest.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace gogrep;

namespace fs = std::filesystem;

namespace {

// Temporary GOPATH-like tree, removed again on destruction.
struct TempTree {
    fs::path root;

    TempTree() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() / fmt::format("gogrep_loader_{}", stamp);
        fs::create_directories(root);
    }

    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string
    write(const std::string& relative, const std::string& contents) const {
        auto path = root / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path.string();
    }

    std::string
    path(const std::string& relative) const {
        return (root / relative).string();
    }
};

std::vector<std::string>
file_names(const std::vector<SyntaxTree>& trees) {
    std::vector<std::string> names;
    for (const auto& tree : trees) {
        names.push_back(fs::path(tree.filename).filename().string());
    }
    return names;
}

using Names = std::vector<std::string>;

}  // namespace

TEST_CASE("loader") {
    TempTree tree;
    tree.write("proj/a.go", "package a\n\nimport \"example.com/dep\"\n\nfunc A() { dep.D() }\n");
    tree.write("proj/b.go", "package a\n\nimport \"fmt\"\n\nfunc B() { fmt.Println() }\n");
    tree.write("proj/a_test.go", "package a\nfunc (\n");
    tree.write("proj/_skip.go", "package a\nfunc (\n");
    tree.write("proj/.hidden.go", "package a\nfunc (\n");
    tree.write("proj/notes.txt", "not go");
    tree.write("proj/sub/c.go", "package sub\n");
    tree.write("proj/testdata/bad.go", "package bad\nfunc (\n");
    tree.write("proj/vendor/example.com/dep/dep.go", "package dep\n\nfunc D() {}\n");

    LoaderOptions options;

    SUBCASE("directory") {
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("proj")}, false, options, trees, result));
        REQUIRE(result.is_ok());
        REQUIRE(file_names(trees) == Names{"a.go", "b.go"});
        REQUIRE(trees[0].file->kind == NodeKind::File);
    }

    SUBCASE("single_file") {
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("proj/b.go")}, false, options, trees, result));
        REQUIRE(file_names(trees) == Names{"b.go"});
        REQUIRE(trees[0].filename == tree.path("proj/b.go"));
    }

    SUBCASE("files_are_loaded_once") {
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("proj/a.go"), tree.path("proj")}, false, options, trees, result));
        REQUIRE(file_names(trees) == Names{"a.go", "b.go"});
    }

    SUBCASE("tree") {
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("proj") + "/..."}, false, options, trees, result));
        REQUIRE(file_names(trees) == Names{"a.go", "b.go", "c.go"});
    }

    SUBCASE("recursive_uses_vendor") {
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("proj")}, true, options, trees, result));
        REQUIRE(file_names(trees) == Names{"a.go", "b.go", "dep.go"});
    }

    SUBCASE("recursive_uses_gopath") {
        tree.write("gopath/src/example.org/lib/lib.go", "package lib\n\nimport \"example.org/lib/inner\"\n");
        tree.write("gopath/src/example.org/lib/inner/inner.go", "package inner\n");
        tree.write("app/main.go", "package main\n\nimport (\n\t\"os\"\n\t\"example.org/lib\"\n)\n");
        options.gopath = {tree.path("missing"), tree.path("gopath")};

        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("app")}, true, options, trees, result));
        REQUIRE(file_names(trees) == Names{"main.go", "lib.go", "inner.go"});
    }

    SUBCASE("recursive_uses_goroot") {
        tree.write("goroot/src/example.org/lib/lib.go", "package lib\n");
        tree.write("app/main.go", "package main\n\nimport \"example.org/lib\"\n");
        options.goroot = tree.path("goroot");

        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("app")}, true, options, trees, result));
        REQUIRE(file_names(trees) == Names{"main.go", "lib.go"});
    }

    SUBCASE("missing_path") {
        std::vector<SyntaxTree> trees;
        LoadResult result;
        auto missing = tree.path("nope");
        REQUIRE_FALSE(load_untyped({missing}, false, options, trees, result));
        REQUIRE(result.kind == ErrorKind::Load);
        REQUIRE(result.error == missing + ": no such file or directory");
    }

    SUBCASE("syntax_error") {
        auto bad = tree.write("broken/x.go", "package p\nvar = 1\n");
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE_FALSE(load_untyped({tree.path("broken")}, false, options, trees, result));
        REQUIRE(result.kind == ErrorKind::Load);
        REQUIRE(result.error == bad + ":2:5: expected 'IDENT', found '='");
    }

    SUBCASE("unresolved_import") {
        tree.write("app/main.go", "package main\n\nimport \"example.net/missing\"\n");
        std::vector<SyntaxTree> trees;
        LoadResult result;
        REQUIRE(load_untyped({tree.path("app")}, false, options, trees, result));

        trees.clear();
        REQUIRE_FALSE(load_untyped({tree.path("app")}, true, options, trees, result));
        REQUIRE(result.error == "cannot find package \"example.net/missing\"");
    }
}

TEST_CASE("loader_options_from_env") {
    auto options = loader_options_from_env();
    // HOME or GOPATH is set in any sane environment
    if (getenv("GOPATH") != nullptr || getenv("HOME") != nullptr) {
        REQUIRE_FALSE(options.gopath.empty());
    }
}

TEST_CASE("read_file") {
    TempTree tree;
    auto path = tree.write("f.txt", "line 1\nline 2\n");
    std::string contents;
    REQUIRE(read_file(path, contents));
    REQUIRE(contents == "line 1\nline 2\n");
    REQUIRE_FALSE(read_file(tree.path("missing.txt"), contents));
}
