#include "loader.hpp"

#include "syntax/parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

namespace fs = std::filesystem;

using namespace gogrep;

namespace {

namespace L = gogrep::layout;

bool
ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool
is_ignored_name(const std::string& name) {
    return !name.empty() && (name[0] == '.' || name[0] == '_');
}

bool
is_package_file(const fs::path& path) {
    auto name = path.filename().string();
    return ends_with(name, ".go") && !ends_with(name, "_test.go") && !is_ignored_name(name);
}

bool
is_skipped_dir(const fs::path& path) {
    auto name = path.filename().string();
    return name == "testdata" || name == "vendor" || is_ignored_name(name);
}

// Standard library import paths have no dot in their first element.
bool
is_std_import(const std::string& import_path) {
    auto first = import_path.substr(0, import_path.find('/'));
    return first.find('.') == std::string::npos;
}

std::string
unquote(const std::string& lit) {
    if (lit.size() >= 2) {
        return lit.substr(1, lit.size() - 2);
    }
    return lit;
}

std::vector<std::string>
imports_of(const Node& file) {
    std::vector<std::string> imports;
    for (const auto& decl : file.list(L::File::Decls)) {
        if (decl->kind != NodeKind::GenDecl || decl->tok != TokenKind::Import) {
            continue;
        }
        for (const auto& spec : decl->list(L::GenDecl::Specs)) {
            const auto* path = spec->slot(L::ImportSpec::Path);
            if (path) {
                imports.push_back(unquote(path->value));
            }
        }
    }
    return imports;
}

class PackageLoader {
   public:
    PackageLoader(const LoaderOptions& options, std::vector<SyntaxTree>& trees, LoadResult& result)
        : options_(options), trees_(trees), result_(result) {
    }

    bool
    load_path(const std::string& path);

    bool
    load_imports(bool recursive);

   private:
    bool
    load_tree(const std::string& root);

    bool
    load_dir(const fs::path& dir);

    bool
    load_file(const fs::path& file);

    bool
    resolve_import(const std::string& import_path, const fs::path& from_dir, fs::path& dir);

    const LoaderOptions& options_;
    std::vector<SyntaxTree>& trees_;
    LoadResult& result_;

    std::set<fs::path> loaded_files_;
    std::set<fs::path> loaded_dirs_;

    // Packages whose imports haven't been followed yet, with their imports.
    std::deque<std::pair<fs::path, std::vector<std::string>>> pending_;
};

bool
PackageLoader::load_path(const std::string& path) {
    if (path == "..." || ends_with(path, "/...")) {
        auto root = path.size() > 3 ? path.substr(0, path.size() - 4) : std::string(".");
        return load_tree(root.empty() ? "/" : root);
    }

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        result_.set_error(fmt::format("{}: no such file or directory", path));
        return false;
    }
    if (fs::is_directory(status)) {
        return load_dir(path);
    }
    return load_file(path);
}

bool
PackageLoader::load_tree(const std::string& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        result_.set_error(fmt::format("{}: no such directory", root));
        return false;
    }

    std::vector<fs::path> dirs{fs::path(root)};
    auto it = fs::recursive_directory_iterator(root, ec);
    if (ec) {
        result_.set_error(fmt::format("{}: {}", root, ec.message()));
        return false;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            result_.set_error(fmt::format("{}: {}", root, ec.message()));
            return false;
        }
        if (!it->is_directory(ec)) {
            continue;
        }
        if (is_skipped_dir(it->path())) {
            it.disable_recursion_pending();
            continue;
        }
        dirs.push_back(it->path());
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        if (!load_dir(dir)) {
            return false;
        }
    }
    return true;
}

bool
PackageLoader::load_dir(const fs::path& dir) {
    auto key = fs::weakly_canonical(dir);
    if (!loaded_dirs_.insert(key).second) {
        return true;
    }

    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && is_package_file(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        result_.set_error(fmt::format("{}: {}", dir.string(), ec.message()));
        return false;
    }
    std::sort(files.begin(), files.end());

    std::vector<std::string> imports;
    for (const auto& file : files) {
        auto first_new = trees_.size();
        if (!load_file(file)) {
            return false;
        }
        for (auto i = first_new; i < trees_.size(); i++) {
            auto file_imports = imports_of(*trees_[i].file);
            imports.insert(imports.end(), file_imports.begin(), file_imports.end());
        }
    }
    pending_.emplace_back(dir, std::move(imports));
    return true;
}

bool
PackageLoader::load_file(const fs::path& file) {
    auto key = fs::weakly_canonical(file);
    if (!loaded_files_.insert(key).second) {
        return true;
    }

    std::string source;
    if (!read_file(file.string(), source)) {
        result_.set_error(fmt::format("{}: cannot read file", file.string()));
        return false;
    }

    NodePtr root;
    ParseError error;
    if (!parse_file(source, root, error)) {
        result_.set_error(fmt::format("{}:{}", file.string(), error.str()));
        return false;
    }
    TRACE("loaded {}\n", file.string());

    // A file named on its own still has its imports followed.
    if (loaded_dirs_.count(fs::weakly_canonical(file.parent_path())) == 0) {
        pending_.emplace_back(file.parent_path(), imports_of(*root));
    }
    trees_.push_back(SyntaxTree{file.string(), std::move(root)});
    return true;
}

bool
PackageLoader::resolve_import(const std::string& import_path, const fs::path& from_dir, fs::path& dir) {
    std::error_code ec;
    auto current = fs::absolute(from_dir, ec);
    while (!ec) {
        auto candidate = current / "vendor" / import_path;
        if (fs::is_directory(candidate, ec)) {
            dir = candidate;
            return true;
        }
        if (!current.has_parent_path() || current.parent_path() == current) {
            break;
        }
        current = current.parent_path();
    }

    for (const auto& gopath : options_.gopath) {
        auto candidate = fs::path(gopath) / "src" / import_path;
        if (fs::is_directory(candidate, ec)) {
            dir = candidate;
            return true;
        }
    }

    if (!options_.goroot.empty()) {
        auto candidate = fs::path(options_.goroot) / "src" / import_path;
        if (fs::is_directory(candidate, ec)) {
            dir = candidate;
            return true;
        }
    }
    return false;
}

bool
PackageLoader::load_imports(bool recursive) {
    while (!pending_.empty()) {
        auto package = std::move(pending_.front());
        pending_.pop_front();
        if (!recursive) {
            continue;
        }
        for (const auto& import_path : package.second) {
            if (is_std_import(import_path)) {
                continue;
            }
            fs::path dir;
            if (!resolve_import(import_path, package.first, dir)) {
                result_.set_error(fmt::format("cannot find package \"{}\"", import_path));
                return false;
            }
            if (!load_dir(dir)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace

LoaderOptions
gogrep::loader_options_from_env() {
    LoaderOptions options;

    const char* gopath = getenv("GOPATH");
    std::string paths;
    if (gopath != nullptr && gopath[0] != '\0') {
        paths = gopath;
    } else if (const char* home = getenv("HOME"); home != nullptr) {
        paths = fmt::format("{}/go", home);
    }
    std::size_t start = 0;
    while (start <= paths.size() && !paths.empty()) {
        auto end = paths.find(':', start);
        if (end == std::string::npos) {
            end = paths.size();
        }
        if (end > start) {
            options.gopath.push_back(paths.substr(start, end - start));
        }
        start = end + 1;
    }

    const char* goroot = getenv("GOROOT");
    if (goroot != nullptr) {
        options.goroot = goroot;
    }
    return options;
}

bool
gogrep::load_untyped(const std::vector<std::string>& paths,
                     bool recursive,
                     const LoaderOptions& options,
                     std::vector<SyntaxTree>& trees,
                     LoadResult& result) {
    PackageLoader loader(options, trees, result);

    std::vector<std::string> targets = paths;
    if (targets.empty()) {
        targets.push_back(".");
    }
    for (const auto& path : targets) {
        if (!loader.load_path(path)) {
            return false;
        }
    }
    return loader.load_imports(recursive);
}

bool
gogrep::read_file(const std::string& path, std::string& contents) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        return false;
    }
    contents.clear();
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) {
        contents.append(buffer, n);
    }
    bool ok = ferror(f) == 0;
    fclose(f);
    return ok;
}
