#pragma once

#include "syntax/ast.hpp"
#include "util/error.hpp"

#include <string>
#include <vector>

namespace gogrep {

struct SyntaxTree {
    std::string filename;
    NodePtr file;
};

struct LoadResult {
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }

    void
    set_error(const std::string& message) {
        kind = ErrorKind::Load;
        error = message;
    }
};

// Where imported packages are looked up when loading recursively.
struct LoaderOptions {
    std::vector<std::string> gopath;
    std::string goroot;
};

// $GOPATH (colon separated, defaulting to ~/go) and $GOROOT.
LoaderOptions
loader_options_from_env();

// Parses the Go files named by `paths`:
//
//     file.go      that file
//     dir          the package in dir; _test.go files and files starting
//                  with '.' or '_' are skipped
//     dir/...      every package below dir, except testdata, vendor and
//                  directories starting with '.' or '_'
//
// No paths means the current directory. When `recursive` is set, the
// non-standard-library imports of everything loaded are followed too, looked
// up in vendor directories, then $GOPATH, then $GOROOT. Each file is loaded
// once.
bool
load_untyped(const std::vector<std::string>& paths,
             bool recursive,
             const LoaderOptions& options,
             std::vector<SyntaxTree>& trees,
             LoadResult& result);

bool
read_file(const std::string& path, std::string& contents);

}  // namespace gogrep
