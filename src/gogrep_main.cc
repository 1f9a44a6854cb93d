#include "cli/options.hpp"
#include "config/config.hpp"
#include "loader/loader.hpp"
#include "matching/matcher.hpp"
#include "pattern/pattern_compiler.hpp"
#include "syntax/printer.hpp"
#include "util/color.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int
main(int argc, char* argv[]) {
    gogrep::ProgramOptions opts;
    gogrep::OutputStyle style;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(usage: {} commands [packages]

Options:

  -r, --recursive      match all dependencies recursively too
  -a, --aggressive     tolerate parentheses, inits, := for = and default for case $*x
  -d, --debug          print the compiled pattern to stderr
  --color=WHEN         color the positions: auto, always or never
  -h, --help           show this help and exit
  -v, --version        show program version and exit

A command is of the form "-A pattern", where -A is one of:

  -x   find all nodes matching a pattern

If -A is omitted for a single command, -x will be assumed.

A pattern is a piece of Go code which may include wildcards. It can be:

       a statement (many if split by semicolons)
       an expression (many if split by commas)
       a type expression
       a top-level declaration (var, func, const)
       an entire file

Wildcards consist of '$' and a name. All wildcards with the same name
within an expression must match the same node, excluding "_". Example:

       $x.$_ = $x // assignment of self to a field in self

If '*' is before the name, it will match any number of nodes. Example:

       fmt.Fprintf(os.Stdout, $*_) // all Fprintfs on stdout

Regexes can also be used to match certain identifier names only. The
'.*' pattern can be used to match all identifiers. Example:

       fmt.$(_ /Fprint.*/)(os.Stdout, $*_) // all Fprint* on stdout

A leading '~' enables the aggressive mode for that pattern.

The nodes resulting from applying the commands will be printed line by
line to standard output.

Config file:
    {}
)",
                                       argv[0], gogrep::config_get_path());

        if (!optional_error_message.empty()) {
            help += "\n" + optional_error_message + "\n";
        }
        fmt::print(stderr, "{}", help);
    };

    // Load the global defaults before we override them with command line args
    gogrep::config_apply_options(opts, style);

    std::string error;
    switch (gogrep::parse_args(argc, argv, opts, error)) {
        case gogrep::ParseArgsStatus::ShowVersion:
            fmt::print("version: {}\n", GOGREP_VERSION);
            fmt::print("vcs hash: {}\n", GOGREP_BUILD_HASH);
            return 0;
        case gogrep::ParseArgsStatus::ShowHelp:
            show_help("");
            return 0;
        case gogrep::ParseArgsStatus::UsageError:
            show_help(error);
            return 2;
        case gogrep::ParseArgsStatus::Run:
            break;
    }

    std::string pattern_text;
    if (!gogrep::select_command(opts, pattern_text, error)) {
        fmt::print(stderr, "{}\n", error);
        return 1;
    }

    gogrep::CompiledPattern pattern;
    gogrep::CompileResult compile_result;
    if (!gogrep::compile_pattern(pattern_text, gogrep::CompileOptions{opts.aggressive}, pattern, compile_result)) {
        fmt::print(stderr, "{}\n", compile_result.error);
        return 1;
    }

    if (opts.debug) {
        fmt::print(stderr, "{}", gogrep::dump_pattern(pattern));
    }

    std::vector<gogrep::SyntaxTree> trees;
    gogrep::LoadResult load_result;
    if (!gogrep::load_untyped(opts.paths, opts.recursive, gogrep::loader_options_from_env(), trees, load_result)) {
        fmt::print(stderr, "{}\n", load_result.error);
        return 1;
    }

    std::error_code ec;
    std::string wd = fs::current_path(ec).string();
    if (ec) {
        wd.clear();
    }

    const bool colored = gogrep::use_color(opts.color);

    gogrep::Matcher matcher(pattern);
    for (const auto& tree : trees) {
        for (const auto& match : matcher.search(*tree.file)) {
            auto position = fmt::format("{}:{}:{}", gogrep::display_path(tree.filename, wd), match.pos.line,
                                        match.pos.column);
            if (colored) {
                position = style.position.apply(position);
            }

            std::string rendering = match.is_sequence() ? gogrep::print_sequence(match.sequence, match.seq_class)
                                                        : gogrep::print_node(*match.node);
            fmt::print("{}: {}\n", position, rendering);
        }
    }

    return 0;
}
