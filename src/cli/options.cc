#include "options.hpp"

#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <filesystem>
#include <string>

using namespace gogrep;

namespace fs = std::filesystem;

ParseArgsStatus
gogrep::parse_args(int argc, char* argv[], ProgramOptions& opts, std::string& error) {
    static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                           {"version", no_argument, 0, 'v'},
                                           {"recursive", no_argument, 0, 'r'},
                                           {"aggressive", no_argument, 0, 'a'},
                                           {"debug", no_argument, 0, 'd'},
                                           {"color", required_argument, 0, '1'},
                                           {0, 0, 0, 0}};

    // Start over; argv may be parsed more than once per process.
    optind = 0;
    opterr = 0;

    int c = 0, option_index = 0;
    while ((c = getopt_long(argc, argv, "x:hvrad", long_options, &option_index)) >= 0) {
        switch (c) {
            case 'v':
                return ParseArgsStatus::ShowVersion;
            case 'h':
                return ParseArgsStatus::ShowHelp;
            case 'x':
                opts.commands.emplace_back(optarg);
                break;
            case 'r':
                opts.recursive = true;
                break;
            case 'a':
                opts.aggressive = true;
                break;
            case 'd':
                opts.debug = true;
                break;
            case '1': {
                auto mode = color_mode_from_string(optarg);
                if (mode == ColorMode::kInvalid) {
                    error = fmt::format("error: invalid value for --color ({})", optarg);
                    return ParseArgsStatus::UsageError;
                }
                opts.color = mode;
                break;
            }
            case ':':
            case '?':
                error = "error: invalid option";
                return ParseArgsStatus::UsageError;
            default:
                error = fmt::format("error: invalid option: -{}", static_cast<char>(c));
                return ParseArgsStatus::UsageError;
        }
    }

    for (int i = optind; i < argc; i++) {
        opts.paths.emplace_back(argv[i]);
    }

    if (opts.commands.empty() && !opts.paths.empty()) {
        opts.commands.push_back(opts.paths.front());
        opts.paths.erase(opts.paths.begin());
    }
    if (opts.commands.empty()) {
        error = "need at least one command";
        return ParseArgsStatus::UsageError;
    }
    return ParseArgsStatus::Run;
}

bool
gogrep::select_command(const ProgramOptions& opts, std::string& pattern, std::string& error) {
    if (opts.commands.size() != 1) {
        error = opts.commands.empty() ? "need at least one command" : "TODO: command composability";
        return false;
    }
    pattern = opts.commands.front();
    return true;
}

std::string
gogrep::display_path(const std::string& path, const std::string& wd) {
    if (wd.empty() || !fs::path(path).is_absolute()) {
        return path;
    }
    const std::string prefix = wd.back() == '/' ? wd : wd + "/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        return path.substr(prefix.size());
    }
    return path;
}

bool
gogrep::use_color(ColorMode mode) {
    switch (mode) {
        case ColorMode::kAlways:
            return true;
        case ColorMode::kNever:
        case ColorMode::kInvalid:
            return false;
        case ColorMode::kAuto:
            break;
    }
    return tty_get_capabilities() != TermColorSupport_None;
}
