#pragma once

#include "config/config.hpp"

#include <string>

namespace gogrep {

// clang-format off
enum class ParseArgsStatus {
    Run,            // Search with the parsed options
    ShowHelp,       // -h
    ShowVersion,    // -v
    UsageError,     // Exit with 2 after printing the usage text and `error`
};
// clang-format on

// Parses argv on top of `opts`, which already holds the config file values.
// Without -x the first positional argument is the pattern.
ParseArgsStatus
parse_args(int argc, char* argv[], ProgramOptions& opts, std::string& error);

// The one pattern to search for. More than one command isn't supported yet.
bool
select_command(const ProgramOptions& opts, std::string& pattern, std::string& error);

// Paths below the working directory are shown relative to it.
std::string
display_path(const std::string& path, const std::string& wd);

bool
use_color(ColorMode mode);

}  // namespace gogrep
