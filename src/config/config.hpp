#pragma once

#include "util/color.hpp"
#include "util/config_parser/config_parser.hpp"

#include <string>
#include <vector>

namespace gogrep {

enum class ColorMode { kInvalid, kAuto, kAlways, kNever };

ColorMode
color_mode_from_string(const std::string& s);

struct ProgramOptions {
    bool debug = false;
    bool recursive = false;
    bool aggressive = false;
    ColorMode color = ColorMode::kAuto;

    std::vector<std::string> commands;
    std::vector<std::string> paths;
};

struct OutputStyle {
    // clang-format off
    TermStyle position = TermStyle {
        TermColor::kMagenta,
        TermColor::kNone,
        TermStyle::Attribute::Bold
    };
    // clang-format on
};

std::string
config_get_directory();

std::string
config_get_path();

// Apply the values of a parsed config table on top of the defaults.
// Unknown keys are ignored; values of the wrong type are reported in `error`.
bool
config_apply_table(const ConfigTable& table, ProgramOptions& program_options, OutputStyle& style, std::string& error);

// Load `config_path` into the option structs. A missing file leaves the
// defaults untouched and is not an error.
bool
config_load(const std::string& config_path, ProgramOptions& program_options, OutputStyle& style, std::string& error);

// Load the user config file, reporting problems on stderr.
void
config_apply_options(ProgramOptions& program_options, OutputStyle& style);

}  // namespace gogrep
