#include "config.hpp"

#include <util/color.hpp>
#include <util/config_parser/config_parser.hpp>

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cstdio>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace gogrep;

enum class ConfigVariableType {
    Bool,
    String,
    Color,
    Attribute,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

std::string
gogrep::config_get_directory() {
    return fmt::format("{}/gogrep", sago::getConfigHome());
}

std::string
gogrep::config_get_path() {
    return fmt::format("{}/gogrep.conf", config_get_directory());
}

static bool
config_apply_values(const ConfigTable& table, const OptionVector& options, std::string& error) {
    for (const auto& [path, type, ptr] : options) {
        auto stored_value = table.lookup(path);
        if (!stored_value) {
            continue;
        }

        switch (type) {
            case ConfigVariableType::Bool: {
                if (!stored_value->is_bool()) {
                    error = fmt::format("'{}' must be a boolean, found {}", path, repr(*stored_value));
                    return false;
                }
                *((bool*) ptr) = stored_value->as_bool();
            } break;
            case ConfigVariableType::String: {
                if (!stored_value->is_string()) {
                    error = fmt::format("'{}' must be a string, found {}", path, repr(*stored_value));
                    return false;
                }
                *((std::string*) ptr) = stored_value->as_string();
            } break;
            case ConfigVariableType::Color: {
                auto color = stored_value->is_string() ? TermColor::parse_string(stored_value->as_string())
                                                       : std::nullopt;
                if (!color) {
                    error = fmt::format("'{}' is not a color: {}", path, repr(*stored_value));
                    return false;
                }
                *((TermColor*) ptr) = *color;
            } break;
            case ConfigVariableType::Attribute: {
                auto attr = stored_value->is_string() ? TermStyle::parse_attributes(stored_value->as_string())
                                                      : std::nullopt;
                if (!attr) {
                    error = fmt::format("'{}' is not a list of attributes: {}", path, repr(*stored_value));
                    return false;
                }
                *((TermStyle::Attribute*) ptr) = *attr;
            } break;
        }
    }
    return true;
}

bool
gogrep::config_apply_table(const ConfigTable& table,
                           ProgramOptions& program_options,
                           OutputStyle& style,
                           std::string& error) {
    std::string color = "auto";

    // clang-format off
    const OptionVector options = {
        { "general.recursive",    ConfigVariableType::Bool,      &program_options.recursive },
        { "general.aggressive",   ConfigVariableType::Bool,      &program_options.aggressive },
        { "general.color",        ConfigVariableType::String,    &color },
        { "style.position",       ConfigVariableType::Color,     &style.position.fg },
        { "style.position_attr",  ConfigVariableType::Attribute, &style.position.attr },
    };
    // clang-format on

    if (!config_apply_values(table, options, error)) {
        return false;
    }

    if (table.lookup("general.color")) {
        auto mode = color_mode_from_string(color);
        if (mode == ColorMode::kInvalid) {
            error = fmt::format("'general.color' must be auto, always or never, found '{}'", color);
            return false;
        }
        program_options.color = mode;
    }
    return true;
}

bool
gogrep::config_load(const std::string& config_path,
                    ProgramOptions& program_options,
                    OutputStyle& style,
                    std::string& error) {
    ParseResult parse_result;
    ConfigTable table;
    if (!cfg_load_file(config_path, parse_result, table)) {
        if (parse_result.kind == ParseErrorKind::File) {
            return true;
        }
        error = parse_result.error;
        return false;
    }

    // Validate into copies so a bad file leaves every default in place.
    ProgramOptions opts = program_options;
    OutputStyle st = style;
    if (!config_apply_table(table, opts, st, error)) {
        return false;
    }
    program_options = opts;
    style = st;
    return true;
}

void
gogrep::config_apply_options(ProgramOptions& program_options, OutputStyle& style) {
    const std::string config_path = config_get_path();

    std::string error;
    if (!config_load(config_path, program_options, style, error)) {
        fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", error, config_path);
    }
}

ColorMode
gogrep::color_mode_from_string(const std::string& s) {
    if (s == "auto")
        return ColorMode::kAuto;
    else if (s == "always")
        return ColorMode::kAlways;
    else if (s == "never")
        return ColorMode::kNever;
    return ColorMode::kInvalid;
}
