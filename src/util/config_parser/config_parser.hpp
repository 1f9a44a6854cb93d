#pragma once

/**

 Configuration file parser

 INI with typed values:

    # comment
    [section]
        flag = true         # true/false, yes/no, on/off
        count = 3
        name = 'text'       # single or double quotes; bare words are strings too

 Keys before the first section header belong to the section "".
*/

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace gogrep {

struct Value {
    using Int = int64_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Int, Bool, String> v;

    // clang-format off
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Int as_int() const { return std::get<Value::Int>(v); }
    Bool as_bool() const { return std::get<Value::Bool>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(const Value& v);

using ConfigSection = std::map<std::string, Value>;

struct ConfigTable {
    std::map<std::string, ConfigSection> sections;

    // Find a value using e.g. "general.color"
    std::optional<Value>
    lookup(const std::string& dotted_path) const;
};

// clang-format off
enum class ParseErrorKind {
    None         = 1 << 0,
    File         = 1 << 1,
    Parsing      = 1 << 3,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(int line, const std::string& error_message);
};

bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, ConfigTable& table);

// Load a file and construct a value tree based on the contents
bool
cfg_load_file(const std::string& file_path, ParseResult& result, ConfigTable& table);

}  // namespace gogrep
