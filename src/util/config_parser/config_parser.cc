#include "config_parser.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

using namespace gogrep;

namespace internal {

std::string
trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

// Strips a trailing '#' comment that isn't inside quotes.
std::string
strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == '\\') {
                i++;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

bool
is_identifier(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')) {
            return false;
        }
    }
    return true;
}

bool
parse_int(const std::string& s, Value::Int& out) {
    std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) {
        return false;
    }
    for (std::size_t j = i; j < s.size(); j++) {
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) {
            return false;
        }
    }
    out = std::strtoll(s.c_str(), nullptr, 10);
    return true;
}

std::optional<Value>
parse_value(const std::string& text, std::string& error) {
    if (text.empty()) {
        error = "missing value";
        return {};
    }

    char quote = text[0];
    if (quote == '\'' || quote == '"') {
        std::string s;
        std::size_t i = 1;
        for (; i < text.size() && text[i] != quote; i++) {
            if (text[i] == '\\' && i + 1 < text.size()) {
                i++;
            }
            s.push_back(text[i]);
        }
        if (i >= text.size()) {
            error = "string not terminated";
            return {};
        }
        if (i + 1 != text.size()) {
            error = fmt::format("unexpected '{}' after string", text.substr(i + 1));
            return {};
        }
        return Value{s};
    }

    if (text == "true" || text == "yes" || text == "on") {
        return Value{true};
    }
    if (text == "false" || text == "no" || text == "off") {
        return Value{false};
    }

    Value::Int number = 0;
    if (parse_int(text, number)) {
        return Value{number};
    }
    if (is_identifier(text)) {
        return Value{text};
    }
    error = fmt::format("invalid value '{}'", text);
    return {};
}

}  // namespace internal

void
ParseResult::set_error(int line, const std::string& error_message) {
    kind = ParseErrorKind::Parsing;
    error = fmt::format("'{}' at line {}", error_message, line);
}

std::string
gogrep::repr(const Value& v) {
    if (v.is_int()) {
        return fmt::format("Integer<{}>", v.as_int());
    }
    if (v.is_bool()) {
        return fmt::format("Boolean<{}>", v.as_bool());
    }
    return fmt::format("String<'{}'>", v.as_string());
}

std::optional<Value>
ConfigTable::lookup(const std::string& dotted_path) const {
    auto dot = dotted_path.find('.');
    std::string section = dot == std::string::npos ? "" : dotted_path.substr(0, dot);
    std::string key = dot == std::string::npos ? dotted_path : dotted_path.substr(dot + 1);

    auto sit = sections.find(section);
    if (sit == sections.end()) {
        return {};
    }
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) {
        return {};
    }
    return kit->second;
}

bool
gogrep::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, ConfigTable& table) {
    std::string section;
    int line_number = 0;
    std::size_t start = 0;

    while (start <= input_data.size()) {
        auto end = input_data.find('\n', start);
        if (end == std::string::npos) {
            end = input_data.size();
        }
        line_number++;
        auto line = internal::trim(internal::strip_comment(input_data.substr(start, end - start)));
        start = end + 1;

        if (line.empty()) {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                result.set_error(line_number, "expected ']' after section name");
                return false;
            }
            section = internal::trim(line.substr(1, line.size() - 2));
            if (!internal::is_identifier(section)) {
                result.set_error(line_number, fmt::format("invalid section name '{}'", section));
                return false;
            }
            table.sections[section];
            continue;
        }

        auto assign = line.find('=');
        if (assign == std::string::npos) {
            result.set_error(line_number, fmt::format("expected 'key = value', found '{}'", line));
            return false;
        }
        auto key = internal::trim(line.substr(0, assign));
        if (!internal::is_identifier(key)) {
            result.set_error(line_number, fmt::format("invalid key '{}'", key));
            return false;
        }

        std::string error;
        auto value = internal::parse_value(internal::trim(line.substr(assign + 1)), error);
        if (!value) {
            result.set_error(line_number, error);
            return false;
        }
        table.sections[section][key] = *value;
    }
    return true;
}

bool
gogrep::cfg_load_file(const std::string& file_path, ParseResult& result, ConfigTable& table) {
    FILE* f = fopen(file_path.c_str(), "rb");
    if (!f) {
        result.kind = ParseErrorKind::File;
        result.error = fmt::format("Could not open file: {}", file_path);
        return false;
    }

    std::string contents;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) {
        contents.append(buffer, n);
    }
    bool read_ok = ferror(f) == 0;
    fclose(f);
    if (!read_ok) {
        result.kind = ParseErrorKind::File;
        result.error = fmt::format("Could not read file: {}", file_path);
        return false;
    }

    return cfg_parse_value_tree(contents, result, table);
}
