#include "color.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cstdlib>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

using namespace gogrep;

// clang-format off
const std::array<std::tuple<const TermStyle::Attribute, const std::string, int>, 8> kAttributes {{
    { TermStyle::Attribute::Bold,          "bold",          1 },
    { TermStyle::Attribute::Dim,           "dim",           2 },
    { TermStyle::Attribute::Italic,        "italic",        3 },
    { TermStyle::Attribute::Underline,     "underline",     4 },
    { TermStyle::Attribute::Blink,         "blink",         5 },
    { TermStyle::Attribute::Inverse,       "inverse",       7 },
    { TermStyle::Attribute::Hidden,        "hidden",        8 },
    { TermStyle::Attribute::Strikethrough, "strikethrough", 9 }
}};

// Special colors for default colors and for resetting colors + attributes.
TermColor TermColor::kNone    = TermColor {TermColor::Kind::Ignore, 0, 0, 0};
TermColor TermColor::kReset   = TermColor {TermColor::Kind::Reset, 0, 0, 0};
TermColor TermColor::kDefault = TermColor {TermColor::Kind::DefaultColor, 39, 49, 0};

// Color identifiers for 4 bit terminals.
TermColor TermColor::kBlack        = TermColor { TermColor::Kind::Color4bit, 30,  40, 0 };
TermColor TermColor::kRed          = TermColor { TermColor::Kind::Color4bit, 31,  41, 0 };
TermColor TermColor::kGreen        = TermColor { TermColor::Kind::Color4bit, 32,  42, 0 };
TermColor TermColor::kYellow       = TermColor { TermColor::Kind::Color4bit, 33,  43, 0 };
TermColor TermColor::kBlue         = TermColor { TermColor::Kind::Color4bit, 34,  44, 0 };
TermColor TermColor::kMagenta      = TermColor { TermColor::Kind::Color4bit, 35,  45, 0 };
TermColor TermColor::kCyan         = TermColor { TermColor::Kind::Color4bit, 36,  46, 0 };
TermColor TermColor::kLightGray    = TermColor { TermColor::Kind::Color4bit, 37,  47, 0 };
TermColor TermColor::kDarkGray     = TermColor { TermColor::Kind::Color4bit, 90, 100, 0 };
TermColor TermColor::kLightRed     = TermColor { TermColor::Kind::Color4bit, 91, 101, 0 };
TermColor TermColor::kLightGreen   = TermColor { TermColor::Kind::Color4bit, 92, 102, 0 };
TermColor TermColor::kLightYellow  = TermColor { TermColor::Kind::Color4bit, 93, 103, 0 };
TermColor TermColor::kLightBlue    = TermColor { TermColor::Kind::Color4bit, 94, 104, 0 };
TermColor TermColor::kLightMagenta = TermColor { TermColor::Kind::Color4bit, 95, 105, 0 };
TermColor TermColor::kLightCyan    = TermColor { TermColor::Kind::Color4bit, 96, 106, 0 };
TermColor TermColor::kWhite        = TermColor { TermColor::Kind::Color4bit, 97, 107, 0 };

const std::unordered_map<std::string, TermColor> k16Colors = {
        { "none",          TermColor::kNone },
        { "reset",         TermColor::kReset },
        { "default",       TermColor::kDefault },
        { "black",         TermColor::kBlack },
        { "red",           TermColor::kRed },
        { "green",         TermColor::kGreen },
        { "yellow",        TermColor::kYellow },
        { "blue",          TermColor::kBlue },
        { "magenta",       TermColor::kMagenta },
        { "cyan",          TermColor::kCyan },
        { "light_gray",    TermColor::kLightGray },
        { "dark_gray",     TermColor::kDarkGray },
        { "light_red",     TermColor::kLightRed },
        { "light_green",   TermColor::kLightGreen },
        { "light_yellow",  TermColor::kLightYellow },
        { "light_blue",    TermColor::kLightBlue },
        { "light_magenta", TermColor::kLightMagenta },
        { "light_cyan",    TermColor::kLightCyan },
        { "white",         TermColor::kWhite }
};
// clang-format on

std::optional<TermColor>
TermColor::parse_hex(const std::string& s) {
    if (!((s.size() == 4 || s.size() == 7) && s[0] == '#')) {
        return {};
    }

    for (std::size_t i = 1; i < s.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return {};
        }
    }

    long color24 = strtol(&s[1], nullptr, 16);
    if (s.size() == 4) {
        // '#ABC'
        auto r = static_cast<uint8_t>(((color24 >> 8) & 0x0F) * 17);
        auto g = static_cast<uint8_t>(((color24 >> 4) & 0x0F) * 17);
        auto b = static_cast<uint8_t>(((color24 >> 0) & 0x0F) * 17);
        return TermColor(TermColor::Kind::Color24bit, r, g, b);
    }
    // '#AABBCC'
    auto r = static_cast<uint8_t>((color24 >> 16) & 0xFF);
    auto g = static_cast<uint8_t>((color24 >> 8) & 0xFF);
    auto b = static_cast<uint8_t>((color24 >> 0) & 0xFF);
    return TermColor(TermColor::Kind::Color24bit, r, g, b);
}

std::optional<TermColor>
TermColor::parse_string(const std::string& s) {
    if (s.empty()) {
        return {};
    }
    auto it = k16Colors.find(s);
    if (it != k16Colors.end()) {
        return it->second;
    }
    return parse_hex(s);
}

std::string
gogrep::repr(const TermColor& color) {
    std::string ks[] = { "4", "T", "D", "I", "R" };
    std::string k = ks[static_cast<int>(color.kind)];
    return fmt::format("{}:({},{},{})", k, color.r, color.g, color.b);
}

std::optional<TermStyle::Attribute>
TermStyle::parse_attributes(const std::string& value) {
    uint16_t result = 0;
    std::string word;
    auto flush = [&]() {
        if (word.empty()) {
            return true;
        }
        for (const auto& [flag, name, _code] : kAttributes) {
            if (name == word) {
                result |= static_cast<uint16_t>(flag);
                word.clear();
                return true;
            }
        }
        return false;
    };
    for (char c : value) {
        if (c == ' ' || c == ',' || c == '\t') {
            if (!flush()) {
                return {};
            }
        } else {
            word.push_back(c);
        }
    }
    if (!flush()) {
        return {};
    }
    return static_cast<TermStyle::Attribute>(result);
}

std::string
TermStyle::to_ansi() const {
    std::string result;

    // https://gist.github.com/fnky/458719343aabd01cfb17a3a4f7296797
    const std::string kESC = "\033";

    std::vector<int> escseq;

    auto apply_color = [&](const TermColor& color, bool is_fg) {
        switch (color.kind) {
            // ESC[38;2;{r};{g};{b}m	Set foreground color as RGB.
            // ESC[48;2;{r};{g};{b}m	Set background color as RGB.
            case TermColor::Kind::Color24bit: {
                if (is_fg) {
                    escseq.insert(escseq.end(), {38, 2});
                } else {
                    escseq.insert(escseq.end(), {48, 2});
                }
                escseq.insert(escseq.end(), {color.r, color.g, color.b});
            } break;

            // ESC[{ID};{ID}m  Set foreground and background color
            case TermColor::Kind::DefaultColor:
            case TermColor::Kind::Color4bit: {
                if (is_fg) {
                    escseq.insert(escseq.end(), { color.r /* fg id */ });
                } else {
                    escseq.insert(escseq.end(), { color.g /* bg id */ });
                }
            } break;
            case TermColor::Kind::Reset: {
                escseq.insert(escseq.end(), { 0 });
            } break;
            case TermColor::Kind::Ignore: {
            } break;
        }
    };

    apply_color(fg, true);
    for (const auto& [attr_flag, attr_name, attr_code] : kAttributes) {
        if (static_cast<uint16_t>(attr) & static_cast<uint16_t>(attr_flag)) {
            escseq.insert(escseq.end(), { attr_code });
        }
    }
    if (!(bg == fg && bg.kind == TermColor::Kind::Reset)) {
        apply_color(bg, false);
    }

    if (escseq.empty()) return result;
    result += kESC + "[";
    for (const int code : escseq) {
        result += fmt::format("{};", code);
    }
    if (result.back() == ';') {
        result.pop_back();
    }
    result += "m";
    return result;
}

std::string
TermStyle::apply(const std::string& text) const {
    auto reset = TermStyle{TermColor::kReset, TermColor::kReset};
    return to_ansi() + text + reset.to_ansi();
}

std::string
gogrep::repr(const TermStyle& style) {
    return fmt::format("fg: {}, bg: {}, attr: 0x{:x}",
        repr(style.fg), repr(style.bg), static_cast<int>(style.attr));
}
