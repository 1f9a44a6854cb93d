#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gogrep {

struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        Color24bit,
        DefaultColor,
        Ignore,
        Reset
    };

    Kind kind;

    // Foreground and background SGR codes for palette colors, channels for
    // 24 bit colors.
    uint8_t r;
    uint8_t g;
    uint8_t b;

    TermColor() {
        *this = TermColor::kDefault;
    }

    TermColor(Kind kind, uint8_t r, uint8_t g, uint8_t b)
        : kind(kind)
        , r(r)
        , g(g)
        , b(b) {}

    bool operator == (const TermColor& other) const {
        return other.kind == kind && other.r == r && other.g == g && other.b == b;
    }

    // Palette name ("green", "light_blue") or hex color
    static std::optional<TermColor>
    parse_string(const std::string& value);

    // #rgb, #rrggbb
    static std::optional<TermColor>
    parse_hex(const std::string& value);

    static TermColor kNone;
    static TermColor kReset;
    static TermColor kDefault;

    // Colors (standard 4 bit palette)
    static TermColor kBlack;
    static TermColor kRed;
    static TermColor kGreen;
    static TermColor kYellow;
    static TermColor kBlue;
    static TermColor kMagenta;
    static TermColor kCyan;
    static TermColor kLightGray;
    static TermColor kDarkGray;
    static TermColor kLightRed;
    static TermColor kLightGreen;
    static TermColor kLightYellow;
    static TermColor kLightBlue;
    static TermColor kLightMagenta;
    static TermColor kLightCyan;
    static TermColor kWhite;
};

std::string
repr(const TermColor& color);

struct TermStyle {

    enum class Attribute : uint16_t {
        None          = 0,
        Bold          = 1 << 0,
        Dim           = 1 << 1,
        Italic        = 1 << 2,
        Underline     = 1 << 4,
        Blink         = 1 << 5,
        Inverse       = 1 << 6,
        Hidden        = 1 << 7,
        Strikethrough = 1 << 8,
    };

    TermColor fg;
    TermColor bg;
    Attribute attr;

    TermStyle()
    : TermStyle(TermColor::kDefault, TermColor::kDefault) {}

    explicit TermStyle(TermColor fg, TermColor bg, Attribute attr)
        : fg(fg)
        , bg(bg)
        , attr(attr) {}

    explicit TermStyle(TermColor fg, TermColor bg)
        : TermStyle(fg, bg, Attribute::None) {}

    // Convert style to an ansi escape sequence
    std::string
    to_ansi() const;

    // Wraps `text` in this style and a reset.
    std::string
    apply(const std::string& text) const;

    // Space or comma separated attribute names, e.g. "bold underline".
    static std::optional<Attribute>
    parse_attributes(const std::string& value);
};

std::string
repr(const TermStyle& style);

}  // namespace gogrep
