#include "position.hpp"

#include <string>
#include <vector>

using namespace gogrep;

void
LineColBuffer::write(const std::string& text) {
    for (char c : text) {
        if (c == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
    }
    buf_ += text;
}

Pos
gogrep::correct_position(Pos pos, const std::vector<PosOffset>& offsets) {
    Pos corrected = pos;
    for (const auto& offs : offsets) {
        if (pos.line == offs.at_line && pos.column >= offs.at_col) {
            corrected.column -= offs.length;
        }
        if (pos.offset >= 0 && pos.offset >= offs.at_offset) {
            corrected.offset -= offs.length;
        }
    }
    return corrected;
}
