#pragma once

#include "syntax/token.hpp"

#include <string>
#include <vector>

namespace gogrep {

// Positions on `at_line` at or after `at_col`, and byte offsets at or after
// `at_offset`, are `length` bytes further right than in the user's pattern.
struct PosOffset {
    int at_line = 0;
    int at_col = 0;
    int at_offset = 0;
    int length = 0;
};

// Text buffer that knows the line, column and byte offset of its end.
class LineColBuffer {
   public:
    void
    write(const std::string& text);

    const std::string&
    str() const {
        return buf_;
    }

    int
    line() const {
        return line_;
    }

    int
    column() const {
        return column_;
    }

    int
    offset() const {
        return static_cast<int>(buf_.size());
    }

   private:
    std::string buf_;
    int line_ = 1;
    int column_ = 1;
};

// Maps a position in synthesized pattern text back to the user's text.
Pos
correct_position(Pos pos, const std::vector<PosOffset>& offsets);

}  // namespace gogrep
