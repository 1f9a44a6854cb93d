#pragma once

/*
    Go scanner.

    Splits Go source text into tokens, skipping whitespace and comments and
    inserting semicolons at line ends the way the Go specification describes.
    Inserted semicolons carry the literal "\n" so they can be told apart from
    ones written in the source.

    Scan errors don't stop the scanner; they're collected and the offending
    bytes come back as TokenKind::Illegal tokens.
*/

#include "token.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gogrep {

struct ScanError {
    Pos pos;
    std::string message;
};

class Scanner {
   public:
    explicit Scanner(std::string source);

    Token
    scan();

    // Continue scanning at `offset`, treating the skipped text as if it were an
    // identifier; a following newline inserts a semicolon.
    void
    skip_to(std::size_t offset);

    // Line and column of a byte offset in the source.
    Pos
    position_at(std::size_t offset) const;

    const std::string&
    source() const {
        return src_;
    }

    const std::vector<ScanError>&
    errors() const {
        return errors_;
    }

   private:
    char
    peek(std::size_t ahead = 0) const;

    void
    advance();

    void
    error(std::size_t offset, const std::string& message);

    void
    skip_whitespace();

    bool
    comment_needs_semicolon() const;

    void
    skip_comment();

    TokenKind
    scan_number();

    void
    scan_digits(int base);

    void
    scan_escaped(char quote, const char* what);

    void
    scan_raw_string();

    std::string src_;
    std::size_t offset_ = 0;
    int line_ = 1;
    std::size_t line_start_ = 0;
    bool insert_semi_ = false;
    std::vector<ScanError> errors_;
};

bool
is_letter(char c);

bool
is_digit(char c);

// Convenience wrapper: all tokens up to and including Eof.
std::vector<Token>
scan_all(const std::string& source, std::vector<ScanError>* errors = nullptr);

}  // namespace gogrep
