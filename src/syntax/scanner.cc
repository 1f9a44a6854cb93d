#include "scanner.hpp"

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

using namespace gogrep;

namespace {

bool
is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool
is_digit_of_base(char c, int base) {
    switch (base) {
        case 2:
            return c == '0' || c == '1';
        case 8:
            return c >= '0' && c <= '7';
        case 16:
            return is_hex_digit(c);
        default:
            return is_digit(c);
    }
}

}  // namespace

bool
gogrep::is_letter(char c) {
    // Bytes of multi-byte UTF-8 sequences count as letters.
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool
gogrep::is_digit(char c) {
    return c >= '0' && c <= '9';
}

Scanner::Scanner(std::string source) : src_(std::move(source)) {
}

char
Scanner::peek(std::size_t ahead) const {
    auto i = offset_ + ahead;
    return i < src_.size() ? src_[i] : '\0';
}

void
Scanner::advance() {
    if (offset_ >= src_.size()) {
        return;
    }
    if (src_[offset_] == '\n') {
        line_++;
        line_start_ = offset_ + 1;
    }
    offset_++;
}

void
Scanner::error(std::size_t offset, const std::string& message) {
    errors_.push_back({position_at(offset), message});
}

Pos
Scanner::position_at(std::size_t offset) const {
    int line = line_;
    std::size_t line_start = line_start_;
    if (offset < line_start_) {
        // Errors reported at the start of a literal spanning lines.
        line = 1;
        line_start = 0;
    }
    for (auto i = line_start; i < offset && i < src_.size(); i++) {
        if (src_[i] == '\n') {
            line++;
            line_start = i + 1;
        }
    }
    return Pos{static_cast<int>(offset), line, static_cast<int>(offset - line_start) + 1};
}

void
Scanner::skip_to(std::size_t offset) {
    while (offset_ < offset && offset_ < src_.size()) {
        advance();
    }
    insert_semi_ = true;
}

void
Scanner::skip_whitespace() {
    while (offset_ < src_.size()) {
        char c = src_[offset_];
        if (c == ' ' || c == '\t' || c == '\r' || (c == '\n' && !insert_semi_)) {
            advance();
        } else {
            break;
        }
    }
}

// A comment ends the line when it is a line comment or spans a newline.
bool
Scanner::comment_needs_semicolon() const {
    if (peek(1) == '/') {
        return true;
    }
    auto end = src_.find("*/", offset_ + 2);
    auto newline = src_.find('\n', offset_ + 2);
    if (newline == std::string::npos) {
        return end == std::string::npos;
    }
    return end == std::string::npos || newline < end;
}

void
Scanner::skip_comment() {
    auto start = offset_;
    if (peek(1) == '/') {
        while (offset_ < src_.size() && src_[offset_] != '\n') {
            advance();
        }
        return;
    }
    advance();
    advance();
    while (offset_ < src_.size()) {
        if (src_[offset_] == '*' && peek(1) == '/') {
            advance();
            advance();
            return;
        }
        advance();
    }
    error(start, "comment not terminated");
}

void
Scanner::scan_digits(int base) {
    while (is_digit_of_base(peek(), base) || (peek() == '_' && is_hex_digit(peek(1)))) {
        advance();
    }
}

TokenKind
Scanner::scan_number() {
    auto start = offset_;
    TokenKind kind = TokenKind::Int;
    int base = 10;

    if (peek() == '0') {
        char prefix = peek(1);
        if (prefix == 'x' || prefix == 'X') {
            base = 16;
        } else if (prefix == 'b' || prefix == 'B') {
            base = 2;
        } else if (prefix == 'o' || prefix == 'O') {
            base = 8;
        }
        if (base != 10) {
            advance();
            advance();
            auto digits_start = offset_;
            scan_digits(base);
            if (offset_ == digits_start && !(base == 16 && peek() == '.')) {
                error(start, fmt::format("{} literal has no digits",
                                         base == 16 ? "hexadecimal" : base == 8 ? "octal" : "binary"));
            }
        }
    }

    if (base == 10) {
        scan_digits(10);
    }

    if (peek() == '.' && (base == 10 || base == 16)) {
        kind = TokenKind::Float;
        advance();
        scan_digits(base);
    }

    char e = peek();
    bool decimal_exponent = base == 10 && (e == 'e' || e == 'E');
    bool hex_exponent = base == 16 && (e == 'p' || e == 'P');
    if (decimal_exponent || hex_exponent) {
        kind = TokenKind::Float;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        auto digits_start = offset_;
        scan_digits(10);
        if (offset_ == digits_start) {
            error(start, "exponent has no digits");
        }
    } else if (base == 16 && kind == TokenKind::Float) {
        error(start, "hexadecimal mantissa requires a 'p' exponent");
    }

    if (peek() == 'i') {
        kind = TokenKind::Imag;
        advance();
    }
    return kind;
}

void
Scanner::scan_escaped(char quote, const char* what) {
    auto start = offset_;
    advance();  // opening quote
    while (true) {
        char c = peek();
        if (offset_ >= src_.size() || c == '\n') {
            error(start, fmt::format("{} literal not terminated", what));
            return;
        }
        advance();
        if (c == quote) {
            return;
        }
        if (c == '\\' && offset_ < src_.size() && peek() != '\n') {
            advance();
        }
    }
}

void
Scanner::scan_raw_string() {
    auto start = offset_;
    advance();
    while (offset_ < src_.size()) {
        char c = peek();
        advance();
        if (c == '`') {
            return;
        }
    }
    error(start, "raw string literal not terminated");
}

Token
Scanner::scan() {
    while (true) {
        skip_whitespace();

        auto start = offset_;
        Token token;
        token.pos = position_at(start);

        if (offset_ >= src_.size()) {
            if (insert_semi_) {
                insert_semi_ = false;
                token.kind = TokenKind::Semicolon;
                token.lit = "\n";
                return token;
            }
            token.kind = TokenKind::Eof;
            return token;
        }

        char c = peek();

        if (c == '\n') {
            // Only reached when a semicolon is due.
            insert_semi_ = false;
            advance();
            token.kind = TokenKind::Semicolon;
            token.lit = "\n";
            return token;
        }

        if (c == '/' && (peek(1) == '/' || peek(1) == '*')) {
            if (insert_semi_ && comment_needs_semicolon()) {
                insert_semi_ = false;
                token.kind = TokenKind::Semicolon;
                token.lit = "\n";
                return token;
            }
            skip_comment();
            continue;
        }

        bool insert_semi = false;

        if (is_letter(c)) {
            while (offset_ < src_.size() && (is_letter(peek()) || is_digit(peek()))) {
                advance();
            }
            token.lit = src_.substr(start, offset_ - start);
            token.kind = lookup_keyword(token.lit);
            switch (token.kind) {
                case TokenKind::Ident:
                case TokenKind::Break:
                case TokenKind::Continue:
                case TokenKind::Fallthrough:
                case TokenKind::Return:
                    insert_semi = true;
                    break;
                default:
                    break;
            }
            insert_semi_ = insert_semi;
            return token;
        }

        if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
            token.kind = scan_number();
            token.lit = src_.substr(start, offset_ - start);
            insert_semi_ = true;
            return token;
        }

        auto two = [&](char second, TokenKind matched, TokenKind otherwise) {
            if (peek(1) == second) {
                advance();
                return matched;
            }
            return otherwise;
        };

        switch (c) {
            case '"':
                scan_escaped('"', "string");
                token.kind = TokenKind::String;
                insert_semi = true;
                break;
            case '\'':
                scan_escaped('\'', "rune");
                token.kind = TokenKind::Char;
                insert_semi = true;
                break;
            case '`':
                scan_raw_string();
                token.kind = TokenKind::String;
                insert_semi = true;
                break;
            case '.':
                if (peek(1) == '.' && peek(2) == '.') {
                    advance();
                    advance();
                    token.kind = TokenKind::Ellipsis;
                } else {
                    token.kind = TokenKind::Period;
                }
                advance();
                break;
            case ',':
                token.kind = TokenKind::Comma;
                advance();
                break;
            case ';':
                token.kind = TokenKind::Semicolon;
                advance();
                break;
            case '(':
                token.kind = TokenKind::LParen;
                advance();
                break;
            case ')':
                token.kind = TokenKind::RParen;
                insert_semi = true;
                advance();
                break;
            case '[':
                token.kind = TokenKind::LBrack;
                advance();
                break;
            case ']':
                token.kind = TokenKind::RBrack;
                insert_semi = true;
                advance();
                break;
            case '{':
                token.kind = TokenKind::LBrace;
                advance();
                break;
            case '}':
                token.kind = TokenKind::RBrace;
                insert_semi = true;
                advance();
                break;
            case '~':
                token.kind = TokenKind::Tilde;
                advance();
                break;
            case ':':
                token.kind = two('=', TokenKind::Define, TokenKind::Colon);
                advance();
                break;
            case '+':
                if (peek(1) == '+') {
                    advance();
                    token.kind = TokenKind::Inc;
                    insert_semi = true;
                } else {
                    token.kind = two('=', TokenKind::AddAssign, TokenKind::Add);
                }
                advance();
                break;
            case '-':
                if (peek(1) == '-') {
                    advance();
                    token.kind = TokenKind::Dec;
                    insert_semi = true;
                } else {
                    token.kind = two('=', TokenKind::SubAssign, TokenKind::Sub);
                }
                advance();
                break;
            case '*':
                token.kind = two('=', TokenKind::MulAssign, TokenKind::Mul);
                advance();
                break;
            case '/':
                token.kind = two('=', TokenKind::QuoAssign, TokenKind::Quo);
                advance();
                break;
            case '%':
                token.kind = two('=', TokenKind::RemAssign, TokenKind::Rem);
                advance();
                break;
            case '^':
                token.kind = two('=', TokenKind::XorAssign, TokenKind::Xor);
                advance();
                break;
            case '=':
                token.kind = two('=', TokenKind::Eql, TokenKind::Assign);
                advance();
                break;
            case '!':
                token.kind = two('=', TokenKind::Neq, TokenKind::Not);
                advance();
                break;
            case '<':
                if (peek(1) == '-') {
                    advance();
                    token.kind = TokenKind::Arrow;
                } else if (peek(1) == '<') {
                    advance();
                    token.kind = two('=', TokenKind::ShlAssign, TokenKind::Shl);
                } else {
                    token.kind = two('=', TokenKind::Leq, TokenKind::Lss);
                }
                advance();
                break;
            case '>':
                if (peek(1) == '>') {
                    advance();
                    token.kind = two('=', TokenKind::ShrAssign, TokenKind::Shr);
                } else {
                    token.kind = two('=', TokenKind::Geq, TokenKind::Gtr);
                }
                advance();
                break;
            case '&':
                if (peek(1) == '^') {
                    advance();
                    token.kind = two('=', TokenKind::AndNotAssign, TokenKind::AndNot);
                } else if (peek(1) == '&') {
                    advance();
                    token.kind = TokenKind::LAnd;
                } else {
                    token.kind = two('=', TokenKind::AndAssign, TokenKind::And);
                }
                advance();
                break;
            case '|':
                if (peek(1) == '|') {
                    advance();
                    token.kind = TokenKind::LOr;
                } else {
                    token.kind = two('=', TokenKind::OrAssign, TokenKind::Or);
                }
                advance();
                break;
            default:
                error(start, fmt::format("illegal character U+{:04X} '{}'", static_cast<unsigned char>(c), c));
                token.kind = TokenKind::Illegal;
                advance();
                break;
        }

        token.lit = src_.substr(start, offset_ - start);
        insert_semi_ = insert_semi;
        return token;
    }
}

std::vector<Token>
gogrep::scan_all(const std::string& source, std::vector<ScanError>* errors) {
    Scanner scanner(source);
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(scanner.scan());
        if (tokens.back().kind == TokenKind::Eof) {
            break;
        }
    }
    if (errors) {
        *errors = scanner.errors();
    }
    return tokens;
}
