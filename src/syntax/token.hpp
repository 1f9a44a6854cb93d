#pragma once

/*
    Go lexical tokens.

    The kinds mirror the Go specification; operators are grouped so that
    binary precedence can be looked up directly from the kind.
*/

#include <cstdint>
#include <string>

namespace gogrep {

enum class TokenKind : uint8_t {
    Illegal,
    Eof,
    Comment,

    // Literals
    Ident,
    Int,
    Float,
    Imag,
    Char,
    String,

    // Operators
    Add,     // +
    Sub,     // -
    Mul,     // *
    Quo,     // /
    Rem,     // %
    And,     // &
    Or,      // |
    Xor,     // ^
    Shl,     // <<
    Shr,     // >>
    AndNot,  // &^

    AddAssign,     // +=
    SubAssign,     // -=
    MulAssign,     // *=
    QuoAssign,     // /=
    RemAssign,     // %=
    AndAssign,     // &=
    OrAssign,      // |=
    XorAssign,     // ^=
    ShlAssign,     // <<=
    ShrAssign,     // >>=
    AndNotAssign,  // &^=

    LAnd,   // &&
    LOr,    // ||
    Arrow,  // <-
    Inc,    // ++
    Dec,    // --

    Eql,     // ==
    Lss,     // <
    Gtr,     // >
    Assign,  // =
    Not,     // !

    Neq,       // !=
    Leq,       // <=
    Geq,       // >=
    Define,    // :=
    Ellipsis,  // ...

    LParen,     // (
    LBrack,     // [
    LBrace,     // {
    Comma,      // ,
    Period,     // .
    RParen,     // )
    RBrack,     // ]
    RBrace,     // }
    Semicolon,  // ;
    Colon,      // :
    Tilde,      // ~

    // Keywords
    Break,
    Case,
    Chan,
    Const,
    Continue,
    Default,
    Defer,
    Else,
    Fallthrough,
    For,
    Func,
    Go,
    Goto,
    If,
    Import,
    Interface,
    Map,
    Package,
    Range,
    Return,
    Select,
    Struct,
    Switch,
    Type,
    Var,
};

// Source position. Lines and columns are 1-based, columns count bytes.
struct Pos {
    int offset = -1;
    int line = 0;
    int column = 0;

    bool
    valid() const {
        return line > 0;
    }
};

struct Token {
    TokenKind kind = TokenKind::Illegal;
    Pos pos;
    std::string lit;
};

// Operator or keyword spelling; the kind name for literal kinds.
std::string
repr(TokenKind kind);

// Binary operator precedence (1 lowest .. 5 highest), 0 for non-operators.
int
precedence(TokenKind kind);

bool
is_keyword(TokenKind kind);

bool
is_literal(TokenKind kind);

// Keyword kind for `word`, or TokenKind::Ident if it is not a keyword.
TokenKind
lookup_keyword(const std::string& word);

}  // namespace gogrep
