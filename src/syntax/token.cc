#include "token.hpp"

#include <string>
#include <unordered_map>

using namespace gogrep;

namespace {

// clang-format off
const std::unordered_map<TokenKind, const char*> kTokenStrings = {
    { TokenKind::Illegal,      "ILLEGAL" },
    { TokenKind::Eof,          "EOF" },
    { TokenKind::Comment,      "COMMENT" },
    { TokenKind::Ident,        "IDENT" },
    { TokenKind::Int,          "INT" },
    { TokenKind::Float,        "FLOAT" },
    { TokenKind::Imag,         "IMAG" },
    { TokenKind::Char,         "CHAR" },
    { TokenKind::String,       "STRING" },
    { TokenKind::Add,          "+" },
    { TokenKind::Sub,          "-" },
    { TokenKind::Mul,          "*" },
    { TokenKind::Quo,          "/" },
    { TokenKind::Rem,          "%" },
    { TokenKind::And,          "&" },
    { TokenKind::Or,           "|" },
    { TokenKind::Xor,          "^" },
    { TokenKind::Shl,          "<<" },
    { TokenKind::Shr,          ">>" },
    { TokenKind::AndNot,       "&^" },
    { TokenKind::AddAssign,    "+=" },
    { TokenKind::SubAssign,    "-=" },
    { TokenKind::MulAssign,    "*=" },
    { TokenKind::QuoAssign,    "/=" },
    { TokenKind::RemAssign,    "%=" },
    { TokenKind::AndAssign,    "&=" },
    { TokenKind::OrAssign,     "|=" },
    { TokenKind::XorAssign,    "^=" },
    { TokenKind::ShlAssign,    "<<=" },
    { TokenKind::ShrAssign,    ">>=" },
    { TokenKind::AndNotAssign, "&^=" },
    { TokenKind::LAnd,         "&&" },
    { TokenKind::LOr,          "||" },
    { TokenKind::Arrow,        "<-" },
    { TokenKind::Inc,          "++" },
    { TokenKind::Dec,          "--" },
    { TokenKind::Eql,          "==" },
    { TokenKind::Lss,          "<" },
    { TokenKind::Gtr,          ">" },
    { TokenKind::Assign,       "=" },
    { TokenKind::Not,          "!" },
    { TokenKind::Neq,          "!=" },
    { TokenKind::Leq,          "<=" },
    { TokenKind::Geq,          ">=" },
    { TokenKind::Define,       ":=" },
    { TokenKind::Ellipsis,     "..." },
    { TokenKind::LParen,       "(" },
    { TokenKind::LBrack,       "[" },
    { TokenKind::LBrace,       "{" },
    { TokenKind::Comma,        "," },
    { TokenKind::Period,       "." },
    { TokenKind::RParen,       ")" },
    { TokenKind::RBrack,       "]" },
    { TokenKind::RBrace,       "}" },
    { TokenKind::Semicolon,    ";" },
    { TokenKind::Colon,        ":" },
    { TokenKind::Tilde,        "~" },
    { TokenKind::Break,        "break" },
    { TokenKind::Case,         "case" },
    { TokenKind::Chan,         "chan" },
    { TokenKind::Const,        "const" },
    { TokenKind::Continue,     "continue" },
    { TokenKind::Default,      "default" },
    { TokenKind::Defer,        "defer" },
    { TokenKind::Else,         "else" },
    { TokenKind::Fallthrough,  "fallthrough" },
    { TokenKind::For,          "for" },
    { TokenKind::Func,         "func" },
    { TokenKind::Go,           "go" },
    { TokenKind::Goto,         "goto" },
    { TokenKind::If,           "if" },
    { TokenKind::Import,       "import" },
    { TokenKind::Interface,    "interface" },
    { TokenKind::Map,          "map" },
    { TokenKind::Package,      "package" },
    { TokenKind::Range,        "range" },
    { TokenKind::Return,       "return" },
    { TokenKind::Select,       "select" },
    { TokenKind::Struct,       "struct" },
    { TokenKind::Switch,       "switch" },
    { TokenKind::Type,         "type" },
    { TokenKind::Var,          "var" },
};
// clang-format on

}  // namespace

std::string
gogrep::repr(TokenKind kind) {
    auto it = kTokenStrings.find(kind);
    if (it == kTokenStrings.end()) {
        return "?";
    }
    return it->second;
}

int
gogrep::precedence(TokenKind kind) {
    switch (kind) {
        case TokenKind::LOr:
            return 1;
        case TokenKind::LAnd:
            return 2;
        case TokenKind::Eql:
        case TokenKind::Neq:
        case TokenKind::Lss:
        case TokenKind::Leq:
        case TokenKind::Gtr:
        case TokenKind::Geq:
            return 3;
        case TokenKind::Add:
        case TokenKind::Sub:
        case TokenKind::Or:
        case TokenKind::Xor:
            return 4;
        case TokenKind::Mul:
        case TokenKind::Quo:
        case TokenKind::Rem:
        case TokenKind::Shl:
        case TokenKind::Shr:
        case TokenKind::And:
        case TokenKind::AndNot:
            return 5;
        default:
            return 0;
    }
}

bool
gogrep::is_keyword(TokenKind kind) {
    return kind >= TokenKind::Break && kind <= TokenKind::Var;
}

bool
gogrep::is_literal(TokenKind kind) {
    return kind >= TokenKind::Ident && kind <= TokenKind::String;
}

TokenKind
gogrep::lookup_keyword(const std::string& word) {
    // clang-format off
    static const std::unordered_map<std::string, TokenKind> keywords = {
        { "break",       TokenKind::Break },
        { "case",        TokenKind::Case },
        { "chan",        TokenKind::Chan },
        { "const",       TokenKind::Const },
        { "continue",    TokenKind::Continue },
        { "default",     TokenKind::Default },
        { "defer",       TokenKind::Defer },
        { "else",        TokenKind::Else },
        { "fallthrough", TokenKind::Fallthrough },
        { "for",         TokenKind::For },
        { "func",        TokenKind::Func },
        { "go",          TokenKind::Go },
        { "goto",        TokenKind::Goto },
        { "if",          TokenKind::If },
        { "import",      TokenKind::Import },
        { "interface",   TokenKind::Interface },
        { "map",         TokenKind::Map },
        { "package",     TokenKind::Package },
        { "range",       TokenKind::Range },
        { "return",      TokenKind::Return },
        { "select",      TokenKind::Select },
        { "struct",      TokenKind::Struct },
        { "switch",      TokenKind::Switch },
        { "type",        TokenKind::Type },
        { "var",         TokenKind::Var },
    };
    // clang-format on
    auto it = keywords.find(word);
    return it == keywords.end() ? TokenKind::Ident : it->second;
}
