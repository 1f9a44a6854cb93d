#pragma once

/*
    Recursive descent parser for Go source text.

    There is one entry point per syntactic category. Each returns false on the
    first syntax error and describes it in `error`; nothing is recovered.
*/

#include "ast.hpp"
#include "token.hpp"

#include <string>

namespace gogrep {

struct ParseError {
    Pos pos;
    std::string message;

    // "line:column: message"
    std::string
    str() const;
};

bool
parse_file(const std::string& source, NodePtr& file, ParseError& error);

// A single expression (types included), optionally followed by a semicolon.
bool
parse_expr(const std::string& source, NodePtr& expr, ParseError& error);

// One or more comma-separated expressions.
bool
parse_expr_list(const std::string& source, NodeList& exprs, ParseError& error);

// Zero or more statements, as found inside a function body.
bool
parse_stmt_list(const std::string& source, NodeList& stmts, ParseError& error);

bool
parse_type(const std::string& source, NodePtr& type, ParseError& error);

// Top-level declarations without a package clause.
bool
parse_decl_list(const std::string& source, NodeList& decls, ParseError& error);

}  // namespace gogrep
