#pragma once

/*
    Wildcard tokenizer.

    Patterns are Go code with wildcards that Go itself can't lex:

        $name           matches one node, bound to name
        $_              matches one node, binds nothing
        $*name          matches any number of nodes in a list
        $*_
        $(name /re/)    matches an identifier whose name fully matches re
        $(_, /re/)

    The pattern is scanned with the Go scanner. Each wildcard comes out as an
    identifier token spelled `_gogrep_<id>`, where the id indexes the wildcard
    table. A leading `~` turns on aggressive matching.
*/

#include "syntax/token.hpp"
#include "util/error.hpp"

#include <re2/re2.h>

#include <memory>
#include <string>
#include <vector>

namespace gogrep {

extern const char* const kWildcardPrefix;

struct WildcardInfo {
    std::string name;
    bool any = false;

    // Null unless the wildcard is regex-constrained.
    std::shared_ptr<const RE2> name_rx;

    bool
    binds() const {
        return name != "_";
    }
};

struct PatternToken {
    TokenKind kind = TokenKind::Illegal;

    // Start in the raw pattern; `end` is the byte offset just past the token.
    Pos pos;
    int end = 0;

    // Source text, or the encoded identifier for wildcards.
    std::string lit;
    int wildcard = -1;
};

struct TokenizedPattern {
    std::vector<PatternToken> tokens;
    std::vector<WildcardInfo> wildcards;
    bool aggressive = false;
};

struct TokenizeResult {
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }

    void
    set_error(Pos pos, const std::string& message);
};

// Splits `pattern` into tokens. Automatically inserted semicolons are not
// part of the output. On error `result` holds "line:col: message".
bool
tokenize_pattern(const std::string& pattern, TokenizedPattern& out, TokenizeResult& result);

std::string
encode_wildcard(int id);

// Wildcard id of an encoded identifier, -1 for any other name.
int
decode_wildcard(const std::string& name);

}  // namespace gogrep
