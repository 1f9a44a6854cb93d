#pragma once

#include "pattern/position.hpp"
#include "pattern/wildcard_tokenizer.hpp"
#include "syntax/ast.hpp"
#include "util/error.hpp"

#include <string>
#include <vector>

namespace gogrep {

// Immutable after compilation; may be shared by concurrent searches.
struct CompiledPattern {
    NodePtr root;
    std::vector<WildcardInfo> wildcards;
    bool aggressive = false;

    // Go text the pattern was parsed from, wildcards encoded.
    std::string encoded;
    std::vector<PosOffset> offsets;

    const WildcardInfo*
    wildcard(int id) const {
        return id >= 0 ? &wildcards[id] : nullptr;
    }
};

struct CompileOptions {
    // Same as a leading `~` in the pattern.
    bool aggressive = false;
};

struct CompileResult {
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }
};

// Tokenizes and parses a pattern. The narrowest reading wins, in this order:
// expression, expression list, statement, statement list, type,
// declarations, file.
bool
compile_pattern(const std::string& pattern,
                const CompileOptions& options,
                CompiledPattern& out,
                CompileResult& result);

bool
compile_pattern(const std::string& pattern, CompiledPattern& out, CompileResult& result);

// `$name`, `$*name` or `$(name /re/)` as the user wrote it.
std::string
wildcard_display(const WildcardInfo& info);

// Encoded text, wildcard table and tree, for debugging.
std::string
dump_pattern(const CompiledPattern& pattern);

}  // namespace gogrep
