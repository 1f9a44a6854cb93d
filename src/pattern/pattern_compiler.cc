#include "pattern_compiler.hpp"

#include "syntax/parser.hpp"

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

using namespace gogrep;

namespace {

bool
is_word(TokenKind kind) {
    switch (kind) {
        case TokenKind::Ident:
        case TokenKind::Int:
        case TokenKind::Float:
        case TokenKind::Imag:
            return true;
        default:
            return is_keyword(kind);
    }
}

// Writes the tokens back out as Go text. The text between tokens is kept as
// it was so that line and column numbers survive; wildcards are replaced by
// their encoded identifiers and every length change is recorded.
// Only the leading aggressive marker is blanked out; any other `~` is left
// for the parser to reject.
void
synthesize(const std::string& pattern,
           const TokenizedPattern& tokenized,
           LineColBuffer& buf,
           std::vector<PosOffset>& offsets) {
    int last_end = 0;
    bool last_word = false;
    bool last_wildcard = false;

    const auto& tokens = tokenized.tokens;
    for (std::size_t i = 0; i < tokens.size(); i++) {
        const auto& tok = tokens[i];
        auto gap = pattern.substr(last_end, tok.pos.offset - last_end);
        buf.write(gap);
        last_end = tok.end;

        if (i == 0 && tokenized.aggressive) {
            buf.write(std::string(tok.lit.size(), ' '));
            last_word = false;
            last_wildcard = false;
            continue;
        }

        bool wildcard = tok.wildcard >= 0;
        if (gap.empty() && last_word && is_word(tok.kind) && (wildcard || last_wildcard)) {
            buf.write(" ");
            offsets.push_back({buf.line(), buf.column(), buf.offset(), 1});
        }

        buf.write(tok.lit);
        if (wildcard) {
            int source_length = tok.end - tok.pos.offset;
            offsets.push_back(
                {buf.line(), buf.column(), buf.offset(), static_cast<int>(tok.lit.size()) - source_length});
        }
        last_word = is_word(tok.kind);
        last_wildcard = wildcard;
    }
}

NodePtr
wrap_sequence(NodeKind kind, NodeList elems) {
    auto pos = elems.empty() ? Pos{} : elems.front()->pos;
    auto node = new_node(kind, pos);
    node->lists[layout::Sequence::Elems] = std::move(elems);
    return node;
}

// `var x = 1` matches local and top-level declarations alike.
NodePtr
unwrap_decl_stmt(NodePtr stmt) {
    if (stmt->kind == NodeKind::DeclStmt) {
        return std::move(stmt->slots[layout::DeclStmt::Decl]);
    }
    return stmt;
}

bool
parse_hypotheses(const std::string& text, NodePtr& root, ParseError& stmt_error) {
    ParseError ignored;

    NodePtr expr;
    if (parse_expr(text, expr, ignored)) {
        root = std::move(expr);
        return true;
    }

    NodeList exprs;
    if (parse_expr_list(text, exprs, ignored) && exprs.size() >= 2) {
        root = wrap_sequence(NodeKind::ExprList, std::move(exprs));
        return true;
    }

    NodeList stmts;
    if (parse_stmt_list(text, stmts, stmt_error)) {
        if (stmts.size() == 1) {
            root = unwrap_decl_stmt(std::move(stmts.front()));
            return true;
        }
        if (stmts.size() >= 2) {
            root = wrap_sequence(NodeKind::StmtList, std::move(stmts));
            return true;
        }
        stmt_error = ParseError{Pos{0, 1, 1}, "expected statement"};
    }

    NodePtr type;
    if (parse_type(text, type, ignored)) {
        root = std::move(type);
        return true;
    }

    NodeList decls;
    if (parse_decl_list(text, decls, ignored) && !decls.empty()) {
        if (decls.size() == 1) {
            root = std::move(decls.front());
        } else {
            root = wrap_sequence(NodeKind::DeclList, std::move(decls));
        }
        return true;
    }

    NodePtr file;
    if (parse_file(text, file, ignored)) {
        root = std::move(file);
        return true;
    }
    return false;
}

void
mark_wildcards(Node& node) {
    if (node.kind == NodeKind::Ident) {
        node.wildcard = decode_wildcard(node.value);
    }
    for (auto& child : node.slots) {
        if (child) {
            mark_wildcards(*child);
        }
    }
    for (auto& list : node.lists) {
        for (auto& child : list) {
            mark_wildcards(*child);
        }
    }
}

// Parser messages quote the encoded identifiers; show the wildcards instead.
std::string
decode_message(const std::string& message, const std::vector<WildcardInfo>& wildcards) {
    const std::string prefix = kWildcardPrefix;
    std::string decoded;
    std::size_t i = 0;
    while (i < message.size()) {
        if (message.compare(i, prefix.size(), prefix) == 0) {
            auto end = i + prefix.size();
            while (end < message.size() && message[end] >= '0' && message[end] <= '9') {
                end++;
            }
            int id = decode_wildcard(message.substr(i, end - i));
            if (id >= 0 && id < static_cast<int>(wildcards.size())) {
                decoded += wildcard_display(wildcards[id]);
                i = end;
                continue;
            }
        }
        decoded.push_back(message[i]);
        i++;
    }
    return decoded;
}

}  // namespace

std::string
gogrep::wildcard_display(const WildcardInfo& info) {
    if (info.name_rx) {
        return fmt::format("$({} /{}/)", info.name, info.name_rx->pattern());
    }
    return fmt::format("${}{}", info.any ? "*" : "", info.name);
}

bool
gogrep::compile_pattern(const std::string& pattern, CompiledPattern& out, CompileResult& result) {
    return compile_pattern(pattern, CompileOptions{}, out, result);
}

bool
gogrep::compile_pattern(const std::string& pattern,
                        const CompileOptions& options,
                        CompiledPattern& out,
                        CompileResult& result) {
    TokenizedPattern tokenized;
    TokenizeResult tokenize_result;
    if (!tokenize_pattern(pattern, tokenized, tokenize_result)) {
        result.kind = ErrorKind::Tokenize;
        result.error = fmt::format("cannot tokenize expr: {}", tokenize_result.error);
        return false;
    }

    const std::size_t marker = tokenized.aggressive ? 1 : 0;
    if (tokenized.tokens.size() <= marker) {
        result.kind = ErrorKind::Compile;
        result.error = "cannot parse expr: empty pattern";
        return false;
    }

    LineColBuffer buf;
    std::vector<PosOffset> offsets;
    synthesize(pattern, tokenized, buf, offsets);

    NodePtr root;
    ParseError stmt_error;
    if (!parse_hypotheses(buf.str(), root, stmt_error)) {
        auto pos = correct_position(stmt_error.pos, offsets);
        result.kind = ErrorKind::Compile;
        result.error = fmt::format("cannot parse expr: {}:{}: {}", pos.line, pos.column,
                                   decode_message(stmt_error.message, tokenized.wildcards));
        return false;
    }

    mark_wildcards(*root);

    out.root = std::move(root);
    out.wildcards = std::move(tokenized.wildcards);
    out.aggressive = tokenized.aggressive || options.aggressive;
    out.encoded = buf.str();
    out.offsets = std::move(offsets);
    return true;
}

std::string
gogrep::dump_pattern(const CompiledPattern& pattern) {
    std::string s = fmt::format("encoded: {}\n", pattern.encoded);
    s += fmt::format("aggressive: {}\n", pattern.aggressive);
    for (std::size_t i = 0; i < pattern.wildcards.size(); i++) {
        const auto& w = pattern.wildcards[i];
        s += fmt::format("wildcard {}: name={} any={}", i, w.name, w.any);
        if (w.name_rx) {
            s += fmt::format(" rx=/{}/", w.name_rx->pattern());
        }
        s += "\n";
    }
    s += dump(*pattern.root);
    return s;
}
