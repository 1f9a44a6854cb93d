#include "wildcard_tokenizer.hpp"

#include "syntax/scanner.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace gogrep;

const char* const gogrep::kWildcardPrefix = "_gogrep_";

void
TokenizeResult::set_error(Pos pos, const std::string& message) {
    kind = ErrorKind::Tokenize;
    error = fmt::format("{}:{}: {}", pos.line, pos.column, message);
}

std::string
gogrep::encode_wildcard(int id) {
    return fmt::format("{}{}", kWildcardPrefix, id);
}

int
gogrep::decode_wildcard(const std::string& name) {
    const std::string prefix = kWildcardPrefix;
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return -1;
    }
    int id = 0;
    for (std::size_t i = prefix.size(); i < name.size(); i++) {
        if (!is_digit(name[i])) {
            return -1;
        }
        id = id * 10 + (name[i] - '0');
    }
    return id;
}

namespace {

struct WildcardSyntax {
    std::string name;
    bool any = false;
    bool has_regex = false;
    std::string regex;

    // Offset just past the wildcard.
    std::size_t end = 0;
};

// Reads the wildcard that starts with the '$' at `start`.
class WildcardReader {
   public:
    WildcardReader(const std::string& src, std::size_t start) : src_(src), i_(start + 1) {
    }

    bool
    read(WildcardSyntax& w) {
        if (peek() == '*') {
            w.any = true;
            i_++;
        }
        if (peek() == '(') {
            i_++;
            if (!read_constrained(w)) {
                return false;
            }
        } else {
            w.name = read_name();
            if (w.name.empty()) {
                return fail("$ must be followed by a name, '*' or '('");
            }
        }
        w.end = i_;
        return true;
    }

    std::size_t
    error_offset() const {
        return error_offset_;
    }

    const std::string&
    error() const {
        return error_;
    }

   private:
    // name [,] /regex/ )
    bool
    read_constrained(WildcardSyntax& w) {
        skip_spaces();
        w.name = read_name();
        if (w.name.empty()) {
            return fail("missing wildcard name in $( )");
        }
        skip_spaces();
        if (peek() == ',') {
            i_++;
            skip_spaces();
        }
        if (peek() != '/') {
            return fail("expected /regex/ after wildcard name");
        }
        auto regex_start = i_;
        i_++;
        std::string regex;
        while (true) {
            if (i_ >= src_.size() || src_[i_] == '\n') {
                error_offset_ = regex_start;
                error_ = "regex not terminated";
                return false;
            }
            char c = src_[i_++];
            if (c == '/') {
                break;
            }
            regex.push_back(c);
            if (c == '\\' && i_ < src_.size()) {
                regex.push_back(src_[i_++]);
            }
        }
        skip_spaces();
        if (peek() != ')') {
            return fail("expected ')' after regex");
        }
        i_++;
        w.has_regex = true;
        w.regex = regex;
        return true;
    }

    std::string
    read_name() {
        auto start = i_;
        while (i_ < src_.size() && (is_letter(src_[i_]) || (i_ > start && is_digit(src_[i_])))) {
            i_++;
        }
        return src_.substr(start, i_ - start);
    }

    void
    skip_spaces() {
        while (i_ < src_.size() && (src_[i_] == ' ' || src_[i_] == '\t')) {
            i_++;
        }
    }

    char
    peek() const {
        return i_ < src_.size() ? src_[i_] : '\0';
    }

    bool
    fail(const std::string& message) {
        error_offset_ = i_;
        error_ = message;
        return false;
    }

    const std::string& src_;
    std::size_t i_;
    std::size_t error_offset_ = 0;
    std::string error_;
};

using WildcardKey = std::tuple<std::string, bool, std::string>;

}  // namespace

bool
gogrep::tokenize_pattern(const std::string& pattern, TokenizedPattern& out, TokenizeResult& result) {
    Scanner scanner(pattern);
    std::map<WildcardKey, int> ids;
    std::size_t seen_errors = 0;
    bool first = true;

    while (true) {
        auto tok = scanner.scan();
        TRACE("pattern token {} '{}'\n", repr(tok.kind), tok.lit);

        bool is_dollar = tok.kind == TokenKind::Illegal && tok.lit == "$";
        const auto& scan_errors = scanner.errors();
        if (scan_errors.size() > seen_errors) {
            if (!is_dollar) {
                result.set_error(scan_errors[seen_errors].pos, scan_errors[seen_errors].message);
                return false;
            }
            seen_errors = scan_errors.size();
        }

        if (tok.kind == TokenKind::Eof) {
            break;
        }

        // Inserted semicolons are implied by the text between tokens.
        if (tok.kind == TokenKind::Semicolon && tok.lit == "\n") {
            continue;
        }

        PatternToken pt;
        pt.kind = tok.kind;
        pt.pos = tok.pos;
        pt.end = tok.pos.offset + static_cast<int>(tok.lit.size());
        pt.lit = tok.lit;

        if (first && tok.kind == TokenKind::Tilde) {
            out.aggressive = true;
        } else if (tok.kind == TokenKind::Ident && tok.lit.compare(0, 8, kWildcardPrefix) == 0) {
            result.set_error(tok.pos, fmt::format("'{}': identifiers starting with {} are reserved", tok.lit,
                                                  kWildcardPrefix));
            return false;
        } else if (is_dollar) {
            WildcardReader reader(pattern, tok.pos.offset);
            WildcardSyntax syntax;
            if (!reader.read(syntax)) {
                result.set_error(scanner.position_at(reader.error_offset()), reader.error());
                return false;
            }

            WildcardInfo info;
            info.name = syntax.name;
            info.any = syntax.any;
            if (syntax.has_regex) {
                if (syntax.any) {
                    result.set_error(tok.pos, "regex constraints are not allowed on any-count wildcards");
                    return false;
                }
                RE2::Options options;
                options.set_log_errors(false);
                auto rx = std::make_shared<const RE2>(syntax.regex, options);
                if (!rx->ok()) {
                    result.set_error(tok.pos, fmt::format("invalid regex /{}/: {}", syntax.regex, rx->error()));
                    return false;
                }
                info.name_rx = rx;
            }

            WildcardKey key{syntax.name, syntax.any, syntax.has_regex ? "/" + syntax.regex : ""};
            auto it = ids.find(key);
            int id = 0;
            if (it == ids.end()) {
                id = static_cast<int>(out.wildcards.size());
                ids.emplace(key, id);
                out.wildcards.push_back(info);
            } else {
                id = it->second;
            }

            pt.kind = TokenKind::Ident;
            pt.lit = encode_wildcard(id);
            pt.end = static_cast<int>(syntax.end);
            pt.wildcard = id;
            scanner.skip_to(syntax.end);
        }

        out.tokens.push_back(pt);
        first = false;
    }
    return true;
}
