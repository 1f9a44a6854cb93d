#include "matcher.hpp"

#include <re2/re2.h>

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace gogrep;

namespace {

namespace L = gogrep::layout;

bool
is_init_slot(NodeKind kind, std::size_t slot) {
    switch (kind) {
        case NodeKind::IfStmt:
            return slot == L::IfStmt::Init;
        case NodeKind::SwitchStmt:
            return slot == L::SwitchStmt::Init;
        case NodeKind::TypeSwitchStmt:
            return slot == L::TypeSwitchStmt::Init;
        default:
            return false;
    }
}

}  // namespace

Matcher::Matcher(const CompiledPattern& pattern) : pattern_(pattern) {
}

std::vector<Match>
Matcher::search(const Node& corpus) const {
    std::vector<Match> matches;
    inspect(corpus, [&](const Node& node) { collect(node, matches); });
    return matches;
}

bool
Matcher::match_node(const Node& candidate, MatchState& state) const {
    return unify(pattern_.root.get(), &candidate, state);
}

bool
Matcher::match_sequence(NodeSpan candidates, SeqClass seq_class, MatchState& state) const {
    if (!accepts_sequence(seq_class)) {
        return false;
    }
    const Node& root = *pattern_.root;
    if (is_sequence_kind(root.kind)) {
        return unify_lists(root.list(L::Sequence::Elems), candidates, state);
    }
    return bind_run(any_wildcard(root), candidates, state);
}

void
Matcher::collect(const Node& node, std::vector<Match>& matches) const {
    MatchState state;
    if (match_node(node, state)) {
        TRACE("match {} at {}:{}\n", repr(node.kind), node.pos.line, node.pos.column);
        matches.push_back(Match{&node, NodeSpan(), SeqClass::Exprs, node.pos, std::move(state)});
    }

    const auto& shape = shape_of(node.kind);
    for (std::size_t i = 0; i < node.lists.size(); i++) {
        auto list = node.list(i);
        if (list.empty()) {
            continue;
        }
        MatchState seq_state;
        if (match_sequence(list, shape.lists[i].second, seq_state)) {
            const Node* first = list[0].get();
            TRACE("sequence match {}[{}] at {}:{}\n", shape.lists[i].first, list.size(), first->pos.line,
                  first->pos.column);
            matches.push_back(Match{first, list, shape.lists[i].second, first->pos, std::move(seq_state)});
        }
    }
}

bool
Matcher::unify(const Node* pattern, const Node* candidate, MatchState& state) const {
    if (pattern == nullptr || candidate == nullptr) {
        return pattern == candidate;
    }

    if (pattern->kind == NodeKind::Ident && pattern->wildcard >= 0) {
        return unify_wildcard(*pattern_.wildcard(pattern->wildcard), candidate, state);
    }

    if (pattern_.aggressive && pattern->kind != NodeKind::ParenExpr) {
        while (candidate->kind == NodeKind::ParenExpr) {
            candidate = candidate->slot(L::ParenExpr::X);
        }
    }

    if (pattern->kind != candidate->kind || pattern->value != candidate->value) {
        return false;
    }

    if (pattern->tok != candidate->tok) {
        if (!pattern_.aggressive) {
            return false;
        }
        if (pattern->kind == NodeKind::AssignStmt && pattern->tok == TokenKind::Assign &&
            candidate->tok == TokenKind::Define) {
            // = matches :=
        } else if (pattern->kind == NodeKind::CaseClause && pattern->tok == TokenKind::Case &&
                   candidate->tok == TokenKind::Default) {
            // case $*x: matches default:
            auto list = pattern->list(L::CaseClause::List);
            int any = list.size() == 1 ? any_wildcard(*list[0]) : -1;
            if (any < 0 || !bind_run(any, NodeSpan(), state)) {
                return false;
            }
            return unify_lists(pattern->list(L::CaseClause::Body), candidate->list(L::CaseClause::Body), state);
        } else {
            return false;
        }
    }

    for (std::size_t i = 0; i < pattern->slots.size(); i++) {
        const Node* p = pattern->slot(i);
        const Node* c = candidate->slot(i);
        if (p == nullptr && c != nullptr && pattern_.aggressive && is_init_slot(pattern->kind, i)) {
            continue;
        }
        if (!unify(p, c, state)) {
            return false;
        }
    }

    for (std::size_t i = 0; i < pattern->lists.size(); i++) {
        if (!unify_lists(pattern->list(i), candidate->list(i), state)) {
            return false;
        }
    }
    return true;
}

bool
Matcher::unify_wildcard(const WildcardInfo& info, const Node* candidate, MatchState& state) const {
    if (info.any) {
        return false;
    }
    if (info.name_rx) {
        if (candidate->kind != NodeKind::Ident || !RE2::FullMatch(candidate->value, *info.name_rx)) {
            return false;
        }
    }
    if (!info.binds()) {
        return true;
    }

    auto it = state.find(info.name);
    if (it == state.end()) {
        Binding binding;
        binding.nodes.push_back(candidate);
        state.emplace(info.name, std::move(binding));
        return true;
    }
    const auto& bound = it->second.nodes;
    return bound.size() == 1 && equal_nodes(bound[0], candidate);
}

bool
Matcher::unify_lists(NodeSpan patterns, NodeSpan candidates, MatchState& state) const {
    std::size_t fixed = 0;
    bool has_any = false;
    for (const auto& p : patterns) {
        if (any_wildcard(*p) >= 0) {
            has_any = true;
        } else {
            fixed++;
        }
    }
    std::size_t count = candidates.size();
    if (count < fixed || (!has_any && count != fixed)) {
        return false;
    }
    return align(patterns, candidates, 0, 0, state);
}

bool
Matcher::align(NodeSpan patterns, NodeSpan candidates, std::size_t pi, std::size_t ci, MatchState& state) const {
    std::size_t pattern_count = patterns.size();
    std::size_t candidate_count = candidates.size();
    if (pi == pattern_count) {
        return ci == candidate_count;
    }

    int any = any_wildcard(*patterns[pi]);
    if (any >= 0) {
        for (std::size_t end = ci; end <= candidate_count; end++) {
            MatchState attempt = state;
            if (bind_run(any, candidates.subspan(ci, end - ci), attempt) &&
                align(patterns, candidates, pi + 1, end, attempt)) {
                state = std::move(attempt);
                return true;
            }
        }
        return false;
    }

    if (ci == candidate_count) {
        return false;
    }
    return unify(patterns[pi].get(), candidates[ci].get(), state) &&
           align(patterns, candidates, pi + 1, ci + 1, state);
}

bool
Matcher::bind_run(int wildcard, NodeSpan run, MatchState& state) const {
    const WildcardInfo* info = pattern_.wildcard(wildcard);
    if (info == nullptr) {
        return false;
    }
    if (!info->binds()) {
        return true;
    }

    auto it = state.find(info->name);
    if (it == state.end()) {
        Binding binding;
        binding.sequence = true;
        for (const auto& node : run) {
            binding.nodes.push_back(node.get());
        }
        state.emplace(info->name, std::move(binding));
        return true;
    }

    const auto& bound = it->second.nodes;
    if (bound.size() != static_cast<std::size_t>(run.size())) {
        return false;
    }
    for (std::size_t i = 0; i < bound.size(); i++) {
        if (!equal_nodes(bound[i], run[i].get())) {
            return false;
        }
    }
    return true;
}

// Wildcard id when `element` stands for an any-count wildcard in its list:
// the identifier itself, a statement made of it, an anonymous field or a
// lone var/const name.
int
Matcher::any_wildcard(const Node& element) const {
    const Node* n = &element;
    switch (n->kind) {
        case NodeKind::ExprStmt:
            n = n->slot(L::ExprStmt::X);
            break;
        case NodeKind::Field:
            if (!n->lists[L::Field::Names].empty() || n->slot(L::Field::Tag)) {
                return -1;
            }
            n = n->slot(L::Field::Type);
            break;
        case NodeKind::ValueSpec:
            if (n->lists[L::ValueSpec::Names].size() != 1 || n->slot(L::ValueSpec::Type) ||
                !n->lists[L::ValueSpec::Values].empty()) {
                return -1;
            }
            n = n->lists[L::ValueSpec::Names][0].get();
            break;
        default:
            break;
    }
    if (n && n->kind == NodeKind::Ident && n->wildcard >= 0 && pattern_.wildcard(n->wildcard)->any) {
        return n->wildcard;
    }
    return -1;
}

bool
Matcher::accepts_sequence(SeqClass seq_class) const {
    const Node& root = *pattern_.root;
    switch (root.kind) {
        case NodeKind::ExprList:
            return seq_class == SeqClass::Exprs || seq_class == SeqClass::Idents;
        case NodeKind::StmtList:
            return seq_class == SeqClass::Stmts;
        case NodeKind::DeclList:
            return seq_class == SeqClass::Decls;
        default:
            return any_wildcard(root) >= 0;
    }
}

std::vector<Match>
gogrep::search(const CompiledPattern& pattern, const Node& corpus) {
    return Matcher(pattern).search(corpus);
}
