#pragma once

/*
    Structural matcher.

    A compiled pattern is unified against every node of a corpus tree, and
    against every non-empty child list when the pattern can match a list.
    Wildcards bind the nodes they match by name; all occurrences of a name
    within one match must denote structurally equal subtrees. The name `_`
    never binds.

    Any-count wildcards ($*name) only match inside lists, where they take a
    contiguous, possibly empty, run of elements. Runs are chosen leftmost and
    shortest first; a longer run is tried when the rest of the list fails.

    In aggressive mode a few differences are tolerated:

        - parentheses in the corpus that the pattern doesn't have
        - any init statement, when the pattern's if/switch has none
        - `:=` where the pattern has `=`
        - `default:` where the pattern has `case $*x:`
*/

#include "pattern/pattern_compiler.hpp"
#include "syntax/ast.hpp"

#include <map>
#include <string>
#include <vector>

namespace gogrep {

struct Binding {
    std::vector<const Node*> nodes;

    // Bound by an any-count wildcard; `nodes` may then hold any number of nodes.
    bool sequence = false;
};

// Bindings by wildcard name. A fresh state is used for every attempt.
using MatchState = std::map<std::string, Binding>;

struct Match {
    // The matched node, or the first element of a matched sequence.
    const Node* node = nullptr;
    NodeSpan sequence;
    SeqClass seq_class = SeqClass::Exprs;
    Pos pos;
    MatchState bindings;

    bool
    is_sequence() const {
        return !sequence.empty();
    }
};

class Matcher {
   public:
    explicit Matcher(const CompiledPattern& pattern);

    // All matches in `corpus`, in pre-order. Nested and overlapping matches
    // are all reported.
    std::vector<Match>
    search(const Node& corpus) const;

    // One attempt against a single node.
    bool
    match_node(const Node& candidate, MatchState& state) const;

    // One attempt against a run of sibling nodes.
    bool
    match_sequence(NodeSpan candidates, SeqClass seq_class, MatchState& state) const;

   private:
    // Matches at `node` itself and on each of its child lists.
    void
    collect(const Node& node, std::vector<Match>& matches) const;

    bool
    unify(const Node* pattern, const Node* candidate, MatchState& state) const;

    bool
    unify_wildcard(const WildcardInfo& info, const Node* candidate, MatchState& state) const;

    bool
    unify_lists(NodeSpan patterns, NodeSpan candidates, MatchState& state) const;

    bool
    align(NodeSpan patterns, NodeSpan candidates, std::size_t pi, std::size_t ci, MatchState& state) const;

    bool
    bind_run(int wildcard, NodeSpan run, MatchState& state) const;

    int
    any_wildcard(const Node& element) const;

    bool
    accepts_sequence(SeqClass seq_class) const;

    const CompiledPattern& pattern_;
};

std::vector<Match>
search(const CompiledPattern& pattern, const Node& corpus);

}  // namespace gogrep
