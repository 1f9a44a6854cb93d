#include "matcher.hpp"

#include "pattern/pattern_compiler.hpp"
#include "syntax/parser.hpp"
#include "syntax/printer.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace gogrep;

namespace {

NodePtr
parse_body(const std::string& body) {
    NodePtr file;
    ParseError error;
    auto source = "package p\n\nfunc f() {\n" + body + "\n}\n";
    REQUIRE_MESSAGE(parse_file(source, file, error), error.str());
    return file;
}

std::vector<std::string>
render(const std::vector<Match>& matches) {
    std::vector<std::string> lines;
    for (const auto& m : matches) {
        lines.push_back(m.is_sequence() ? print_sequence(m.sequence, m.seq_class) : print_node(*m.node));
    }
    return lines;
}

// Matches of `pattern` within the body of a function.
std::vector<std::string>
grep(const std::string& pattern, const std::string& body) {
    CompiledPattern compiled;
    CompileResult result;
    REQUIRE_MESSAGE(compile_pattern(pattern, compiled, result), result.error);
    auto file = parse_body(body);
    return render(search(compiled, *file));
}

using Lines = std::vector<std::string>;

}  // namespace

TEST_CASE("matcher_literal_patterns") {
    SUBCASE("exact") {
        REQUIRE(grep("foo(1)", "foo(1)\nfoo(2)\nbar(1)") == Lines{"foo(1)"});
    }

    SUBCASE("layout_is_ignored") {
        REQUIRE(grep("foo(a,b)", "foo(a,\n\tb)") == Lines{"foo(a, b)"});
    }

    SUBCASE("operators_must_agree") {
        REQUIRE(grep("a + b", "_ = a - b\n_ = a + b") == Lines{"a + b"});
    }

    SUBCASE("no_match") {
        REQUIRE(grep("nothing()", "foo(1)").empty());
    }
}

TEST_CASE("matcher_wildcards") {
    SUBCASE("wildcard_matches_any_node") {
        REQUIRE(grep("foo($x)", "foo(1)\nfoo(a + b)\nfoo(1, 2)") == Lines{"foo(1)", "foo(a + b)"});
    }

    SUBCASE("repeated_name_must_bind_equal_nodes") {
        REQUIRE(grep("$x + $x", "_ = a + a\n_ = a + b\n_ = f(1) + f(1)") == Lines{"a + a", "f(1) + f(1)"});
    }

    SUBCASE("underscore_never_binds") {
        REQUIRE(grep("$_ + $_", "_ = a + a\n_ = a + b") == Lines{"a + a", "a + b"});
    }

    SUBCASE("self_assignment") {
        REQUIRE(grep("$x.$_ = $x", "s.f = s\ns.f = t\nt.g = t") == Lines{"s.f = s", "t.g = t"});
    }

    SUBCASE("bindings_are_reported") {
        CompiledPattern compiled;
        CompileResult result;
        REQUIRE(compile_pattern("$x + 1", compiled, result));
        auto file = parse_body("_ = y + 1");
        auto matches = search(compiled, *file);
        REQUIRE(matches.size() == 1);
        const auto& bindings = matches[0].bindings;
        REQUIRE(bindings.count("x") == 1);
        REQUIRE(bindings.at("x").nodes.size() == 1);
        REQUIRE(bindings.at("x").nodes[0]->value == "y");
        REQUIRE_FALSE(bindings.at("x").sequence);
    }

    SUBCASE("nested_matches_are_all_reported") {
        REQUIRE(grep("f($_)", "f(f(1))") == Lines{"f(f(1))", "f(1)"});
    }

    SUBCASE("identifier_and_enclosing_expression_coexist") {
        REQUIRE(grep("x", "_ = x + 1") == Lines{"x"});
        REQUIRE(grep("$_ + 1", "_ = x + 1") == Lines{"x + 1"});
        REQUIRE(grep("$(_ /x/)", "_ = x + 1") == Lines{"x"});
    }

    SUBCASE("compiling_twice_gives_the_same_matches") {
        const std::string body = "a.b = a\na.b = c\nfoo(a, b)";
        REQUIRE(grep("$x.$_ = $x", body) == grep("$x.$_ = $x", body));
        REQUIRE(grep("foo($*_)", body) == grep("foo($*_)", body));
    }

    SUBCASE("match_positions") {
        CompiledPattern compiled;
        CompileResult result;
        REQUIRE(compile_pattern("foo($_)", compiled, result));
        auto file = parse_body("\tx := 1\n\tfoo(x)");
        auto matches = search(compiled, *file);
        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].pos.line == 5);
        REQUIRE(matches[0].pos.column == 2);
    }
}

TEST_CASE("matcher_any_count") {
    SUBCASE("any_number_of_arguments") {
        REQUIRE(grep("foo($*_)", "foo()\nfoo(1)\nfoo(1, 2)\nbar(1)") == Lines{"foo()", "foo(1)", "foo(1, 2)"});
    }

    SUBCASE("fixed_prefix") {
        REQUIRE(grep("foo(1, $*_)", "foo(1)\nfoo(1, 2, 3)\nfoo(2, 1)") == Lines{"foo(1)", "foo(1, 2, 3)"});
    }

    SUBCASE("fixed_suffix") {
        REQUIRE(grep("foo($*_, 3)", "foo(3)\nfoo(1, 2, 3)\nfoo(3, 1)") == Lines{"foo(3)", "foo(1, 2, 3)"});
    }

    SUBCASE("repeated_run_must_be_equal") {
        REQUIRE(grep("foo($*a, $*a)", "foo()\nfoo(1, 1)\nfoo(1, 2)\nfoo(1, 2, 1, 2)") ==
                Lines{"foo()", "foo(1, 1)", "foo(1, 2, 1, 2)"});
    }

    SUBCASE("runs_are_leftmost_and_shortest") {
        CompiledPattern compiled;
        CompileResult result;
        REQUIRE(compile_pattern("foo($*a, 1, $*b)", compiled, result));
        auto file = parse_body("foo(1, 1, 1)");
        auto matches = search(compiled, *file);
        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].bindings.at("a").sequence);
        REQUIRE(matches[0].bindings.at("a").nodes.empty());
        REQUIRE(matches[0].bindings.at("b").nodes.size() == 2);
    }

    SUBCASE("not_in_single_node_position") {
        REQUIRE(grep("$*x + 1", "_ = a + 1").empty());
    }

    SUBCASE("statements_in_a_block") {
        REQUIRE(grep("if $x { $*_ }", "if a {}\nif b { c(); d() }\nif e { f() } else { g() }") ==
                Lines{"if a {}", "if b { c(); d() }"});
    }

    SUBCASE("fields") {
        auto file_matches = [](const std::string& pattern, const std::string& source) {
            CompiledPattern compiled;
            CompileResult result;
            REQUIRE_MESSAGE(compile_pattern(pattern, compiled, result), result.error);
            NodePtr file;
            ParseError error;
            REQUIRE_MESSAGE(parse_file(source, file, error), error.str());
            return render(search(compiled, *file));
        };
        REQUIRE(file_matches("func $_($*_) error", "package p\nfunc a() error\nfunc b(x, y int) error\nfunc c()") ==
                Lines{"func a() error", "func b(x, y int) error"});
    }
}

TEST_CASE("matcher_regex") {
    SUBCASE("full_match_on_identifiers") {
        REQUIRE(grep("$(x /a/)", "a := ab") == Lines{"a"});
    }

    SUBCASE("selector_names") {
        REQUIRE(grep("fmt.$(_ /Fprint.*/)(os.Stdout, $*_)",
                     "fmt.Fprintf(os.Stdout, \"%d\", 1)\nfmt.Fprintln(os.Stdout)\nfmt.Printf(\"x\")\n"
                     "fmt.Fprint(os.Stderr)") ==
                Lines{"fmt.Fprintf(os.Stdout, \"%d\", 1)", "fmt.Fprintln(os.Stdout)"});
    }

    SUBCASE("only_identifiers") {
        REQUIRE(grep("foo($(x /.*/))", "foo(a)\nfoo(1)\nfoo(a.b)") == Lines{"foo(a)"});
    }

    SUBCASE("regex_binding_is_shared") {
        REQUIRE(grep("$(x /^get/) == $(x /^get/)", "_ = getA == getA\n_ = getA == getB\n_ = setA == setA") ==
                Lines{"getA == getA"});
    }
}

TEST_CASE("matcher_sequences") {
    SUBCASE("statement_list") {
        REQUIRE(grep("a = 1; b = 2", "a = 1\nb = 2") == Lines{"a = 1; b = 2"});
    }

    SUBCASE("statement_list_must_cover_the_block") {
        REQUIRE(grep("a = 1; b = 2", "a = 1\nb = 2\nc = 3").empty());
        REQUIRE(grep("$*_; a = 1; b = 2; $*_", "x()\na = 1\nb = 2\nc = 3") == Lines{"x(); a = 1; b = 2; c = 3"});
    }

    SUBCASE("expression_list") {
        REQUIRE(grep("1, $x", "f(1, 2)\nf(1, 2, 3)\nf(2, 1)") == Lines{"1, 2"});
    }

    SUBCASE("expression_list_against_names") {
        REQUIRE(grep("$x, $y", "var a, b = 1") == Lines{"a, b"});
    }

    SUBCASE("match_sequence_api") {
        CompiledPattern compiled;
        CompileResult result;
        REQUIRE(compile_pattern("$*_, 2", compiled, result));
        Matcher matcher(compiled);

        NodeList exprs;
        ParseError error;
        REQUIRE(parse_expr_list("1, 2", exprs, error));
        MatchState state;
        REQUIRE(matcher.match_sequence(NodeSpan(exprs), SeqClass::Exprs, state));
        MatchState other;
        REQUIRE_FALSE(matcher.match_sequence(NodeSpan(exprs), SeqClass::Stmts, other));
    }
}

TEST_CASE("matcher_aggressive") {
    SUBCASE("parentheses") {
        REQUIRE(grep("f(a)", "f((a))").empty());
        REQUIRE(grep("~f(a)", "f((a))") == Lines{"f((a))"});
    }

    SUBCASE("missing_init") {
        REQUIRE(grep("if x {}", "if err := g(); x {}").empty());
        REQUIRE(grep("~if x {}", "if err := g(); x {}") == Lines{"if err := g(); x {}"});
        REQUIRE(grep("~switch x {}", "switch y := 1; x {}") == Lines{"switch y := 1; x {}"});
    }

    SUBCASE("define_for_assign") {
        REQUIRE(grep("x = 1", "x := 1\nx = 1") == Lines{"x = 1"});
        REQUIRE(grep("~x = 1", "x := 1\nx = 1") == Lines{"x := 1", "x = 1"});
        // but not the other way around
        REQUIRE(grep("~x := 1", "x := 1\nx = 1") == Lines{"x := 1"});
    }

    SUBCASE("default_for_any_case") {
        REQUIRE(grep("switch x { case $*_: return }", "switch x { default: return }").empty());
        REQUIRE(grep("~switch x { case $*_: return }", "switch x { default: return }") ==
                Lines{"switch x { default: return }"});
        REQUIRE(grep("~switch x { case 1: return }", "switch x { default: return }").empty());
    }
}

TEST_CASE("matcher_match_node") {
    CompiledPattern compiled;
    CompileResult result;
    REQUIRE(compile_pattern("$x * $x", compiled, result));
    Matcher matcher(compiled);

    NodePtr expr;
    ParseError error;
    REQUIRE(parse_expr("n * n", expr, error));
    MatchState state;
    REQUIRE(matcher.match_node(*expr, state));
    REQUIRE(state.at("x").nodes[0]->value == "n");

    REQUIRE(parse_expr("n * m", expr, error));
    MatchState fresh;
    REQUIRE_FALSE(matcher.match_node(*expr, fresh));
}
