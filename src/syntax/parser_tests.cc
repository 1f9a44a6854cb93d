#include "parser.hpp"
#include "printer.hpp"

#include <doctest.h>

#include <string>

using namespace gogrep;

namespace L = gogrep::layout;

namespace {

std::string
reprint_file(const std::string& source) {
    NodePtr file;
    ParseError error;
    REQUIRE_MESSAGE(parse_file(source, file, error), error.str());
    return print_node(*file);
}

std::string
file_error(const std::string& source) {
    NodePtr file;
    ParseError error;
    REQUIRE_FALSE(parse_file(source, file, error));
    return error.str();
}

}  // namespace

TEST_CASE("parser_expr") {
    SUBCASE("precedence") {
        NodePtr expr;
        ParseError error;
        REQUIRE(parse_expr("a + b * c", expr, error));
        REQUIRE(expr->kind == NodeKind::BinaryExpr);
        REQUIRE(expr->tok == TokenKind::Add);
        REQUIRE(expr->slot(L::BinaryExpr::X)->value == "a");
        const Node* y = expr->slot(L::BinaryExpr::Y);
        REQUIRE(y->kind == NodeKind::BinaryExpr);
        REQUIRE(y->tok == TokenKind::Mul);
    }

    SUBCASE("left_associative") {
        NodePtr expr;
        ParseError error;
        REQUIRE(parse_expr("a - b - c", expr, error));
        REQUIRE(expr->slot(L::BinaryExpr::X)->kind == NodeKind::BinaryExpr);
        REQUIRE(expr->slot(L::BinaryExpr::Y)->value == "c");
    }

    SUBCASE("primary_expressions") {
        NodePtr expr;
        ParseError error;
        REQUIRE(parse_expr("x.f(1, y...)[i:j].(T)", expr, error));
        REQUIRE(expr->kind == NodeKind::TypeAssertExpr);
        const Node* slice = expr->slot(L::TypeAssertExpr::X);
        REQUIRE(slice->kind == NodeKind::SliceExpr);
        const Node* call = slice->slot(L::SliceExpr::X);
        REQUIRE(call->kind == NodeKind::CallExpr);
        REQUIRE(call->tok == TokenKind::Ellipsis);
        REQUIRE(call->list(L::CallExpr::Args).size() == 2);
    }

    SUBCASE("composite_literal") {
        NodePtr expr;
        ParseError error;
        REQUIRE(parse_expr("T{a: 1, b: 2}", expr, error));
        REQUIRE(expr->kind == NodeKind::CompositeLit);
        REQUIRE(expr->list(L::CompositeLit::Elts).size() == 2);
        REQUIRE(expr->list(L::CompositeLit::Elts)[0]->kind == NodeKind::KeyValueExpr);
    }

    SUBCASE("receive_only_channel") {
        NodePtr expr;
        ParseError error;
        REQUIRE(parse_expr("<-chan int", expr, error));
        REQUIRE(expr->kind == NodeKind::ChanType);
        REQUIRE(expr->value == "<-chan");

        // A receive from a conversion
        REQUIRE(parse_expr("<-chan int(nil)", expr, error));
        REQUIRE(expr->kind == NodeKind::UnaryExpr);
        REQUIRE(expr->tok == TokenKind::Arrow);
    }

    SUBCASE("trailing_semicolon") {
        NodePtr expr;
        ParseError error;
        REQUIRE(parse_expr("f(x);", expr, error));
        REQUIRE(expr->kind == NodeKind::CallExpr);
    }

    SUBCASE("not_an_expression") {
        NodePtr expr;
        ParseError error;
        REQUIRE_FALSE(parse_expr("x = 1", expr, error));
        REQUIRE(error.str() == "1:3: expected EOF, found '='");
    }

    SUBCASE("three_index_slice") {
        NodePtr expr;
        ParseError error;
        REQUIRE_FALSE(parse_expr("s[1::3]", expr, error));
        REQUIRE(error.message == "middle index required in 3-index slice");
    }

    SUBCASE("expr_list") {
        NodeList exprs;
        ParseError error;
        REQUIRE(parse_expr_list("a, b + 1, f()", exprs, error));
        REQUIRE(exprs.size() == 3);
        REQUIRE(exprs[1]->kind == NodeKind::BinaryExpr);
    }
}

TEST_CASE("parser_stmt") {
    SUBCASE("stmt_list") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("x := 1; x++\nreturn x", stmts, error));
        REQUIRE(stmts.size() == 3);
        REQUIRE(stmts[0]->kind == NodeKind::AssignStmt);
        REQUIRE(stmts[0]->tok == TokenKind::Define);
        REQUIRE(stmts[1]->kind == NodeKind::IncDecStmt);
        REQUIRE(stmts[2]->kind == NodeKind::ReturnStmt);
    }

    SUBCASE("empty_stmt_list") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("", stmts, error));
        REQUIRE(stmts.empty());
    }

    SUBCASE("if_with_init") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("if err := f(); err != nil { return err }", stmts, error));
        REQUIRE(stmts.size() == 1);
        const Node& s = *stmts[0];
        REQUIRE(s.kind == NodeKind::IfStmt);
        REQUIRE(s.slot(L::IfStmt::Init)->kind == NodeKind::AssignStmt);
        REQUIRE(s.slot(L::IfStmt::Cond)->kind == NodeKind::BinaryExpr);
    }

    SUBCASE("composite_literal_in_condition") {
        // T{} can't appear unparenthesized in a control clause
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("if x == y {}", stmts, error));
        REQUIRE(stmts[0]->slot(L::IfStmt::Cond)->kind == NodeKind::BinaryExpr);
        REQUIRE(parse_stmt_list("if x == (T{}) {}", stmts, error));
    }

    SUBCASE("type_switch") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("switch v := x.(type) { case int: default: }", stmts, error));
        REQUIRE(stmts[0]->kind == NodeKind::TypeSwitchStmt);
        auto clauses = stmts[0]->slot(L::TypeSwitchStmt::Body)->list(L::BlockStmt::List);
        REQUIRE(clauses.size() == 2);
        REQUIRE(clauses[1]->tok == TokenKind::Default);
    }

    SUBCASE("range") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("for k, v := range m {}", stmts, error));
        const Node& s = *stmts[0];
        REQUIRE(s.kind == NodeKind::RangeStmt);
        REQUIRE(s.tok == TokenKind::Define);
        REQUIRE(s.slot(L::RangeStmt::Key)->value == "k");
        REQUIRE(s.slot(L::RangeStmt::Value)->value == "v");
        REQUIRE(s.slot(L::RangeStmt::X)->value == "m");

        REQUIRE(parse_stmt_list("for range ch {}", stmts, error));
        REQUIRE(stmts[0]->kind == NodeKind::RangeStmt);
        REQUIRE(stmts[0]->slot(L::RangeStmt::Key) == nullptr);
    }

    SUBCASE("select") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("select { case v := <-ch: use(v); case out <- 1: default: }", stmts, error));
        auto clauses = stmts[0]->slot(L::SelectStmt::Body)->list(L::BlockStmt::List);
        REQUIRE(clauses.size() == 3);
        REQUIRE(clauses[0]->kind == NodeKind::CommClause);
        REQUIRE(clauses[1]->slot(L::CommClause::Comm)->kind == NodeKind::SendStmt);
    }

    SUBCASE("labels_and_branches") {
        NodeList stmts;
        ParseError error;
        REQUIRE(parse_stmt_list("outer: for { break outer }", stmts, error));
        REQUIRE(stmts.size() == 1);
        REQUIRE(stmts[0]->kind == NodeKind::LabeledStmt);
    }

    SUBCASE("go_needs_call") {
        NodeList stmts;
        ParseError error;
        REQUIRE_FALSE(parse_stmt_list("go x", stmts, error));
        REQUIRE(error.message == "function must be invoked in go statement");
    }
}

TEST_CASE("parser_types_and_decls") {
    SUBCASE("types") {
        NodePtr type;
        ParseError error;
        REQUIRE(parse_type("map[string][]*T", type, error));
        REQUIRE(type->kind == NodeKind::MapType);
        REQUIRE(parse_type("func(a, b int, c ...string) (int, error)", type, error));
        REQUIRE(type->kind == NodeKind::FuncType);
        auto params = type->slot(L::FuncType::Params)->list(L::FieldList::List);
        REQUIRE(params.size() == 2);
        REQUIRE(params[0]->list(L::Field::Names).size() == 2);
        REQUIRE(params[1]->slot(L::Field::Type)->kind == NodeKind::Ellipsis);
    }

    SUBCASE("unnamed_params") {
        NodePtr type;
        ParseError error;
        REQUIRE(parse_type("func(int, string)", type, error));
        auto params = type->slot(L::FuncType::Params)->list(L::FieldList::List);
        REQUIRE(params.size() == 2);
        REQUIRE(params[0]->list(L::Field::Names).empty());
    }

    SUBCASE("decl_list") {
        NodeList decls;
        ParseError error;
        REQUIRE(parse_decl_list("var x = 1\nfunc f() {}\ntype T struct{ a int }", decls, error));
        REQUIRE(decls.size() == 3);
        REQUIRE(decls[0]->kind == NodeKind::GenDecl);
        REQUIRE(decls[1]->kind == NodeKind::FuncDecl);
        REQUIRE(decls[2]->kind == NodeKind::GenDecl);
        REQUIRE(decls[2]->tok == TokenKind::Type);
    }

    SUBCASE("file") {
        auto text = reprint_file(
            "package p\n"
            "\n"
            "import \"fmt\"\n"
            "\n"
            "func (s *S) Name() string {\n"
            "\treturn fmt.Sprint(s)\n"
            "}\n");
        REQUIRE(text == "package p; import \"fmt\"; func (s *S) Name() string { return fmt.Sprint(s) }");
    }

    SUBCASE("file_errors") {
        REQUIRE(file_error("func f() {}") == "1:1: expected 'package', found 'func'");
        REQUIRE(file_error("package p\nfunc f() {") == "2:11: expected '}', found EOF");
        REQUIRE(file_error("package p\nvar x = $y") == "2:9: illegal character U+0024 '$'");
    }
}
