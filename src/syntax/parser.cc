#include "parser.hpp"

#include "scanner.hpp"

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

std::string
ParseError::str() const {
    return fmt::format("{}:{}: {}", pos.line, pos.column, message);
}

namespace {

namespace L = gogrep::layout;

enum class SimpleMode {
    Basic,
    LabelOk,
    RangeOk,
};

class Parser {
   public:
    explicit Parser(const std::string& source) : scanner_(source) {
        next();
    }

    bool
    failed() const {
        return failed_;
    }

    const ParseError&
    error() const {
        return error_;
    }

    NodePtr
    file();

    NodePtr
    expr();

    NodeList
    expr_list();

    NodeList
    stmt_list();

    NodePtr
    type();

    NodePtr
    decl();

    void
    expect_end();

    TokenKind
    current() const {
        return tok_.kind;
    }

   private:
    // Tokens and errors

    void
    next();

    void
    fail(Pos pos, const std::string& message);

    void
    fail_expected(const std::string& what);

    Pos
    expect(TokenKind kind);

    void
    expect_semi();

    bool
    at_comma(TokenKind closing);

    // Expressions

    NodePtr
    ident();

    NodeList
    ident_list();

    NodePtr
    bad();

    NodePtr
    binary_expr(int prec1);

    NodePtr
    unary_expr();

    NodePtr
    primary_expr();

    NodePtr
    operand();

    NodePtr
    index_or_slice(NodePtr x);

    NodePtr
    call(NodePtr fun);

    NodePtr
    composite_lit(NodePtr type);

    NodePtr
    element();

    // Types

    bool
    can_start_type() const;

    NodePtr
    type_name();

    NodePtr
    array_type();

    NodePtr
    struct_type();

    NodePtr
    pointer_type();

    NodePtr
    func_type();

    NodePtr
    interface_type();

    NodePtr
    map_type();

    NodePtr
    chan_type();

    NodePtr
    var_type();

    NodePtr
    parameters();

    NodePtr
    results();

    void
    signature(Node& func_type);

    // Statements

    NodePtr
    stmt();

    NodePtr
    simple_stmt(SimpleMode mode);

    NodePtr
    block();

    NodePtr
    if_stmt();

    NodePtr
    switch_stmt();

    NodePtr
    case_clause(bool type_switch);

    NodePtr
    select_stmt();

    NodePtr
    comm_clause();

    NodePtr
    for_stmt();

    NodePtr
    call_stmt(NodeKind kind);

    NodePtr
    branch_stmt();

    NodePtr
    return_stmt();

    NodePtr
    expr_of(NodePtr stmt, const char* what);

    // Declarations

    NodePtr
    gen_decl(TokenKind keyword);

    NodePtr
    import_spec();

    NodePtr
    value_spec();

    NodePtr
    type_spec();

    NodePtr
    func_decl();

    Scanner scanner_;
    Token tok_;
    std::size_t reported_scan_errors_ = 0;

    // < 0 in control clauses, >= 0 in expressions
    int expr_lev_ = 0;

    bool failed_ = false;
    ParseError error_;
};

void
Parser::next() {
    if (failed_) {
        return;
    }
    tok_ = scanner_.scan();
    TRACE("token {} '{}' at {}:{}\n", repr(tok_.kind), tok_.lit, tok_.pos.line, tok_.pos.column);

    const auto& scan_errors = scanner_.errors();
    if (scan_errors.size() > reported_scan_errors_) {
        reported_scan_errors_ = scan_errors.size();
        fail(scan_errors.back().pos, scan_errors.back().message);
    }
}

void
Parser::fail(Pos pos, const std::string& message) {
    if (failed_) {
        return;
    }
    failed_ = true;
    error_ = ParseError{pos, message};
    // Park on EOF so that every loop unwinds.
    tok_.kind = TokenKind::Eof;
    tok_.lit.clear();
}

void
Parser::fail_expected(const std::string& what) {
    std::string found;
    if (tok_.kind == TokenKind::Semicolon && tok_.lit == "\n") {
        found = "newline";
    } else if (tok_.kind == TokenKind::Eof) {
        found = "EOF";
    } else if (is_literal(tok_.kind)) {
        found = fmt::format("'{}'", tok_.lit);
    } else {
        found = fmt::format("'{}'", repr(tok_.kind));
    }
    fail(tok_.pos, fmt::format("expected {}, found {}", what, found));
}

Pos
Parser::expect(TokenKind kind) {
    auto pos = tok_.pos;
    if (tok_.kind != kind) {
        fail_expected(fmt::format("'{}'", repr(kind)));
        return pos;
    }
    next();
    return pos;
}

void
Parser::expect_semi() {
    switch (tok_.kind) {
        case TokenKind::RParen:
        case TokenKind::RBrace:
        case TokenKind::Eof:
            break;
        case TokenKind::Semicolon:
            next();
            break;
        default:
            fail_expected("';'");
            break;
    }
}

bool
Parser::at_comma(TokenKind closing) {
    if (tok_.kind == TokenKind::Comma) {
        return true;
    }
    if (tok_.kind != closing) {
        fail_expected("','");
    }
    return false;
}

void
Parser::expect_end() {
    if (tok_.kind == TokenKind::Semicolon) {
        next();
    }
    if (tok_.kind != TokenKind::Eof) {
        fail_expected("EOF");
    }
}

//
// Expressions
//

NodePtr
Parser::bad() {
    return new_node(NodeKind::Bad, tok_.pos);
}

NodePtr
Parser::ident() {
    auto pos = tok_.pos;
    std::string name = "_";
    if (tok_.kind == TokenKind::Ident) {
        name = tok_.lit;
        next();
    } else {
        fail_expected("'IDENT'");
    }
    return new_ident(name, pos);
}

NodeList
Parser::ident_list() {
    NodeList list;
    list.push_back(ident());
    while (tok_.kind == TokenKind::Comma) {
        next();
        list.push_back(ident());
    }
    return list;
}

NodePtr
Parser::expr() {
    return binary_expr(1);
}

NodeList
Parser::expr_list() {
    NodeList list;
    list.push_back(expr());
    while (tok_.kind == TokenKind::Comma) {
        next();
        list.push_back(expr());
    }
    return list;
}

NodePtr
Parser::binary_expr(int prec1) {
    auto x = unary_expr();
    while (true) {
        auto op = tok_.kind;
        int prec = precedence(op);
        if (prec < prec1 || prec == 0) {
            return x;
        }
        next();
        auto y = binary_expr(prec + 1);
        auto bin = new_node(NodeKind::BinaryExpr, x->pos);
        bin->tok = op;
        bin->slots[L::BinaryExpr::X] = std::move(x);
        bin->slots[L::BinaryExpr::Y] = std::move(y);
        x = std::move(bin);
    }
}

NodePtr
Parser::unary_expr() {
    auto pos = tok_.pos;
    switch (tok_.kind) {
        case TokenKind::Add:
        case TokenKind::Sub:
        case TokenKind::Not:
        case TokenKind::Xor:
        case TokenKind::And: {
            auto op = tok_.kind;
            next();
            auto node = new_node(NodeKind::UnaryExpr, pos);
            node->tok = op;
            node->slots[L::UnaryExpr::X] = unary_expr();
            return node;
        }
        case TokenKind::Arrow: {
            next();
            auto x = unary_expr();
            // <-chan T
            if (x->kind == NodeKind::ChanType && x->value == "chan") {
                x->value = "<-chan";
                x->pos = pos;
                return x;
            }
            auto node = new_node(NodeKind::UnaryExpr, pos);
            node->tok = TokenKind::Arrow;
            node->slots[L::UnaryExpr::X] = std::move(x);
            return node;
        }
        case TokenKind::Mul: {
            next();
            auto node = new_node(NodeKind::StarExpr, pos);
            node->slots[L::StarExpr::X] = unary_expr();
            return node;
        }
        default:
            return primary_expr();
    }
}

namespace {

bool
is_type_name(const Node& x) {
    return x.kind == NodeKind::Ident ||
           (x.kind == NodeKind::SelectorExpr && x.slot(L::SelectorExpr::X)->kind == NodeKind::Ident);
}

bool
is_literal_type(const Node& x) {
    switch (x.kind) {
        case NodeKind::Ident:
        case NodeKind::ArrayType:
        case NodeKind::StructType:
        case NodeKind::MapType:
            return true;
        case NodeKind::SelectorExpr:
            return is_type_name(x);
        default:
            return false;
    }
}

}  // namespace

NodePtr
Parser::primary_expr() {
    auto x = operand();
    while (true) {
        switch (tok_.kind) {
            case TokenKind::Period: {
                next();
                if (tok_.kind == TokenKind::Ident) {
                    auto sel = new_node(NodeKind::SelectorExpr, x->pos);
                    sel->slots[L::SelectorExpr::X] = std::move(x);
                    sel->slots[L::SelectorExpr::Sel] = ident();
                    x = std::move(sel);
                } else if (tok_.kind == TokenKind::LParen) {
                    next();
                    auto assert_expr = new_node(NodeKind::TypeAssertExpr, x->pos);
                    assert_expr->slots[L::TypeAssertExpr::X] = std::move(x);
                    if (tok_.kind == TokenKind::Type) {
                        next();
                    } else {
                        assert_expr->slots[L::TypeAssertExpr::Type] = type();
                    }
                    expect(TokenKind::RParen);
                    x = std::move(assert_expr);
                } else {
                    fail_expected("selector or type assertion");
                    return x;
                }
            } break;
            case TokenKind::LBrack:
                x = index_or_slice(std::move(x));
                break;
            case TokenKind::LParen:
                x = call(std::move(x));
                break;
            case TokenKind::LBrace:
                if (is_literal_type(*x) && (expr_lev_ >= 0 || !is_type_name(*x))) {
                    x = composite_lit(std::move(x));
                    break;
                }
                return x;
            default:
                return x;
        }
        if (failed_) {
            return x;
        }
    }
}

NodePtr
Parser::operand() {
    auto pos = tok_.pos;
    switch (tok_.kind) {
        case TokenKind::Ident:
            return ident();
        case TokenKind::Int:
        case TokenKind::Float:
        case TokenKind::Imag:
        case TokenKind::Char:
        case TokenKind::String: {
            auto lit = new_node(NodeKind::BasicLit, pos);
            lit->tok = tok_.kind;
            lit->value = tok_.lit;
            next();
            return lit;
        }
        case TokenKind::LParen: {
            next();
            expr_lev_++;
            auto paren = new_node(NodeKind::ParenExpr, pos);
            paren->slots[L::ParenExpr::X] = expr();
            expr_lev_--;
            expect(TokenKind::RParen);
            return paren;
        }
        case TokenKind::Func: {
            auto type = func_type();
            if (tok_.kind == TokenKind::LBrace) {
                expr_lev_++;
                auto lit = new_node(NodeKind::FuncLit, pos);
                lit->slots[L::FuncLit::Type] = std::move(type);
                lit->slots[L::FuncLit::Body] = block();
                expr_lev_--;
                return lit;
            }
            return type;
        }
        case TokenKind::LBrack:
        case TokenKind::Struct:
        case TokenKind::Map:
        case TokenKind::Chan:
        case TokenKind::Interface:
            return type();
        default:
            fail_expected("operand");
            return bad();
    }
}

NodePtr
Parser::index_or_slice(NodePtr x) {
    expect(TokenKind::LBrack);
    expr_lev_++;
    NodePtr index[3];
    int colons = 0;
    if (tok_.kind != TokenKind::Colon) {
        index[0] = expr();
    }
    while (tok_.kind == TokenKind::Colon && colons < 2) {
        colons++;
        next();
        if (tok_.kind != TokenKind::Colon && tok_.kind != TokenKind::RBrack && tok_.kind != TokenKind::Eof) {
            index[colons] = expr();
        }
    }
    expr_lev_--;
    auto rbrack = tok_.pos;
    expect(TokenKind::RBrack);

    if (colons == 0) {
        if (!index[0]) {
            fail(rbrack, "expected operand");
            return x;
        }
        auto node = new_node(NodeKind::IndexExpr, x->pos);
        node->slots[L::IndexExpr::X] = std::move(x);
        node->slots[L::IndexExpr::Index] = std::move(index[0]);
        return node;
    }

    if (colons == 2) {
        if (!index[1]) {
            fail(rbrack, "middle index required in 3-index slice");
        } else if (!index[2]) {
            fail(rbrack, "final index required in 3-index slice");
        }
    }
    auto node = new_node(NodeKind::SliceExpr, x->pos);
    node->slots[L::SliceExpr::X] = std::move(x);
    node->slots[L::SliceExpr::Low] = std::move(index[0]);
    node->slots[L::SliceExpr::High] = std::move(index[1]);
    node->slots[L::SliceExpr::Max] = std::move(index[2]);
    return node;
}

NodePtr
Parser::call(NodePtr fun) {
    auto node = new_node(NodeKind::CallExpr, fun->pos);
    node->slots[L::CallExpr::Fun] = std::move(fun);
    expect(TokenKind::LParen);
    expr_lev_++;
    auto& args = node->lists[L::CallExpr::Args];
    while (tok_.kind != TokenKind::RParen && tok_.kind != TokenKind::Eof) {
        args.push_back(expr());
        if (tok_.kind == TokenKind::Ellipsis) {
            node->tok = TokenKind::Ellipsis;
            next();
        }
        if (!at_comma(TokenKind::RParen)) {
            break;
        }
        next();
    }
    expr_lev_--;
    expect(TokenKind::RParen);
    return node;
}

NodePtr
Parser::element() {
    NodePtr x;
    if (tok_.kind == TokenKind::LBrace) {
        x = composite_lit(nullptr);
    } else {
        x = expr();
    }
    if (tok_.kind != TokenKind::Colon) {
        return x;
    }
    next();
    auto kv = new_node(NodeKind::KeyValueExpr, x->pos);
    kv->slots[L::KeyValueExpr::Key] = std::move(x);
    if (tok_.kind == TokenKind::LBrace) {
        kv->slots[L::KeyValueExpr::Value] = composite_lit(nullptr);
    } else {
        kv->slots[L::KeyValueExpr::Value] = expr();
    }
    return kv;
}

NodePtr
Parser::composite_lit(NodePtr type) {
    auto lit = new_node(NodeKind::CompositeLit, type ? type->pos : tok_.pos);
    lit->slots[L::CompositeLit::Type] = std::move(type);
    expect(TokenKind::LBrace);
    expr_lev_++;
    auto& elts = lit->lists[L::CompositeLit::Elts];
    while (tok_.kind != TokenKind::RBrace && tok_.kind != TokenKind::Eof) {
        elts.push_back(element());
        if (!at_comma(TokenKind::RBrace)) {
            break;
        }
        next();
    }
    expr_lev_--;
    expect(TokenKind::RBrace);
    return lit;
}

//
// Types
//

bool
Parser::can_start_type() const {
    switch (tok_.kind) {
        case TokenKind::Ident:
        case TokenKind::LBrack:
        case TokenKind::Struct:
        case TokenKind::Mul:
        case TokenKind::Func:
        case TokenKind::Interface:
        case TokenKind::Map:
        case TokenKind::Chan:
        case TokenKind::LParen:
        case TokenKind::Arrow:
            return true;
        default:
            return false;
    }
}

NodePtr
Parser::type() {
    auto pos = tok_.pos;
    switch (tok_.kind) {
        case TokenKind::Ident:
            return type_name();
        case TokenKind::LBrack:
            return array_type();
        case TokenKind::Struct:
            return struct_type();
        case TokenKind::Mul:
            return pointer_type();
        case TokenKind::Func:
            return func_type();
        case TokenKind::Interface:
            return interface_type();
        case TokenKind::Map:
            return map_type();
        case TokenKind::Chan:
        case TokenKind::Arrow:
            return chan_type();
        case TokenKind::LParen: {
            next();
            auto paren = new_node(NodeKind::ParenExpr, pos);
            paren->slots[L::ParenExpr::X] = type();
            expect(TokenKind::RParen);
            return paren;
        }
        default:
            fail_expected("type");
            return bad();
    }
}

NodePtr
Parser::type_name() {
    auto x = ident();
    if (tok_.kind == TokenKind::Period) {
        next();
        auto sel = new_node(NodeKind::SelectorExpr, x->pos);
        sel->slots[L::SelectorExpr::X] = std::move(x);
        sel->slots[L::SelectorExpr::Sel] = ident();
        return sel;
    }
    return x;
}

NodePtr
Parser::array_type() {
    auto node = new_node(NodeKind::ArrayType, tok_.pos);
    expect(TokenKind::LBrack);
    if (tok_.kind == TokenKind::Ellipsis) {
        node->slots[L::ArrayType::Len] = new_node(NodeKind::Ellipsis, tok_.pos);
        next();
    } else if (tok_.kind != TokenKind::RBrack) {
        expr_lev_++;
        node->slots[L::ArrayType::Len] = expr();
        expr_lev_--;
    }
    expect(TokenKind::RBrack);
    node->slots[L::ArrayType::Elt] = type();
    return node;
}

NodePtr
Parser::struct_type() {
    auto node = new_node(NodeKind::StructType, tok_.pos);
    expect(TokenKind::Struct);
    auto fields = new_node(NodeKind::FieldList, tok_.pos);
    expect(TokenKind::LBrace);
    auto& list = fields->lists[L::FieldList::List];
    while (tok_.kind == TokenKind::Ident || tok_.kind == TokenKind::Mul) {
        auto field = new_node(NodeKind::Field, tok_.pos);
        if (tok_.kind == TokenKind::Ident) {
            auto name = ident();
            auto k = tok_.kind;
            if (k == TokenKind::Period || k == TokenKind::String || k == TokenKind::Semicolon ||
                k == TokenKind::RBrace) {
                // embedded type
                NodePtr typ = std::move(name);
                if (k == TokenKind::Period) {
                    next();
                    auto sel = new_node(NodeKind::SelectorExpr, typ->pos);
                    sel->slots[L::SelectorExpr::X] = std::move(typ);
                    sel->slots[L::SelectorExpr::Sel] = ident();
                    typ = std::move(sel);
                }
                field->slots[L::Field::Type] = std::move(typ);
            } else {
                auto& names = field->lists[L::Field::Names];
                names.push_back(std::move(name));
                while (tok_.kind == TokenKind::Comma) {
                    next();
                    names.push_back(ident());
                }
                field->slots[L::Field::Type] = type();
            }
        } else {
            auto star = new_node(NodeKind::StarExpr, tok_.pos);
            next();
            star->slots[L::StarExpr::X] = type_name();
            field->slots[L::Field::Type] = std::move(star);
        }
        if (tok_.kind == TokenKind::String) {
            auto tag = new_node(NodeKind::BasicLit, tok_.pos);
            tag->tok = TokenKind::String;
            tag->value = tok_.lit;
            next();
            field->slots[L::Field::Tag] = std::move(tag);
        }
        expect_semi();
        list.push_back(std::move(field));
    }
    expect(TokenKind::RBrace);
    node->slots[L::StructType::Fields] = std::move(fields);
    return node;
}

NodePtr
Parser::pointer_type() {
    auto node = new_node(NodeKind::StarExpr, tok_.pos);
    expect(TokenKind::Mul);
    node->slots[L::StarExpr::X] = type();
    return node;
}

NodePtr
Parser::func_type() {
    auto node = new_node(NodeKind::FuncType, tok_.pos);
    expect(TokenKind::Func);
    signature(*node);
    return node;
}

void
Parser::signature(Node& func_type) {
    func_type.slots[L::FuncType::Params] = parameters();
    func_type.slots[L::FuncType::Results] = results();
}

NodePtr
Parser::var_type() {
    if (tok_.kind == TokenKind::Ellipsis) {
        auto node = new_node(NodeKind::Ellipsis, tok_.pos);
        next();
        node->slots[L::Ellipsis::Elt] = type();
        return node;
    }
    return type();
}

NodePtr
Parser::parameters() {
    auto fields = new_node(NodeKind::FieldList, tok_.pos);
    auto& params = fields->lists[L::FieldList::List];
    expect(TokenKind::LParen);
    if (tok_.kind == TokenKind::RParen) {
        next();
        return fields;
    }

    NodeList list;
    while (true) {
        list.push_back(var_type());
        if (tok_.kind != TokenKind::Comma) {
            break;
        }
        next();
        if (tok_.kind == TokenKind::RParen) {
            break;
        }
    }

    if (tok_.kind != TokenKind::RParen && (can_start_type() || tok_.kind == TokenKind::Ellipsis)) {
        // IdentifierList Type { "," IdentifierList Type }
        auto field = new_node(NodeKind::Field, list.front()->pos);
        for (auto& name : list) {
            if (name->kind != NodeKind::Ident) {
                fail(name->pos, "expected identifier");
            }
        }
        field->lists[L::Field::Names] = std::move(list);
        field->slots[L::Field::Type] = var_type();
        params.push_back(std::move(field));

        while (at_comma(TokenKind::RParen)) {
            next();
            if (tok_.kind == TokenKind::RParen) {
                break;
            }
            auto named = new_node(NodeKind::Field, tok_.pos);
            named->lists[L::Field::Names] = ident_list();
            named->slots[L::Field::Type] = var_type();
            params.push_back(std::move(named));
            if (failed_) {
                break;
            }
        }
    } else {
        // Type { "," Type }
        for (auto& typ : list) {
            auto field = new_node(NodeKind::Field, typ->pos);
            field->slots[L::Field::Type] = std::move(typ);
            params.push_back(std::move(field));
        }
    }
    expect(TokenKind::RParen);
    return fields;
}

NodePtr
Parser::results() {
    if (tok_.kind == TokenKind::LParen) {
        return parameters();
    }
    if (!can_start_type()) {
        return nullptr;
    }
    auto fields = new_node(NodeKind::FieldList, tok_.pos);
    auto field = new_node(NodeKind::Field, tok_.pos);
    field->slots[L::Field::Type] = type();
    fields->lists[L::FieldList::List].push_back(std::move(field));
    return fields;
}

NodePtr
Parser::interface_type() {
    auto node = new_node(NodeKind::InterfaceType, tok_.pos);
    expect(TokenKind::Interface);
    auto methods = new_node(NodeKind::FieldList, tok_.pos);
    expect(TokenKind::LBrace);
    auto& list = methods->lists[L::FieldList::List];
    while (tok_.kind == TokenKind::Ident) {
        auto field = new_node(NodeKind::Field, tok_.pos);
        auto name = type_name();
        if (name->kind == NodeKind::Ident && tok_.kind == TokenKind::LParen) {
            auto sig = new_node(NodeKind::FuncType, tok_.pos);
            signature(*sig);
            field->lists[L::Field::Names].push_back(std::move(name));
            field->slots[L::Field::Type] = std::move(sig);
        } else {
            field->slots[L::Field::Type] = std::move(name);
        }
        expect_semi();
        list.push_back(std::move(field));
    }
    expect(TokenKind::RBrace);
    node->slots[L::InterfaceType::Methods] = std::move(methods);
    return node;
}

NodePtr
Parser::map_type() {
    auto node = new_node(NodeKind::MapType, tok_.pos);
    expect(TokenKind::Map);
    expect(TokenKind::LBrack);
    node->slots[L::MapType::Key] = type();
    expect(TokenKind::RBrack);
    node->slots[L::MapType::Value] = type();
    return node;
}

NodePtr
Parser::chan_type() {
    auto node = new_node(NodeKind::ChanType, tok_.pos);
    if (tok_.kind == TokenKind::Chan) {
        next();
        node->value = "chan";
        if (tok_.kind == TokenKind::Arrow) {
            next();
            node->value = "chan<-";
        }
    } else {
        expect(TokenKind::Arrow);
        expect(TokenKind::Chan);
        node->value = "<-chan";
    }
    node->slots[L::ChanType::Value] = type();
    return node;
}

//
// Statements
//

NodeList
Parser::stmt_list() {
    NodeList list;
    while (tok_.kind != TokenKind::Case && tok_.kind != TokenKind::Default && tok_.kind != TokenKind::RBrace &&
           tok_.kind != TokenKind::Eof) {
        list.push_back(stmt());
    }
    return list;
}

NodePtr
Parser::block() {
    auto node = new_node(NodeKind::BlockStmt, tok_.pos);
    expect(TokenKind::LBrace);
    node->lists[L::BlockStmt::List] = stmt_list();
    expect(TokenKind::RBrace);
    return node;
}

NodePtr
Parser::stmt() {
    auto pos = tok_.pos;
    switch (tok_.kind) {
        case TokenKind::Const:
        case TokenKind::Type:
        case TokenKind::Var: {
            auto node = new_node(NodeKind::DeclStmt, pos);
            node->slots[L::DeclStmt::Decl] = gen_decl(tok_.kind);
            return node;
        }
        case TokenKind::Ident:
        case TokenKind::Int:
        case TokenKind::Float:
        case TokenKind::Imag:
        case TokenKind::Char:
        case TokenKind::String:
        case TokenKind::Func:
        case TokenKind::LParen:
        case TokenKind::LBrack:
        case TokenKind::Struct:
        case TokenKind::Map:
        case TokenKind::Chan:
        case TokenKind::Interface:
        case TokenKind::Add:
        case TokenKind::Sub:
        case TokenKind::Mul:
        case TokenKind::And:
        case TokenKind::Xor:
        case TokenKind::Arrow:
        case TokenKind::Not: {
            auto s = simple_stmt(SimpleMode::LabelOk);
            if (s->kind != NodeKind::LabeledStmt) {
                expect_semi();
            }
            return s;
        }
        case TokenKind::Go: {
            auto s = call_stmt(NodeKind::GoStmt);
            expect_semi();
            return s;
        }
        case TokenKind::Defer: {
            auto s = call_stmt(NodeKind::DeferStmt);
            expect_semi();
            return s;
        }
        case TokenKind::Return: {
            auto s = return_stmt();
            expect_semi();
            return s;
        }
        case TokenKind::Break:
        case TokenKind::Continue:
        case TokenKind::Goto:
        case TokenKind::Fallthrough: {
            auto s = branch_stmt();
            expect_semi();
            return s;
        }
        case TokenKind::LBrace: {
            auto s = block();
            expect_semi();
            return s;
        }
        case TokenKind::If: {
            auto s = if_stmt();
            expect_semi();
            return s;
        }
        case TokenKind::Switch: {
            auto s = switch_stmt();
            expect_semi();
            return s;
        }
        case TokenKind::Select: {
            auto s = select_stmt();
            expect_semi();
            return s;
        }
        case TokenKind::For: {
            auto s = for_stmt();
            expect_semi();
            return s;
        }
        case TokenKind::Semicolon: {
            next();
            return new_node(NodeKind::EmptyStmt, pos);
        }
        case TokenKind::RBrace:
            // a semicolon may be omitted before a closing "}"
            return new_node(NodeKind::EmptyStmt, pos);
        default:
            fail_expected("statement");
            return bad();
    }
}

NodePtr
Parser::simple_stmt(SimpleMode mode) {
    auto pos = tok_.pos;
    auto lhs = expr_list();

    switch (tok_.kind) {
        case TokenKind::Define:
        case TokenKind::Assign:
        case TokenKind::AddAssign:
        case TokenKind::SubAssign:
        case TokenKind::MulAssign:
        case TokenKind::QuoAssign:
        case TokenKind::RemAssign:
        case TokenKind::AndAssign:
        case TokenKind::OrAssign:
        case TokenKind::XorAssign:
        case TokenKind::ShlAssign:
        case TokenKind::ShrAssign:
        case TokenKind::AndNotAssign: {
            auto op = tok_.kind;
            next();
            auto assign = new_node(NodeKind::AssignStmt, lhs.front()->pos);
            assign->tok = op;
            assign->lists[L::AssignStmt::Lhs] = std::move(lhs);
            auto& rhs = assign->lists[L::AssignStmt::Rhs];
            if (mode == SimpleMode::RangeOk && tok_.kind == TokenKind::Range &&
                (op == TokenKind::Define || op == TokenKind::Assign)) {
                auto range = new_node(NodeKind::UnaryExpr, tok_.pos);
                range->tok = TokenKind::Range;
                next();
                range->slots[L::UnaryExpr::X] = expr();
                rhs.push_back(std::move(range));
            } else {
                rhs = expr_list();
            }
            return assign;
        }
        default:
            break;
    }

    if (lhs.size() > 1) {
        fail(pos, "expected 1 expression");
        return bad();
    }

    auto x = std::move(lhs.front());
    switch (tok_.kind) {
        case TokenKind::Colon: {
            if (mode == SimpleMode::LabelOk && x->kind == NodeKind::Ident) {
                next();
                auto labeled = new_node(NodeKind::LabeledStmt, x->pos);
                labeled->slots[L::LabeledStmt::Label] = std::move(x);
                labeled->slots[L::LabeledStmt::Stmt] = stmt();
                return labeled;
            }
        } break;
        case TokenKind::Arrow: {
            next();
            auto send = new_node(NodeKind::SendStmt, x->pos);
            send->slots[L::SendStmt::Chan] = std::move(x);
            send->slots[L::SendStmt::Value] = expr();
            return send;
        }
        case TokenKind::Inc:
        case TokenKind::Dec: {
            auto incdec = new_node(NodeKind::IncDecStmt, x->pos);
            incdec->tok = tok_.kind;
            next();
            incdec->slots[L::IncDecStmt::X] = std::move(x);
            return incdec;
        }
        default:
            break;
    }

    auto stmt = new_node(NodeKind::ExprStmt, x->pos);
    stmt->slots[L::ExprStmt::X] = std::move(x);
    return stmt;
}

NodePtr
Parser::call_stmt(NodeKind kind) {
    auto node = new_node(kind, tok_.pos);
    next();
    auto call = expr();
    if (call->kind != NodeKind::CallExpr && !failed_) {
        fail(call->pos, fmt::format("function must be invoked in {} statement",
                                    kind == NodeKind::GoStmt ? "go" : "defer"));
    }
    node->slots[0] = std::move(call);
    return node;
}

NodePtr
Parser::return_stmt() {
    auto node = new_node(NodeKind::ReturnStmt, tok_.pos);
    expect(TokenKind::Return);
    if (tok_.kind != TokenKind::Semicolon && tok_.kind != TokenKind::RBrace && tok_.kind != TokenKind::Eof) {
        node->lists[L::ReturnStmt::Results] = expr_list();
    }
    return node;
}

NodePtr
Parser::branch_stmt() {
    auto node = new_node(NodeKind::BranchStmt, tok_.pos);
    node->tok = tok_.kind;
    next();
    if (node->tok != TokenKind::Fallthrough && tok_.kind == TokenKind::Ident) {
        node->slots[L::BranchStmt::Label] = ident();
    }
    return node;
}

NodePtr
Parser::expr_of(NodePtr stmt, const char* what) {
    if (!stmt) {
        return nullptr;
    }
    if (stmt->kind == NodeKind::ExprStmt) {
        return std::move(stmt->slots[L::ExprStmt::X]);
    }
    fail(stmt->pos, fmt::format("expected {}", what));
    return bad();
}

NodePtr
Parser::if_stmt() {
    auto node = new_node(NodeKind::IfStmt, tok_.pos);
    expect(TokenKind::If);

    if (tok_.kind == TokenKind::LBrace) {
        fail(tok_.pos, "missing condition in if statement");
        return node;
    }

    int prev_lev = expr_lev_;
    expr_lev_ = -1;
    NodePtr init;
    NodePtr cond;
    if (tok_.kind != TokenKind::Semicolon) {
        init = simple_stmt(SimpleMode::Basic);
    }
    if (tok_.kind == TokenKind::Semicolon) {
        next();
        if (tok_.kind == TokenKind::LBrace) {
            fail(tok_.pos, "missing condition in if statement");
            return node;
        }
        cond = simple_stmt(SimpleMode::Basic);
    } else {
        cond = std::move(init);
    }
    expr_lev_ = prev_lev;

    node->slots[L::IfStmt::Init] = std::move(init);
    node->slots[L::IfStmt::Cond] = expr_of(std::move(cond), "boolean expression");
    node->slots[L::IfStmt::Body] = block();

    if (tok_.kind == TokenKind::Else) {
        next();
        if (tok_.kind == TokenKind::If) {
            node->slots[L::IfStmt::Else] = if_stmt();
        } else if (tok_.kind == TokenKind::LBrace) {
            node->slots[L::IfStmt::Else] = block();
        } else {
            fail_expected("if statement or block");
        }
    }
    return node;
}

namespace {

// x.(type) or v := x.(type)
bool
is_type_switch_guard(const Node* s) {
    if (!s) {
        return false;
    }
    auto is_guard_expr = [](const Node* x) {
        return x->kind == NodeKind::TypeAssertExpr && x->slot(L::TypeAssertExpr::Type) == nullptr;
    };
    if (s->kind == NodeKind::ExprStmt) {
        return is_guard_expr(s->slot(L::ExprStmt::X));
    }
    if (s->kind == NodeKind::AssignStmt && s->tok == TokenKind::Define) {
        const auto& lhs = s->lists[L::AssignStmt::Lhs];
        const auto& rhs = s->lists[L::AssignStmt::Rhs];
        return lhs.size() == 1 && rhs.size() == 1 && is_guard_expr(rhs.front().get());
    }
    return false;
}

}  // namespace

NodePtr
Parser::switch_stmt() {
    auto pos = tok_.pos;
    expect(TokenKind::Switch);

    NodePtr s1;
    NodePtr s2;
    if (tok_.kind != TokenKind::LBrace) {
        int prev_lev = expr_lev_;
        expr_lev_ = -1;
        if (tok_.kind != TokenKind::Semicolon) {
            s2 = simple_stmt(SimpleMode::Basic);
        }
        if (tok_.kind == TokenKind::Semicolon) {
            next();
            s1 = std::move(s2);
            if (tok_.kind != TokenKind::LBrace) {
                s2 = simple_stmt(SimpleMode::Basic);
            }
        }
        expr_lev_ = prev_lev;
    }

    bool type_switch = is_type_switch_guard(s2.get());
    auto body = new_node(NodeKind::BlockStmt, tok_.pos);
    expect(TokenKind::LBrace);
    auto& clauses = body->lists[L::BlockStmt::List];
    while (tok_.kind == TokenKind::Case || tok_.kind == TokenKind::Default) {
        clauses.push_back(case_clause(type_switch));
    }
    expect(TokenKind::RBrace);

    if (type_switch) {
        auto node = new_node(NodeKind::TypeSwitchStmt, pos);
        node->slots[L::TypeSwitchStmt::Init] = std::move(s1);
        node->slots[L::TypeSwitchStmt::Assign] = std::move(s2);
        node->slots[L::TypeSwitchStmt::Body] = std::move(body);
        return node;
    }
    auto node = new_node(NodeKind::SwitchStmt, pos);
    node->slots[L::SwitchStmt::Init] = std::move(s1);
    node->slots[L::SwitchStmt::Tag] = expr_of(std::move(s2), "switch expression");
    node->slots[L::SwitchStmt::Body] = std::move(body);
    return node;
}

NodePtr
Parser::case_clause(bool type_switch) {
    auto node = new_node(NodeKind::CaseClause, tok_.pos);
    node->tok = tok_.kind;
    if (tok_.kind == TokenKind::Case) {
        next();
        auto& list = node->lists[L::CaseClause::List];
        if (type_switch) {
            list.push_back(type());
            while (tok_.kind == TokenKind::Comma) {
                next();
                list.push_back(type());
            }
        } else {
            list = expr_list();
        }
    } else {
        expect(TokenKind::Default);
    }
    expect(TokenKind::Colon);
    node->lists[L::CaseClause::Body] = stmt_list();
    return node;
}

NodePtr
Parser::select_stmt() {
    auto node = new_node(NodeKind::SelectStmt, tok_.pos);
    expect(TokenKind::Select);
    auto body = new_node(NodeKind::BlockStmt, tok_.pos);
    expect(TokenKind::LBrace);
    auto& clauses = body->lists[L::BlockStmt::List];
    while (tok_.kind == TokenKind::Case || tok_.kind == TokenKind::Default) {
        clauses.push_back(comm_clause());
    }
    expect(TokenKind::RBrace);
    node->slots[L::SelectStmt::Body] = std::move(body);
    return node;
}

NodePtr
Parser::comm_clause() {
    auto node = new_node(NodeKind::CommClause, tok_.pos);
    node->tok = tok_.kind;
    if (tok_.kind == TokenKind::Case) {
        next();
        auto lhs = expr_list();
        if (tok_.kind == TokenKind::Arrow) {
            if (lhs.size() > 1) {
                fail(lhs.front()->pos, "expected 1 expression");
            }
            next();
            auto send = new_node(NodeKind::SendStmt, lhs.front()->pos);
            send->slots[L::SendStmt::Chan] = std::move(lhs.front());
            send->slots[L::SendStmt::Value] = expr();
            node->slots[L::CommClause::Comm] = std::move(send);
        } else if (tok_.kind == TokenKind::Assign || tok_.kind == TokenKind::Define) {
            auto assign = new_node(NodeKind::AssignStmt, lhs.front()->pos);
            assign->tok = tok_.kind;
            next();
            assign->lists[L::AssignStmt::Lhs] = std::move(lhs);
            assign->lists[L::AssignStmt::Rhs].push_back(expr());
            node->slots[L::CommClause::Comm] = std::move(assign);
        } else {
            if (lhs.size() > 1) {
                fail(lhs.front()->pos, "expected 1 expression");
            }
            auto recv = new_node(NodeKind::ExprStmt, lhs.front()->pos);
            recv->slots[L::ExprStmt::X] = std::move(lhs.front());
            node->slots[L::CommClause::Comm] = std::move(recv);
        }
    } else {
        expect(TokenKind::Default);
    }
    expect(TokenKind::Colon);
    node->lists[L::CommClause::Body] = stmt_list();
    return node;
}

NodePtr
Parser::for_stmt() {
    auto pos = tok_.pos;
    expect(TokenKind::For);

    NodePtr s1;
    NodePtr s2;
    NodePtr s3;
    bool is_range = false;

    if (tok_.kind != TokenKind::LBrace) {
        int prev_lev = expr_lev_;
        expr_lev_ = -1;
        if (tok_.kind != TokenKind::Semicolon) {
            if (tok_.kind == TokenKind::Range) {
                // for range x
                auto assign = new_node(NodeKind::AssignStmt, tok_.pos);
                auto range = new_node(NodeKind::UnaryExpr, tok_.pos);
                range->tok = TokenKind::Range;
                next();
                range->slots[L::UnaryExpr::X] = expr();
                assign->lists[L::AssignStmt::Rhs].push_back(std::move(range));
                s2 = std::move(assign);
                is_range = true;
            } else {
                s2 = simple_stmt(SimpleMode::RangeOk);
                if (s2->kind == NodeKind::AssignStmt) {
                    const auto& rhs = s2->lists[L::AssignStmt::Rhs];
                    is_range = rhs.size() == 1 && rhs.front()->kind == NodeKind::UnaryExpr &&
                               rhs.front()->tok == TokenKind::Range;
                }
            }
        }
        if (!is_range && tok_.kind == TokenKind::Semicolon) {
            next();
            s1 = std::move(s2);
            if (tok_.kind != TokenKind::Semicolon) {
                s2 = simple_stmt(SimpleMode::Basic);
            }
            expect_semi();
            if (tok_.kind != TokenKind::LBrace) {
                s3 = simple_stmt(SimpleMode::Basic);
            }
        }
        expr_lev_ = prev_lev;
    }

    auto body = block();

    if (is_range) {
        auto node = new_node(NodeKind::RangeStmt, pos);
        auto& lhs = s2->lists[L::AssignStmt::Lhs];
        if (lhs.size() > 2) {
            fail(lhs[2]->pos, "range clause permits at most two iteration variables");
        }
        if (!lhs.empty()) {
            node->tok = s2->tok;
            node->slots[L::RangeStmt::Key] = std::move(lhs[0]);
        }
        if (lhs.size() > 1) {
            node->slots[L::RangeStmt::Value] = std::move(lhs[1]);
        }
        auto& range = s2->lists[L::AssignStmt::Rhs].front();
        node->slots[L::RangeStmt::X] = std::move(range->slots[L::UnaryExpr::X]);
        node->slots[L::RangeStmt::Body] = std::move(body);
        return node;
    }

    auto node = new_node(NodeKind::ForStmt, pos);
    node->slots[L::ForStmt::Init] = std::move(s1);
    node->slots[L::ForStmt::Cond] = expr_of(std::move(s2), "for loop condition");
    node->slots[L::ForStmt::Post] = std::move(s3);
    node->slots[L::ForStmt::Body] = std::move(body);
    return node;
}

//
// Declarations
//

NodePtr
Parser::gen_decl(TokenKind keyword) {
    auto node = new_node(NodeKind::GenDecl, tok_.pos);
    node->tok = keyword;
    expect(keyword);

    auto spec = [&]() {
        switch (keyword) {
            case TokenKind::Import:
                return import_spec();
            case TokenKind::Type:
                return type_spec();
            default:
                return value_spec();
        }
    };

    auto& specs = node->lists[L::GenDecl::Specs];
    if (tok_.kind == TokenKind::LParen) {
        next();
        while (tok_.kind != TokenKind::RParen && tok_.kind != TokenKind::Eof) {
            specs.push_back(spec());
            expect_semi();
        }
        expect(TokenKind::RParen);
    } else {
        specs.push_back(spec());
    }
    expect_semi();
    return node;
}

NodePtr
Parser::import_spec() {
    auto node = new_node(NodeKind::ImportSpec, tok_.pos);
    if (tok_.kind == TokenKind::Period) {
        node->slots[L::ImportSpec::Name] = new_ident(".", tok_.pos);
        next();
    } else if (tok_.kind == TokenKind::Ident) {
        node->slots[L::ImportSpec::Name] = ident();
    }
    if (tok_.kind != TokenKind::String) {
        fail_expected("import path");
        return node;
    }
    auto path = new_node(NodeKind::BasicLit, tok_.pos);
    path->tok = TokenKind::String;
    path->value = tok_.lit;
    next();
    node->slots[L::ImportSpec::Path] = std::move(path);
    return node;
}

NodePtr
Parser::value_spec() {
    auto node = new_node(NodeKind::ValueSpec, tok_.pos);
    node->lists[L::ValueSpec::Names] = ident_list();
    if (tok_.kind != TokenKind::Assign && tok_.kind != TokenKind::Semicolon && tok_.kind != TokenKind::RParen &&
        tok_.kind != TokenKind::Eof) {
        node->slots[L::ValueSpec::Type] = type();
    }
    if (tok_.kind == TokenKind::Assign) {
        next();
        node->lists[L::ValueSpec::Values] = expr_list();
    }
    return node;
}

NodePtr
Parser::type_spec() {
    auto node = new_node(NodeKind::TypeSpec, tok_.pos);
    node->slots[L::TypeSpec::Name] = ident();
    if (tok_.kind == TokenKind::Assign) {
        node->tok = TokenKind::Assign;
        next();
    }
    node->slots[L::TypeSpec::Type] = type();
    return node;
}

NodePtr
Parser::func_decl() {
    auto node = new_node(NodeKind::FuncDecl, tok_.pos);
    auto type = new_node(NodeKind::FuncType, tok_.pos);
    expect(TokenKind::Func);
    if (tok_.kind == TokenKind::LParen) {
        node->slots[L::FuncDecl::Recv] = parameters();
    }
    node->slots[L::FuncDecl::Name] = ident();
    signature(*type);
    node->slots[L::FuncDecl::Type] = std::move(type);
    if (tok_.kind == TokenKind::LBrace) {
        expr_lev_++;
        node->slots[L::FuncDecl::Body] = block();
        expr_lev_--;
    }
    expect_semi();
    return node;
}

NodePtr
Parser::decl() {
    switch (tok_.kind) {
        case TokenKind::Import:
        case TokenKind::Const:
        case TokenKind::Type:
        case TokenKind::Var:
            return gen_decl(tok_.kind);
        case TokenKind::Func:
            return func_decl();
        default:
            fail_expected("declaration");
            return bad();
    }
}

NodePtr
Parser::file() {
    auto node = new_node(NodeKind::File, tok_.pos);
    expect(TokenKind::Package);
    node->slots[L::File::Name] = ident();
    expect_semi();

    auto& decls = node->lists[L::File::Decls];
    while (tok_.kind == TokenKind::Import) {
        decls.push_back(gen_decl(TokenKind::Import));
    }
    while (tok_.kind != TokenKind::Eof) {
        decls.push_back(decl());
    }
    return node;
}

}  // namespace

bool
gogrep::parse_file(const std::string& source, NodePtr& file, ParseError& error) {
    Parser p(source);
    auto node = p.file();
    if (p.failed()) {
        error = p.error();
        return false;
    }
    file = std::move(node);
    return true;
}

bool
gogrep::parse_expr(const std::string& source, NodePtr& expr, ParseError& error) {
    Parser p(source);
    auto node = p.expr();
    p.expect_end();
    if (p.failed()) {
        error = p.error();
        return false;
    }
    expr = std::move(node);
    return true;
}

bool
gogrep::parse_expr_list(const std::string& source, NodeList& exprs, ParseError& error) {
    Parser p(source);
    auto list = p.expr_list();
    p.expect_end();
    if (p.failed()) {
        error = p.error();
        return false;
    }
    exprs = std::move(list);
    return true;
}

bool
gogrep::parse_stmt_list(const std::string& source, NodeList& stmts, ParseError& error) {
    Parser p(source);
    auto list = p.stmt_list();
    p.expect_end();
    if (p.failed()) {
        error = p.error();
        return false;
    }
    stmts = std::move(list);
    return true;
}

bool
gogrep::parse_type(const std::string& source, NodePtr& type, ParseError& error) {
    Parser p(source);
    auto node = p.type();
    p.expect_end();
    if (p.failed()) {
        error = p.error();
        return false;
    }
    type = std::move(node);
    return true;
}

bool
gogrep::parse_decl_list(const std::string& source, NodeList& decls, ParseError& error) {
    Parser p(source);
    NodeList list;
    while (p.current() != TokenKind::Eof) {
        list.push_back(p.decl());
    }
    if (p.failed()) {
        error = p.error();
        return false;
    }
    decls = std::move(list);
    return true;
}
