#include "printer.hpp"

#include <fmt/format.h>

#include <string>

using namespace gogrep;

namespace {

namespace L = gogrep::layout;

std::string
print(const Node* node);

std::string
join(NodeSpan nodes, const char* separator) {
    std::string s;
    for (std::size_t i = 0; i < nodes.size(); i++) {
        if (i > 0) {
            s += separator;
        }
        s += print(nodes[i].get());
    }
    return s;
}

const char*
separator_for(SeqClass seq_class) {
    switch (seq_class) {
        case SeqClass::Stmts:
        case SeqClass::Decls:
            return "; ";
        default:
            return ", ";
    }
}

std::string
print_field(const Node& field) {
    auto names = join(field.list(L::Field::Names), ", ");
    auto type = print(field.slot(L::Field::Type));
    std::string s = names.empty() ? type : names + " " + type;
    if (field.slot(L::Field::Tag)) {
        s += " " + print(field.slot(L::Field::Tag));
    }
    return s;
}

std::string
print_fields(const Node* fields, const char* separator) {
    if (!fields) {
        return "";
    }
    std::string s;
    auto list = fields->list(L::FieldList::List);
    for (std::size_t i = 0; i < list.size(); i++) {
        if (i > 0) {
            s += separator;
        }
        s += print_field(*list[i]);
    }
    return s;
}

// "(params) results" without the func keyword
std::string
print_signature(const Node& func_type) {
    std::string s = "(" + print_fields(func_type.slot(L::FuncType::Params), ", ") + ")";
    const auto* results = func_type.slot(L::FuncType::Results);
    if (!results) {
        return s;
    }
    auto list = results->list(L::FieldList::List);
    if (list.size() == 1 && list[0]->list(L::Field::Names).empty()) {
        return s + " " + print_field(*list[0]);
    }
    return s + " (" + print_fields(results, ", ") + ")";
}

std::string
print_interface_method(const Node& field) {
    const auto* type = field.slot(L::Field::Type);
    auto names = field.list(L::Field::Names);
    if (!names.empty() && type->kind == NodeKind::FuncType) {
        return print(names[0].get()) + print_signature(*type);
    }
    return print_field(field);
}

std::string
print_block(const Node* block) {
    auto list = block->list(L::BlockStmt::List);
    if (list.empty()) {
        return "{}";
    }
    return "{ " + join(list, "; ") + " }";
}

std::string
print_clause_body(NodeSpan body) {
    if (body.empty()) {
        return "";
    }
    return " " + join(body, "; ");
}

// "init; x" or just "x"
std::string
print_header(const Node* init, const std::string& rest) {
    if (!init) {
        return rest;
    }
    if (rest.empty()) {
        return print(init) + ";";
    }
    return print(init) + "; " + rest;
}

std::string
print_spec_group(const Node& decl) {
    auto keyword = repr(decl.tok);
    auto specs = decl.list(L::GenDecl::Specs);
    if (specs.size() == 1) {
        return keyword + " " + print(specs[0].get());
    }
    return keyword + " (" + join(specs, "; ") + ")";
}

std::string
print(const Node* node) {
    if (!node) {
        return "";
    }
    const Node& n = *node;
    switch (n.kind) {
        case NodeKind::Bad:
            return "BadNode";
        case NodeKind::Ident:
        case NodeKind::BasicLit:
            return n.value;
        case NodeKind::CompositeLit:
            return print(n.slot(L::CompositeLit::Type)) + "{" + join(n.list(L::CompositeLit::Elts), ", ") + "}";
        case NodeKind::FuncLit:
            return print(n.slot(L::FuncLit::Type)) + " " + print_block(n.slot(L::FuncLit::Body));
        case NodeKind::ParenExpr:
            return "(" + print(n.slot(L::ParenExpr::X)) + ")";
        case NodeKind::SelectorExpr:
            return print(n.slot(L::SelectorExpr::X)) + "." + print(n.slot(L::SelectorExpr::Sel));
        case NodeKind::IndexExpr:
            return print(n.slot(L::IndexExpr::X)) + "[" + print(n.slot(L::IndexExpr::Index)) + "]";
        case NodeKind::SliceExpr: {
            auto s = print(n.slot(L::SliceExpr::X)) + "[" + print(n.slot(L::SliceExpr::Low)) + ":" +
                     print(n.slot(L::SliceExpr::High));
            if (n.slot(L::SliceExpr::Max)) {
                s += ":" + print(n.slot(L::SliceExpr::Max));
            }
            return s + "]";
        }
        case NodeKind::TypeAssertExpr: {
            const auto* type = n.slot(L::TypeAssertExpr::Type);
            return print(n.slot(L::TypeAssertExpr::X)) + ".(" + (type ? print(type) : "type") + ")";
        }
        case NodeKind::CallExpr: {
            auto s = print(n.slot(L::CallExpr::Fun)) + "(" + join(n.list(L::CallExpr::Args), ", ");
            if (n.tok == TokenKind::Ellipsis) {
                s += "...";
            }
            return s + ")";
        }
        case NodeKind::StarExpr:
            return "*" + print(n.slot(L::StarExpr::X));
        case NodeKind::UnaryExpr:
            if (n.tok == TokenKind::Range) {
                return "range " + print(n.slot(L::UnaryExpr::X));
            }
            return repr(n.tok) + print(n.slot(L::UnaryExpr::X));
        case NodeKind::BinaryExpr:
            return fmt::format("{} {} {}", print(n.slot(L::BinaryExpr::X)), repr(n.tok),
                               print(n.slot(L::BinaryExpr::Y)));
        case NodeKind::KeyValueExpr:
            return print(n.slot(L::KeyValueExpr::Key)) + ": " + print(n.slot(L::KeyValueExpr::Value));
        case NodeKind::Ellipsis:
            return "..." + print(n.slot(L::Ellipsis::Elt));
        case NodeKind::ArrayType:
            return "[" + print(n.slot(L::ArrayType::Len)) + "]" + print(n.slot(L::ArrayType::Elt));
        case NodeKind::StructType: {
            auto fields = print_fields(n.slot(L::StructType::Fields), "; ");
            return fields.empty() ? "struct{}" : "struct{ " + fields + " }";
        }
        case NodeKind::FuncType:
            return "func" + print_signature(n);
        case NodeKind::InterfaceType: {
            auto methods = n.slot(L::InterfaceType::Methods)->list(L::FieldList::List);
            if (methods.empty()) {
                return "interface{}";
            }
            std::string s = "interface{ ";
            for (std::size_t i = 0; i < methods.size(); i++) {
                if (i > 0) {
                    s += "; ";
                }
                s += print_interface_method(*methods[i]);
            }
            return s + " }";
        }
        case NodeKind::MapType:
            return "map[" + print(n.slot(L::MapType::Key)) + "]" + print(n.slot(L::MapType::Value));
        case NodeKind::ChanType:
            return n.value + " " + print(n.slot(L::ChanType::Value));
        case NodeKind::Field:
            return print_field(n);
        case NodeKind::FieldList:
            return print_fields(&n, ", ");
        case NodeKind::DeclStmt:
            return print(n.slot(L::DeclStmt::Decl));
        case NodeKind::EmptyStmt:
            return "";
        case NodeKind::LabeledStmt:
            return print(n.slot(L::LabeledStmt::Label)) + ": " + print(n.slot(L::LabeledStmt::Stmt));
        case NodeKind::ExprStmt:
            return print(n.slot(L::ExprStmt::X));
        case NodeKind::SendStmt:
            return print(n.slot(L::SendStmt::Chan)) + " <- " + print(n.slot(L::SendStmt::Value));
        case NodeKind::IncDecStmt:
            return print(n.slot(L::IncDecStmt::X)) + repr(n.tok);
        case NodeKind::AssignStmt:
            return fmt::format("{} {} {}", join(n.list(L::AssignStmt::Lhs), ", "), repr(n.tok),
                               join(n.list(L::AssignStmt::Rhs), ", "));
        case NodeKind::GoStmt:
            return "go " + print(n.slot(L::GoStmt::Call));
        case NodeKind::DeferStmt:
            return "defer " + print(n.slot(L::DeferStmt::Call));
        case NodeKind::ReturnStmt: {
            auto results = n.list(L::ReturnStmt::Results);
            return results.empty() ? "return" : "return " + join(results, ", ");
        }
        case NodeKind::BranchStmt: {
            const auto* label = n.slot(L::BranchStmt::Label);
            return label ? repr(n.tok) + " " + print(label) : repr(n.tok);
        }
        case NodeKind::BlockStmt:
            return print_block(&n);
        case NodeKind::IfStmt: {
            auto s = "if " + print_header(n.slot(L::IfStmt::Init), print(n.slot(L::IfStmt::Cond))) + " " +
                     print_block(n.slot(L::IfStmt::Body));
            if (n.slot(L::IfStmt::Else)) {
                s += " else " + print(n.slot(L::IfStmt::Else));
            }
            return s;
        }
        case NodeKind::CaseClause: {
            auto list = n.list(L::CaseClause::List);
            std::string head = n.tok == TokenKind::Default ? "default:" : "case " + join(list, ", ") + ":";
            return head + print_clause_body(n.list(L::CaseClause::Body));
        }
        case NodeKind::SwitchStmt: {
            auto header = print_header(n.slot(L::SwitchStmt::Init), print(n.slot(L::SwitchStmt::Tag)));
            return (header.empty() ? "switch " : "switch " + header + " ") + print_block(n.slot(L::SwitchStmt::Body));
        }
        case NodeKind::TypeSwitchStmt: {
            auto header = print_header(n.slot(L::TypeSwitchStmt::Init), print(n.slot(L::TypeSwitchStmt::Assign)));
            return "switch " + header + " " + print_block(n.slot(L::TypeSwitchStmt::Body));
        }
        case NodeKind::CommClause: {
            std::string head =
                n.tok == TokenKind::Default ? "default:" : "case " + print(n.slot(L::CommClause::Comm)) + ":";
            return head + print_clause_body(n.list(L::CommClause::Body));
        }
        case NodeKind::SelectStmt:
            return "select " + print_block(n.slot(L::SelectStmt::Body));
        case NodeKind::ForStmt: {
            const auto* init = n.slot(L::ForStmt::Init);
            const auto* post = n.slot(L::ForStmt::Post);
            auto cond = print(n.slot(L::ForStmt::Cond));
            std::string header;
            if (init || post) {
                header = fmt::format("{}; {}; {}", print(init), cond, print(post));
            } else {
                header = cond;
            }
            return (header.empty() ? "for " : "for " + header + " ") + print_block(n.slot(L::ForStmt::Body));
        }
        case NodeKind::RangeStmt: {
            std::string s = "for ";
            if (n.slot(L::RangeStmt::Key)) {
                s += print(n.slot(L::RangeStmt::Key));
                if (n.slot(L::RangeStmt::Value)) {
                    s += ", " + print(n.slot(L::RangeStmt::Value));
                }
                s += " " + repr(n.tok) + " ";
            }
            return s + "range " + print(n.slot(L::RangeStmt::X)) + " " + print_block(n.slot(L::RangeStmt::Body));
        }
        case NodeKind::ImportSpec: {
            const auto* name = n.slot(L::ImportSpec::Name);
            return name ? print(name) + " " + print(n.slot(L::ImportSpec::Path)) : print(n.slot(L::ImportSpec::Path));
        }
        case NodeKind::ValueSpec: {
            auto s = join(n.list(L::ValueSpec::Names), ", ");
            if (n.slot(L::ValueSpec::Type)) {
                s += " " + print(n.slot(L::ValueSpec::Type));
            }
            auto values = n.list(L::ValueSpec::Values);
            if (!values.empty()) {
                s += " = " + join(values, ", ");
            }
            return s;
        }
        case NodeKind::TypeSpec:
            return print(n.slot(L::TypeSpec::Name)) + (n.tok == TokenKind::Assign ? " = " : " ") +
                   print(n.slot(L::TypeSpec::Type));
        case NodeKind::GenDecl:
            return print_spec_group(n);
        case NodeKind::FuncDecl: {
            std::string s = "func ";
            if (n.slot(L::FuncDecl::Recv)) {
                s += "(" + print_fields(n.slot(L::FuncDecl::Recv), ", ") + ") ";
            }
            s += print(n.slot(L::FuncDecl::Name)) + print_signature(*n.slot(L::FuncDecl::Type));
            if (n.slot(L::FuncDecl::Body)) {
                s += " " + print_block(n.slot(L::FuncDecl::Body));
            }
            return s;
        }
        case NodeKind::File: {
            auto s = "package " + print(n.slot(L::File::Name));
            auto decls = n.list(L::File::Decls);
            if (!decls.empty()) {
                s += "; " + join(decls, "; ");
            }
            return s;
        }
        case NodeKind::ExprList:
        case NodeKind::StmtList:
        case NodeKind::DeclList:
            return join(n.list(L::Sequence::Elems), separator_for(sequence_class(n.kind)));
    }
    return "";
}

}  // namespace

std::string
gogrep::print_node(const Node& node) {
    return print(&node);
}

std::string
gogrep::print_sequence(NodeSpan nodes, SeqClass seq_class) {
    return join(nodes, separator_for(seq_class));
}
