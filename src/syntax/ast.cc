#include "ast.hpp"

#include <fmt/format.h>

#include <string>
#include <unordered_map>
#include <vector>

using namespace gogrep;

namespace {

using S = SeqClass;

// clang-format off
const std::unordered_map<NodeKind, NodeShape> kShapes = {
    { NodeKind::Bad,            { "Bad",            {},                                   {} } },
    { NodeKind::Ident,          { "Ident",          {},                                   {} } },
    { NodeKind::BasicLit,       { "BasicLit",       {},                                   {} } },
    { NodeKind::CompositeLit,   { "CompositeLit",   { "Type" },                           { { "Elts", S::Exprs } } } },
    { NodeKind::FuncLit,        { "FuncLit",        { "Type", "Body" },                   {} } },
    { NodeKind::ParenExpr,      { "ParenExpr",      { "X" },                              {} } },
    { NodeKind::SelectorExpr,   { "SelectorExpr",   { "X", "Sel" },                       {} } },
    { NodeKind::IndexExpr,      { "IndexExpr",      { "X", "Index" },                     {} } },
    { NodeKind::SliceExpr,      { "SliceExpr",      { "X", "Low", "High", "Max" },        {} } },
    { NodeKind::TypeAssertExpr, { "TypeAssertExpr", { "X", "Type" },                      {} } },
    { NodeKind::CallExpr,       { "CallExpr",       { "Fun" },                            { { "Args", S::Exprs } } } },
    { NodeKind::StarExpr,       { "StarExpr",       { "X" },                              {} } },
    { NodeKind::UnaryExpr,      { "UnaryExpr",      { "X" },                              {} } },
    { NodeKind::BinaryExpr,     { "BinaryExpr",     { "X", "Y" },                         {} } },
    { NodeKind::KeyValueExpr,   { "KeyValueExpr",   { "Key", "Value" },                   {} } },
    { NodeKind::Ellipsis,       { "Ellipsis",       { "Elt" },                            {} } },
    { NodeKind::ArrayType,      { "ArrayType",      { "Len", "Elt" },                     {} } },
    { NodeKind::StructType,     { "StructType",     { "Fields" },                         {} } },
    { NodeKind::FuncType,       { "FuncType",       { "Params", "Results" },              {} } },
    { NodeKind::InterfaceType,  { "InterfaceType",  { "Methods" },                        {} } },
    { NodeKind::MapType,        { "MapType",        { "Key", "Value" },                   {} } },
    { NodeKind::ChanType,       { "ChanType",       { "Value" },                          {} } },
    { NodeKind::Field,          { "Field",          { "Type", "Tag" },                    { { "Names", S::Idents } } } },
    { NodeKind::FieldList,      { "FieldList",      {},                                   { { "List", S::Fields } } } },
    { NodeKind::DeclStmt,       { "DeclStmt",       { "Decl" },                           {} } },
    { NodeKind::EmptyStmt,      { "EmptyStmt",      {},                                   {} } },
    { NodeKind::LabeledStmt,    { "LabeledStmt",    { "Label", "Stmt" },                  {} } },
    { NodeKind::ExprStmt,       { "ExprStmt",       { "X" },                              {} } },
    { NodeKind::SendStmt,       { "SendStmt",       { "Chan", "Value" },                  {} } },
    { NodeKind::IncDecStmt,     { "IncDecStmt",     { "X" },                              {} } },
    { NodeKind::AssignStmt,     { "AssignStmt",     {},                                   { { "Lhs", S::Exprs }, { "Rhs", S::Exprs } } } },
    { NodeKind::GoStmt,         { "GoStmt",         { "Call" },                           {} } },
    { NodeKind::DeferStmt,      { "DeferStmt",      { "Call" },                           {} } },
    { NodeKind::ReturnStmt,     { "ReturnStmt",     {},                                   { { "Results", S::Exprs } } } },
    { NodeKind::BranchStmt,     { "BranchStmt",     { "Label" },                          {} } },
    { NodeKind::BlockStmt,      { "BlockStmt",      {},                                   { { "List", S::Stmts } } } },
    { NodeKind::IfStmt,         { "IfStmt",         { "Init", "Cond", "Body", "Else" },   {} } },
    { NodeKind::CaseClause,     { "CaseClause",     {},                                   { { "List", S::Exprs }, { "Body", S::Stmts } } } },
    { NodeKind::SwitchStmt,     { "SwitchStmt",     { "Init", "Tag", "Body" },            {} } },
    { NodeKind::TypeSwitchStmt, { "TypeSwitchStmt", { "Init", "Assign", "Body" },         {} } },
    { NodeKind::CommClause,     { "CommClause",     { "Comm" },                           { { "Body", S::Stmts } } } },
    { NodeKind::SelectStmt,     { "SelectStmt",     { "Body" },                           {} } },
    { NodeKind::ForStmt,        { "ForStmt",        { "Init", "Cond", "Post", "Body" },   {} } },
    { NodeKind::RangeStmt,      { "RangeStmt",      { "Key", "Value", "X", "Body" },      {} } },
    { NodeKind::ImportSpec,     { "ImportSpec",     { "Name", "Path" },                   {} } },
    { NodeKind::ValueSpec,      { "ValueSpec",      { "Type" },                           { { "Names", S::Idents }, { "Values", S::Exprs } } } },
    { NodeKind::TypeSpec,       { "TypeSpec",       { "Name", "Type" },                   {} } },
    { NodeKind::GenDecl,        { "GenDecl",        {},                                   { { "Specs", S::Specs } } } },
    { NodeKind::FuncDecl,       { "FuncDecl",       { "Recv", "Name", "Type", "Body" },   {} } },
    { NodeKind::File,           { "File",           { "Name" },                           { { "Decls", S::Decls } } } },
    { NodeKind::ExprList,       { "ExprList",       {},                                   { { "Elems", S::Exprs } } } },
    { NodeKind::StmtList,       { "StmtList",       {},                                   { { "Elems", S::Stmts } } } },
    { NodeKind::DeclList,       { "DeclList",       {},                                   { { "Elems", S::Decls } } } },
};
// clang-format on

}  // namespace

const NodeShape&
gogrep::shape_of(NodeKind kind) {
    return kShapes.at(kind);
}

std::string
gogrep::repr(NodeKind kind) {
    return shape_of(kind).name;
}

NodePtr
gogrep::new_node(NodeKind kind, Pos pos) {
    auto node = std::make_unique<Node>();
    const auto& shape = shape_of(kind);
    node->kind = kind;
    node->pos = pos;
    node->slots.resize(shape.slots.size());
    node->lists.resize(shape.lists.size());
    return node;
}

NodePtr
gogrep::new_ident(const std::string& name, Pos pos) {
    auto node = new_node(NodeKind::Ident, pos);
    node->value = name;
    return node;
}

bool
gogrep::equal_nodes(const Node* a, const Node* b) {
    if (a == nullptr || b == nullptr) {
        return a == b;
    }
    if (a->kind != b->kind || a->tok != b->tok || a->value != b->value) {
        return false;
    }
    for (std::size_t i = 0; i < a->slots.size(); i++) {
        if (!equal_nodes(a->slot(i), b->slot(i))) {
            return false;
        }
    }
    for (std::size_t i = 0; i < a->lists.size(); i++) {
        const auto& la = a->lists[i];
        const auto& lb = b->lists[i];
        if (la.size() != lb.size()) {
            return false;
        }
        for (std::size_t j = 0; j < la.size(); j++) {
            if (!equal_nodes(la[j].get(), lb[j].get())) {
                return false;
            }
        }
    }
    return true;
}

void
gogrep::inspect(const Node& root, const std::function<void(const Node&)>& visit) {
    visit(root);
    for (const auto& child : root.slots) {
        if (child) {
            inspect(*child, visit);
        }
    }
    for (const auto& list : root.lists) {
        for (const auto& child : list) {
            inspect(*child, visit);
        }
    }
}

bool
gogrep::is_sequence_kind(NodeKind kind) {
    return kind == NodeKind::ExprList || kind == NodeKind::StmtList || kind == NodeKind::DeclList;
}

SeqClass
gogrep::sequence_class(NodeKind kind) {
    return shape_of(kind).lists.at(0).second;
}

std::string
gogrep::dump(const Node& node, int depth) {
    const auto& shape = shape_of(node.kind);
    std::string indent(depth * 2, ' ');
    std::string s = indent + shape.name;
    if (!node.value.empty()) {
        s += fmt::format(" '{}'", node.value);
    }
    if (node.tok != TokenKind::Illegal) {
        s += fmt::format(" [{}]", repr(node.tok));
    }
    if (node.wildcard >= 0) {
        s += fmt::format(" (wildcard {})", node.wildcard);
    }
    s += "\n";
    for (std::size_t i = 0; i < node.slots.size(); i++) {
        if (node.slots[i]) {
            s += fmt::format("{}  .{}:\n", indent, shape.slots[i]);
            s += dump(*node.slots[i], depth + 2);
        }
    }
    for (std::size_t i = 0; i < node.lists.size(); i++) {
        if (node.lists[i].empty()) {
            continue;
        }
        s += fmt::format("{}  .{}[{}]:\n", indent, shape.lists[i].first, node.lists[i].size());
        for (const auto& child : node.lists[i]) {
            s += dump(*child, depth + 2);
        }
    }
    return s;
}
