#pragma once

/*
    Go syntax tree.

    Every node is a `Node` tagged with a `NodeKind`. A kind fixes the node's
    shape: a number of child slots (single children, null when absent) and a
    number of child lists (ordered sequences). Besides children a node has two
    literal fields, `value` (identifier name, literal text, channel direction)
    and `tok` (operator or keyword).

    The shapes, as slots / lists:

        Ident           -                          -                 value=name
        BasicLit        -                          -                 tok=literal kind, value=text
        CompositeLit    Type                       Elts
        FuncLit         Type Body
        ParenExpr       X
        SelectorExpr    X Sel
        IndexExpr       X Index
        SliceExpr       X Low High Max
        TypeAssertExpr  X Type                                       Type null for .(type)
        CallExpr        Fun                        Args              tok=Ellipsis for f(x...)
        StarExpr        X
        UnaryExpr       X                                            tok=op
        BinaryExpr      X Y                                          tok=op
        KeyValueExpr    Key Value
        Ellipsis        Elt
        ArrayType       Len Elt                                      Len null for slices
        StructType      Fields
        FuncType        Params Results
        InterfaceType   Methods
        MapType         Key Value
        ChanType        Value                                        value="chan", "chan<-" or "<-chan"
        Field           Type Tag                   Names
        FieldList       -                          List
        DeclStmt        Decl
        EmptyStmt       -
        LabeledStmt     Label Stmt
        ExprStmt        X
        SendStmt        Chan Value
        IncDecStmt      X                                            tok=++/--
        AssignStmt      -                          Lhs Rhs           tok=assign op
        GoStmt          Call
        DeferStmt       Call
        ReturnStmt      -                          Results
        BranchStmt      Label                                        tok=keyword
        BlockStmt       -                          List
        IfStmt          Init Cond Body Else
        CaseClause      -                          List Body         tok=case/default
        SwitchStmt      Init Tag Body
        TypeSwitchStmt  Init Assign Body
        CommClause      Comm                       Body              tok=case/default
        SelectStmt      Body
        ForStmt         Init Cond Post Body
        RangeStmt       Key Value X Body                             tok=:=, = or Illegal
        ImportSpec      Name Path
        ValueSpec       Type                       Names Values
        TypeSpec        Name Type                                    tok=Assign for aliases
        GenDecl         -                          Specs             tok=keyword
        FuncDecl        Recv Name Type Body
        File            Name                       Decls
        ExprList        -                          Elems
        StmtList        -                          Elems
        DeclList        -                          Elems

    ExprList, StmtList and DeclList never appear in parsed files; they hold
    patterns made of several expressions, statements or declarations.
*/

#include "token.hpp"

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gogrep {

enum class NodeKind : uint8_t {
    Bad,

    // Expressions
    Ident,
    BasicLit,
    CompositeLit,
    FuncLit,
    ParenExpr,
    SelectorExpr,
    IndexExpr,
    SliceExpr,
    TypeAssertExpr,
    CallExpr,
    StarExpr,
    UnaryExpr,
    BinaryExpr,
    KeyValueExpr,
    Ellipsis,

    // Types
    ArrayType,
    StructType,
    FuncType,
    InterfaceType,
    MapType,
    ChanType,
    Field,
    FieldList,

    // Statements
    DeclStmt,
    EmptyStmt,
    LabeledStmt,
    ExprStmt,
    SendStmt,
    IncDecStmt,
    AssignStmt,
    GoStmt,
    DeferStmt,
    ReturnStmt,
    BranchStmt,
    BlockStmt,
    IfStmt,
    CaseClause,
    SwitchStmt,
    TypeSwitchStmt,
    CommClause,
    SelectStmt,
    ForStmt,
    RangeStmt,

    // Declarations
    ImportSpec,
    ValueSpec,
    TypeSpec,
    GenDecl,
    FuncDecl,
    File,

    // Pattern sequences
    ExprList,
    StmtList,
    DeclList,
};

// What a child list holds; decides how it is printed and which list
// patterns may match it.
enum class SeqClass : uint8_t {
    Exprs,
    Idents,
    Stmts,
    Fields,
    Specs,
    Decls,
};

struct NodeShape {
    const char* name;
    std::vector<const char*> slots;
    std::vector<std::pair<const char*, SeqClass>> lists;
};

const NodeShape&
shape_of(NodeKind kind);

std::string
repr(NodeKind kind);

// Slot and list indices for each node kind.
namespace layout {
// clang-format off
namespace CompositeLit   { enum { Type = 0, Elts = 0 }; }
namespace FuncLit        { enum { Type = 0, Body = 1 }; }
namespace ParenExpr      { enum { X = 0 }; }
namespace SelectorExpr   { enum { X = 0, Sel = 1 }; }
namespace IndexExpr      { enum { X = 0, Index = 1 }; }
namespace SliceExpr      { enum { X = 0, Low = 1, High = 2, Max = 3 }; }
namespace TypeAssertExpr { enum { X = 0, Type = 1 }; }
namespace CallExpr       { enum { Fun = 0, Args = 0 }; }
namespace StarExpr       { enum { X = 0 }; }
namespace UnaryExpr      { enum { X = 0 }; }
namespace BinaryExpr     { enum { X = 0, Y = 1 }; }
namespace KeyValueExpr   { enum { Key = 0, Value = 1 }; }
namespace Ellipsis       { enum { Elt = 0 }; }
namespace ArrayType      { enum { Len = 0, Elt = 1 }; }
namespace StructType     { enum { Fields = 0 }; }
namespace FuncType       { enum { Params = 0, Results = 1 }; }
namespace InterfaceType  { enum { Methods = 0 }; }
namespace MapType        { enum { Key = 0, Value = 1 }; }
namespace ChanType       { enum { Value = 0 }; }
namespace Field          { enum { Type = 0, Tag = 1, Names = 0 }; }
namespace FieldList      { enum { List = 0 }; }
namespace DeclStmt       { enum { Decl = 0 }; }
namespace LabeledStmt    { enum { Label = 0, Stmt = 1 }; }
namespace ExprStmt       { enum { X = 0 }; }
namespace SendStmt       { enum { Chan = 0, Value = 1 }; }
namespace IncDecStmt     { enum { X = 0 }; }
namespace AssignStmt     { enum { Lhs = 0, Rhs = 1 }; }
namespace GoStmt         { enum { Call = 0 }; }
namespace DeferStmt      { enum { Call = 0 }; }
namespace ReturnStmt     { enum { Results = 0 }; }
namespace BranchStmt     { enum { Label = 0 }; }
namespace BlockStmt      { enum { List = 0 }; }
namespace IfStmt         { enum { Init = 0, Cond = 1, Body = 2, Else = 3 }; }
namespace CaseClause     { enum { List = 0, Body = 1 }; }
namespace SwitchStmt     { enum { Init = 0, Tag = 1, Body = 2 }; }
namespace TypeSwitchStmt { enum { Init = 0, Assign = 1, Body = 2 }; }
namespace CommClause     { enum { Comm = 0, Body = 0 }; }
namespace SelectStmt     { enum { Body = 0 }; }
namespace ForStmt        { enum { Init = 0, Cond = 1, Post = 2, Body = 3 }; }
namespace RangeStmt      { enum { Key = 0, Value = 1, X = 2, Body = 3 }; }
namespace ImportSpec     { enum { Name = 0, Path = 1 }; }
namespace ValueSpec      { enum { Type = 0, Names = 0, Values = 1 }; }
namespace TypeSpec       { enum { Name = 0, Type = 1 }; }
namespace GenDecl        { enum { Specs = 0 }; }
namespace FuncDecl       { enum { Recv = 0, Name = 1, Type = 2, Body = 3 }; }
namespace File           { enum { Name = 0, Decls = 0 }; }
namespace Sequence       { enum { Elems = 0 }; }
// clang-format on
}  // namespace layout

struct Node;
using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;
using NodeSpan = gsl::span<const NodePtr>;

struct Node {
    NodeKind kind = NodeKind::Bad;
    Pos pos;

    std::string value;
    TokenKind tok = TokenKind::Illegal;

    // Wildcard id for identifiers of a compiled pattern, -1 otherwise.
    int wildcard = -1;

    std::vector<NodePtr> slots;
    std::vector<NodeList> lists;

    const Node*
    slot(std::size_t index) const {
        return slots[index].get();
    }

    NodeSpan
    list(std::size_t index) const {
        return NodeSpan(lists[index]);
    }
};

// A node of the given kind with its slots and lists sized from the shape table.
NodePtr
new_node(NodeKind kind, Pos pos);

NodePtr
new_ident(const std::string& name, Pos pos);

// Structural equality; positions are ignored. Null equals only null.
bool
equal_nodes(const Node* a, const Node* b);

// Pre-order walk over `root` and all of its descendants.
void
inspect(const Node& root, const std::function<void(const Node&)>& visit);

bool
is_sequence_kind(NodeKind kind);

// Element class a pattern sequence kind stands for.
SeqClass
sequence_class(NodeKind kind);

// Indented multi-line tree dump, used for debugging.
std::string
dump(const Node& node, int depth = 0);

}  // namespace gogrep
