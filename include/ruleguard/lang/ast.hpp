#pragma once

#include <ruleguard/lang/token.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ruleguard {

// ---------------------------------------------------------------------------
// Node kinds
// ---------------------------------------------------------------------------

enum class NodeKind {
    // Unit
    Program,

    // Statements
    VariableDeclaration,
    VariableDeclarator,
    FunctionDeclaration,
    ExpressionStatement,
    BlockStatement,
    EmptyStatement,
    ReturnStatement,
    IfStatement,
    ForStatement,
    ForInStatement,
    WhileStatement,
    DoWhileStatement,
    BreakStatement,
    ContinueStatement,
    ThrowStatement,
    TryStatement,
    CatchClause,
    SwitchStatement,
    SwitchCase,

    // Expressions
    Identifier,
    Literal,
    TemplateLiteral,
    This,
    Array,
    Object,
    Property,
    Function,
    ArrowFunction,
    Unary,
    Update,
    Binary,
    Logical,
    Assignment,
    Conditional,
    Call,
    New,
    Member,
    Sequence,
    Spread
};

const char* node_kind_name(NodeKind k);

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------

struct Node;
using NodePtr = std::unique_ptr<Node>;

// Operand slots by kind:
//   Assignment/Binary/Logical  a = left, b = right, op
//   Unary/Update/Spread        a = argument, op, prefix
//   Conditional                a = test, b = consequent, c = alternate
//   Member                     a = object, b = property, computed
//   Call/New                   a = callee, list = arguments
//   Object                     list = Property | Spread
//   Property                   a = key, b = value, name = key name, computed
//   Array/Sequence             list = elements (null for holes)
//   Function/Arrow/FunctionDeclaration
//                              a = id (may be null), list = params, b = body
//   Program/BlockStatement     list = statements
//   VariableDeclaration        name = "var" | "let" | "const", list = declarators
//   VariableDeclarator         a = id, b = init (may be null)
//   ExpressionStatement, Return, Throw     a = expression (may be null)
//   IfStatement                a = test, b = consequent, c = alternate
//   ForStatement               a = init, b = test, c = update, d = body
//   ForInStatement             a = left, b = right, d = body, op = "in" | "of"
//   While/DoWhile              a = test, d = body
//   TryStatement               a = block, b = handler, c = finalizer
//   CatchClause                a = param (may be null), d = body
//   SwitchStatement            a = discriminant, list = cases
//   SwitchCase                 a = test (null for default), list = consequent
//   Identifier                 name
//   Literal/TemplateLiteral    name = raw source text
//   Break/Continue             name = label (may be empty)
struct Node {
    NodeKind kind;
    Span span;
    std::string name;
    std::string op;
    bool computed = false;
    bool prefix = false;

    NodePtr a;
    NodePtr b;
    NodePtr c;
    NodePtr d;
    std::vector<NodePtr> list;

    explicit Node(NodeKind k) : kind(k) {}

    bool is(NodeKind k) const { return kind == k; }

    // True for an Identifier node with the given name
    bool is_identifier(const std::string& id) const {
        return kind == NodeKind::Identifier && name == id;
    }

    // Non-computed Member whose object is Identifier `object` and whose
    // property is named `property`
    bool is_member_of(const std::string& object, const std::string& property) const;

    // Member property name for non-computed access; empty otherwise
    std::string property_name() const;
};

// The Property node of an Object literal whose key is the identifier `key`,
// written plainly or computed (`[key]`). String and numeric keys never match.
// Returns nullptr when `object` is null or not an Object literal.
const Node* find_property(const Node* object, const std::string& key);

// Decoded value of a string literal's raw text ("'a\\'b'" -> "a'b")
std::string unquote_string(const std::string& raw);

} // namespace ruleguard
