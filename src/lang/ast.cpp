#include <ruleguard/lang/ast.hpp>

namespace ruleguard {

const char* node_kind_name(NodeKind k) {
    switch (k) {
    case NodeKind::Program:             return "Program";
    case NodeKind::VariableDeclaration: return "VariableDeclaration";
    case NodeKind::VariableDeclarator:  return "VariableDeclarator";
    case NodeKind::FunctionDeclaration: return "FunctionDeclaration";
    case NodeKind::ExpressionStatement: return "ExpressionStatement";
    case NodeKind::BlockStatement:      return "BlockStatement";
    case NodeKind::EmptyStatement:      return "EmptyStatement";
    case NodeKind::ReturnStatement:     return "ReturnStatement";
    case NodeKind::IfStatement:         return "IfStatement";
    case NodeKind::ForStatement:        return "ForStatement";
    case NodeKind::ForInStatement:      return "ForInStatement";
    case NodeKind::WhileStatement:      return "WhileStatement";
    case NodeKind::DoWhileStatement:    return "DoWhileStatement";
    case NodeKind::BreakStatement:      return "BreakStatement";
    case NodeKind::ContinueStatement:   return "ContinueStatement";
    case NodeKind::ThrowStatement:      return "ThrowStatement";
    case NodeKind::TryStatement:        return "TryStatement";
    case NodeKind::CatchClause:         return "CatchClause";
    case NodeKind::SwitchStatement:     return "SwitchStatement";
    case NodeKind::SwitchCase:          return "SwitchCase";
    case NodeKind::Identifier:          return "Identifier";
    case NodeKind::Literal:             return "Literal";
    case NodeKind::TemplateLiteral:     return "TemplateLiteral";
    case NodeKind::This:                return "This";
    case NodeKind::Array:               return "Array";
    case NodeKind::Object:              return "Object";
    case NodeKind::Property:            return "Property";
    case NodeKind::Function:            return "Function";
    case NodeKind::ArrowFunction:       return "ArrowFunction";
    case NodeKind::Unary:               return "Unary";
    case NodeKind::Update:              return "Update";
    case NodeKind::Binary:              return "Binary";
    case NodeKind::Logical:             return "Logical";
    case NodeKind::Assignment:          return "Assignment";
    case NodeKind::Conditional:         return "Conditional";
    case NodeKind::Call:                return "Call";
    case NodeKind::New:                 return "New";
    case NodeKind::Member:              return "Member";
    case NodeKind::Sequence:            return "Sequence";
    case NodeKind::Spread:              return "Spread";
    }
    return "Unknown";
}

bool Node::is_member_of(const std::string& object, const std::string& property) const {
    return kind == NodeKind::Member && !computed &&
           a && a->is_identifier(object) &&
           b && b->is_identifier(property);
}

std::string Node::property_name() const {
    if (kind != NodeKind::Member || computed || !b) return "";
    return b->name;
}

const Node* find_property(const Node* object, const std::string& key) {
    if (!object || object->kind != NodeKind::Object) return nullptr;
    for (const auto& prop : object->list) {
        if (prop && prop->kind == NodeKind::Property && prop->a &&
            prop->a->is_identifier(key)) {
            return prop.get();
        }
    }
    return nullptr;
}

std::string unquote_string(const std::string& raw) {
    if (raw.size() < 2) return raw;
    std::string out;
    out.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 2 >= raw.size()) {
            out += c;
            continue;
        }
        char esc = raw[++i];
        switch (esc) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'v': out += '\v'; break;
        case '0': out += '\0'; break;
        case '\n': break; // line continuation
        default:  out += esc; break;
        }
    }
    return out;
}

} // namespace ruleguard
