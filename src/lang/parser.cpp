#include <ruleguard/lang/parser.hpp>
#include <optional>
#include <unordered_map>

namespace ruleguard {

namespace {

// ---------------------------------------------------------------------------
// Operator tables
// ---------------------------------------------------------------------------

int punct_precedence(const std::string& op) {
    static const std::unordered_map<std::string, int> table = {
        {"??", 1},
        {"||", 2},
        {"&&", 3},
        {"|", 4},
        {"^", 5},
        {"&", 6},
        {"==", 7}, {"!=", 7}, {"===", 7}, {"!==", 7},
        {"<", 8}, {">", 8}, {"<=", 8}, {">=", 8},
        {"<<", 9}, {">>", 9}, {">>>", 9},
        {"+", 10}, {"-", 10},
        {"*", 11}, {"/", 11}, {"%", 11},
        {"**", 12},
    };
    auto it = table.find(op);
    return it == table.end() ? 0 : it->second;
}

bool is_assignment_op(const Token& t) {
    if (t.kind != TokenKind::Punctuator) return false;
    static const char* const ops[] = {
        "=", "+=", "-=", "*=", "/=", "%=", "**=", "<<=", ">>=", ">>>=",
        "&=", "|=", "^=",
    };
    for (const char* op : ops) {
        if (t.text == op) return true;
    }
    return false;
}

bool is_logical_op(const std::string& op) {
    return op == "||" || op == "&&" || op == "??";
}

// ---------------------------------------------------------------------------
// Parser state machine
// ---------------------------------------------------------------------------

struct Parser {
    const std::vector<Token>& tokens;
    const std::string& filename;
    size_t pos;
    bool no_in;  // set while parsing a for-statement initializer
    std::optional<RuleguardError> error;

    Parser(const std::vector<Token>& toks, const std::string& fname)
        : tokens(toks), filename(fname), pos(0), no_in(false) {}

    // Restores no_in when a nested bracket or body ends
    struct InScope {
        Parser& p;
        bool saved;
        InScope(Parser& parser, bool value) : p(parser), saved(parser.no_in) { p.no_in = value; }
        ~InScope() { p.no_in = saved; }
    };

    // -- Navigation ---------------------------------------------------------

    bool at_end() const { return tokens[pos].kind == TokenKind::Eof; }

    const Token& peek() const { return tokens[pos]; }

    const Token& peek_at(size_t offset) const {
        size_t idx = pos + offset;
        if (idx >= tokens.size()) return tokens.back();
        return tokens[idx];
    }

    const Token& previous() const { return tokens[pos > 0 ? pos - 1 : 0]; }

    const Token& advance() {
        const auto& tok = tokens[pos];
        if (!at_end()) ++pos;
        return tok;
    }

    bool check(const char* punct) const { return peek().is_punct(punct); }
    bool check_keyword(const char* kw) const { return peek().is_keyword(kw); }

    bool match(const char* punct) {
        if (check(punct)) {
            advance();
            return true;
        }
        return false;
    }

    bool expect(const char* punct) {
        if (match(punct)) return true;
        fail(std::string("expected '") + punct + "' but found " + describe(peek()));
        return false;
    }

    // -- Diagnostics --------------------------------------------------------

    static std::string describe(const Token& t) {
        if (t.kind == TokenKind::Eof) return "end of input";
        return "'" + t.text + "'";
    }

    bool failed() const { return error.has_value(); }

    void fail(const std::string& msg) { fail_at(peek(), msg); }

    void fail_at(const Token& t, const std::string& msg) {
        if (error) return;
        error = RuleguardError{RuleguardError::Parse, msg, "", filename,
                               t.span.start.line, t.span.start.col + 1};
    }

    // -- Node construction --------------------------------------------------

    NodePtr make(NodeKind kind, const Token& start) const {
        auto n = std::make_unique<Node>(kind);
        n->span = start.span;
        return n;
    }

    NodePtr make_from(NodeKind kind, const Node& first) const {
        auto n = std::make_unique<Node>(kind);
        n->span = first.span;
        return n;
    }

    void finish(Node& n) const {
        const auto& last = previous();
        n.span.end = last.span.end;
        n.span.end_offset = last.span.end_offset;
    }

    bool consume_semicolon() {
        if (match(";")) return true;
        if (check("}") || at_end()) return true;
        if (peek().span.start.line > previous().span.end.line) return true;
        fail("expected ';' but found " + describe(peek()));
        return false;
    }

    bool on_new_line() const {
        return peek().span.start.line > previous().span.end.line;
    }

    // -- Program and statements ---------------------------------------------

    NodePtr parse_program() {
        auto program = std::make_unique<Node>(NodeKind::Program);
        while (!at_end()) {
            auto stmt = parse_statement();
            if (failed()) return nullptr;
            program->list.push_back(std::move(stmt));
        }
        const auto& eof = peek();
        program->span.start = {1, 0};
        program->span.begin = 0;
        program->span.end = eof.span.end;
        program->span.end_offset = eof.span.end_offset;
        return program;
    }

    NodePtr parse_statement() {
        const Token& t = peek();
        if (t.kind == TokenKind::Punctuator) {
            if (t.text == "{") return parse_block();
            if (t.text == ";") {
                auto n = make(NodeKind::EmptyStatement, t);
                advance();
                return n;
            }
        }
        if (t.kind == TokenKind::Keyword) {
            if (t.text == "var" || t.text == "let" || t.text == "const") {
                auto decl = parse_variable_declaration();
                if (failed() || !consume_semicolon()) return nullptr;
                finish(*decl);
                return decl;
            }
            if (t.text == "function") return parse_function(NodeKind::FunctionDeclaration, true);
            if (t.text == "return") return parse_return();
            if (t.text == "if") return parse_if();
            if (t.text == "for") return parse_for();
            if (t.text == "while") return parse_while();
            if (t.text == "do") return parse_do_while();
            if (t.text == "break") return parse_jump(NodeKind::BreakStatement);
            if (t.text == "continue") return parse_jump(NodeKind::ContinueStatement);
            if (t.text == "throw") return parse_throw();
            if (t.text == "try") return parse_try();
            if (t.text == "switch") return parse_switch();
            if (t.text == "class") {
                fail("class declarations are not supported");
                return nullptr;
            }
        }

        auto stmt = make(NodeKind::ExpressionStatement, t);
        stmt->a = parse_expression();
        if (failed() || !consume_semicolon()) return nullptr;
        finish(*stmt);
        return stmt;
    }

    NodePtr parse_block() {
        auto block = make(NodeKind::BlockStatement, peek());
        if (!expect("{")) return nullptr;
        InScope scope(*this, false);
        while (!check("}")) {
            if (at_end()) {
                fail("expected '}' but found end of input");
                return nullptr;
            }
            auto stmt = parse_statement();
            if (failed()) return nullptr;
            block->list.push_back(std::move(stmt));
        }
        advance(); // }
        finish(*block);
        return block;
    }

    NodePtr parse_variable_declaration() {
        auto decl = make(NodeKind::VariableDeclaration, peek());
        decl->name = advance().text;
        do {
            auto declarator = make(NodeKind::VariableDeclarator, peek());
            declarator->a = parse_binding_target();
            if (failed()) return nullptr;
            if (match("=")) {
                declarator->b = parse_assignment();
                if (failed()) return nullptr;
            }
            finish(*declarator);
            decl->list.push_back(std::move(declarator));
        } while (match(","));
        finish(*decl);
        return decl;
    }

    NodePtr parse_binding_target() {
        const Token& t = peek();
        if (t.kind == TokenKind::Identifier) {
            auto id = make(NodeKind::Identifier, t);
            id->name = advance().text;
            return id;
        }
        if (t.is_punct("{")) return parse_object();
        if (t.is_punct("[")) return parse_array();
        fail("expected binding name but found " + describe(t));
        return nullptr;
    }

    NodePtr parse_function(NodeKind kind, bool require_name) {
        auto fn = make(kind, peek());
        advance(); // function
        if (check("*")) {
            fail("generator functions are not supported");
            return nullptr;
        }
        if (peek().kind == TokenKind::Identifier) {
            auto id = make(NodeKind::Identifier, peek());
            id->name = advance().text;
            fn->a = std::move(id);
        } else if (require_name) {
            fail("expected function name but found " + describe(peek()));
            return nullptr;
        }
        if (!parse_params(*fn)) return nullptr;
        fn->b = parse_block();
        if (failed()) return nullptr;
        finish(*fn);
        return fn;
    }

    bool parse_params(Node& fn) {
        if (!expect("(")) return false;
        InScope scope(*this, false);
        while (!check(")")) {
            NodePtr param;
            if (check("...")) {
                param = make(NodeKind::Spread, peek());
                advance();
                param->a = parse_binding_target();
                if (failed()) return false;
                finish(*param);
            } else {
                param = parse_binding_target();
                if (failed()) return false;
                if (check("=")) {
                    auto def = make_from(NodeKind::Assignment, *param);
                    def->op = advance().text;
                    def->a = std::move(param);
                    def->b = parse_assignment();
                    if (failed()) return false;
                    finish(*def);
                    param = std::move(def);
                }
            }
            fn.list.push_back(std::move(param));
            if (!check(")") && !expect(",")) return false;
        }
        advance(); // )
        return true;
    }

    NodePtr parse_return() {
        auto ret = make(NodeKind::ReturnStatement, peek());
        advance();
        if (!check(";") && !check("}") && !at_end() && !on_new_line()) {
            ret->a = parse_expression();
            if (failed()) return nullptr;
        }
        if (!consume_semicolon()) return nullptr;
        finish(*ret);
        return ret;
    }

    NodePtr parse_throw() {
        auto thr = make(NodeKind::ThrowStatement, peek());
        advance();
        if (on_new_line()) {
            fail("illegal newline after throw");
            return nullptr;
        }
        thr->a = parse_expression();
        if (failed() || !consume_semicolon()) return nullptr;
        finish(*thr);
        return thr;
    }

    NodePtr parse_jump(NodeKind kind) {
        auto jump = make(kind, peek());
        advance();
        if (peek().kind == TokenKind::Identifier && !on_new_line()) {
            jump->name = advance().text;
        }
        if (!consume_semicolon()) return nullptr;
        finish(*jump);
        return jump;
    }

    NodePtr parse_if() {
        auto stmt = make(NodeKind::IfStatement, peek());
        advance();
        if (!expect("(")) return nullptr;
        stmt->a = parse_expression();
        if (failed() || !expect(")")) return nullptr;
        stmt->b = parse_statement();
        if (failed()) return nullptr;
        if (check_keyword("else")) {
            advance();
            stmt->c = parse_statement();
            if (failed()) return nullptr;
        }
        finish(*stmt);
        return stmt;
    }

    NodePtr parse_while() {
        auto stmt = make(NodeKind::WhileStatement, peek());
        advance();
        if (!expect("(")) return nullptr;
        stmt->a = parse_expression();
        if (failed() || !expect(")")) return nullptr;
        stmt->d = parse_statement();
        if (failed()) return nullptr;
        finish(*stmt);
        return stmt;
    }

    NodePtr parse_do_while() {
        auto stmt = make(NodeKind::DoWhileStatement, peek());
        advance();
        stmt->d = parse_statement();
        if (failed()) return nullptr;
        if (!check_keyword("while")) {
            fail("expected 'while' but found " + describe(peek()));
            return nullptr;
        }
        advance();
        if (!expect("(")) return nullptr;
        stmt->a = parse_expression();
        if (failed() || !expect(")")) return nullptr;
        match(";");
        finish(*stmt);
        return stmt;
    }

    bool at_for_in_keyword() const {
        return check_keyword("in") ||
               (peek().kind == TokenKind::Identifier && peek().text == "of");
    }

    NodePtr parse_for() {
        auto stmt = make(NodeKind::ForStatement, peek());
        advance();
        if (!expect("(")) return nullptr;

        const Token& t = peek();
        if (t.is_keyword("var") || t.is_keyword("let") || t.is_keyword("const")) {
            size_t decl_start = pos;
            auto decl = make(NodeKind::VariableDeclaration, t);
            decl->name = advance().text;
            auto target = parse_binding_target();
            if (failed()) return nullptr;
            if (at_for_in_keyword()) {
                auto declarator = make_from(NodeKind::VariableDeclarator, *target);
                declarator->a = std::move(target);
                decl->list.push_back(std::move(declarator));
                finish(*decl);
                return parse_for_in_rest(std::move(stmt), std::move(decl));
            }
            pos = decl_start;
            InScope scope(*this, true);
            stmt->a = parse_variable_declaration();
            if (failed()) return nullptr;
        } else if (!t.is_punct(";")) {
            size_t init_start = pos;
            auto lhs = parse_unary();
            if (!failed() && at_for_in_keyword()) {
                return parse_for_in_rest(std::move(stmt), std::move(lhs));
            }
            error.reset();
            pos = init_start;
            InScope scope(*this, true);
            stmt->a = parse_expression();
            if (failed()) return nullptr;
        }

        if (!expect(";")) return nullptr;
        if (!check(";")) {
            stmt->b = parse_expression();
            if (failed()) return nullptr;
        }
        if (!expect(";")) return nullptr;
        if (!check(")")) {
            stmt->c = parse_expression();
            if (failed()) return nullptr;
        }
        if (!expect(")")) return nullptr;
        stmt->d = parse_statement();
        if (failed()) return nullptr;
        finish(*stmt);
        return stmt;
    }

    NodePtr parse_for_in_rest(NodePtr stmt, NodePtr left) {
        stmt->kind = NodeKind::ForInStatement;
        stmt->op = advance().text; // in | of
        stmt->a = std::move(left);
        stmt->b = parse_assignment();
        if (failed() || !expect(")")) return nullptr;
        stmt->d = parse_statement();
        if (failed()) return nullptr;
        finish(*stmt);
        return stmt;
    }

    NodePtr parse_try() {
        auto stmt = make(NodeKind::TryStatement, peek());
        advance();
        stmt->a = parse_block();
        if (failed()) return nullptr;
        if (check_keyword("catch")) {
            auto handler = make(NodeKind::CatchClause, peek());
            advance();
            if (match("(")) {
                handler->a = parse_binding_target();
                if (failed() || !expect(")")) return nullptr;
            }
            handler->d = parse_block();
            if (failed()) return nullptr;
            finish(*handler);
            stmt->b = std::move(handler);
        }
        if (check_keyword("finally")) {
            advance();
            stmt->c = parse_block();
            if (failed()) return nullptr;
        }
        if (!stmt->b && !stmt->c) {
            fail("expected 'catch' or 'finally' after try block");
            return nullptr;
        }
        finish(*stmt);
        return stmt;
    }

    NodePtr parse_switch() {
        auto stmt = make(NodeKind::SwitchStatement, peek());
        advance();
        if (!expect("(")) return nullptr;
        stmt->a = parse_expression();
        if (failed() || !expect(")") || !expect("{")) return nullptr;
        while (!check("}")) {
            auto clause = make(NodeKind::SwitchCase, peek());
            if (check_keyword("case")) {
                advance();
                clause->a = parse_expression();
                if (failed()) return nullptr;
            } else if (check_keyword("default")) {
                advance();
            } else {
                fail("expected 'case' or 'default' but found " + describe(peek()));
                return nullptr;
            }
            if (!expect(":")) return nullptr;
            while (!check("}") && !check_keyword("case") && !check_keyword("default")) {
                if (at_end()) {
                    fail("expected '}' but found end of input");
                    return nullptr;
                }
                auto body = parse_statement();
                if (failed()) return nullptr;
                clause->list.push_back(std::move(body));
            }
            finish(*clause);
            stmt->list.push_back(std::move(clause));
        }
        advance(); // }
        finish(*stmt);
        return stmt;
    }

    // -- Expressions --------------------------------------------------------

    NodePtr parse_expression() {
        auto first = parse_assignment();
        if (failed() || !check(",")) return first;
        auto seq = make_from(NodeKind::Sequence, *first);
        seq->list.push_back(std::move(first));
        while (match(",")) {
            auto next = parse_assignment();
            if (failed()) return nullptr;
            seq->list.push_back(std::move(next));
        }
        finish(*seq);
        return seq;
    }

    bool is_arrow_start() const {
        const Token& t = peek();
        if (t.kind == TokenKind::Identifier) return peek_at(1).is_punct("=>");
        if (!t.is_punct("(")) return false;
        int depth = 0;
        for (size_t i = pos; i < tokens.size(); ++i) {
            const Token& tok = tokens[i];
            if (tok.kind == TokenKind::Eof) return false;
            if (tok.kind != TokenKind::Punctuator) continue;
            if (tok.text == "(" || tok.text == "[" || tok.text == "{") {
                ++depth;
            } else if (tok.text == ")" || tok.text == "]" || tok.text == "}") {
                if (--depth == 0) {
                    return i + 1 < tokens.size() && tokens[i + 1].is_punct("=>");
                }
            }
        }
        return false;
    }

    NodePtr parse_arrow() {
        auto fn = make(NodeKind::ArrowFunction, peek());
        if (peek().kind == TokenKind::Identifier) {
            auto param = make(NodeKind::Identifier, peek());
            param->name = advance().text;
            fn->list.push_back(std::move(param));
        } else if (!parse_params(*fn)) {
            return nullptr;
        }
        if (!expect("=>")) return nullptr;
        if (check("{")) {
            fn->b = parse_block();
        } else {
            fn->b = parse_assignment();
        }
        if (failed()) return nullptr;
        finish(*fn);
        return fn;
    }

    NodePtr parse_assignment() {
        if (is_arrow_start()) return parse_arrow();

        const Token& start = peek();
        auto left = parse_conditional();
        if (failed()) return nullptr;
        if (!is_assignment_op(peek())) return left;

        if (!left->is(NodeKind::Identifier) && !left->is(NodeKind::Member) &&
            !left->is(NodeKind::Object) && !left->is(NodeKind::Array)) {
            fail_at(start, "invalid assignment target");
            return nullptr;
        }
        auto assign = make_from(NodeKind::Assignment, *left);
        assign->op = advance().text;
        assign->a = std::move(left);
        assign->b = parse_assignment();
        if (failed()) return nullptr;
        finish(*assign);
        return assign;
    }

    NodePtr parse_conditional() {
        auto test = parse_binary(1);
        if (failed() || !check("?")) return test;
        advance();
        auto cond = make_from(NodeKind::Conditional, *test);
        cond->a = std::move(test);
        {
            InScope scope(*this, false);
            cond->b = parse_assignment();
        }
        if (failed() || !expect(":")) return nullptr;
        cond->c = parse_assignment();
        if (failed()) return nullptr;
        finish(*cond);
        return cond;
    }

    int binary_precedence(const Token& t) const {
        if (t.kind == TokenKind::Keyword) {
            if (t.text == "instanceof") return 8;
            if (t.text == "in" && !no_in) return 8;
            return 0;
        }
        if (t.kind != TokenKind::Punctuator) return 0;
        return punct_precedence(t.text);
    }

    NodePtr parse_binary(int min_prec) {
        auto left = parse_unary();
        if (failed()) return nullptr;
        while (true) {
            int prec = binary_precedence(peek());
            if (prec == 0 || prec < min_prec) break;
            std::string op = advance().text;
            // ** is right-associative
            auto right = parse_binary(op == "**" ? prec : prec + 1);
            if (failed()) return nullptr;
            auto bin = make_from(is_logical_op(op) ? NodeKind::Logical : NodeKind::Binary, *left);
            bin->op = std::move(op);
            bin->a = std::move(left);
            bin->b = std::move(right);
            finish(*bin);
            left = std::move(bin);
        }
        return left;
    }

    NodePtr parse_unary() {
        const Token& t = peek();
        bool unary_punct = t.kind == TokenKind::Punctuator &&
            (t.text == "!" || t.text == "~" || t.text == "+" || t.text == "-");
        bool unary_keyword = t.kind == TokenKind::Keyword &&
            (t.text == "typeof" || t.text == "void" || t.text == "delete");
        if (unary_punct || unary_keyword || t.is_punct("++") || t.is_punct("--")) {
            bool update = t.is_punct("++") || t.is_punct("--");
            auto node = make(update ? NodeKind::Update : NodeKind::Unary, t);
            node->op = advance().text;
            node->prefix = true;
            node->a = parse_unary();
            if (failed()) return nullptr;
            finish(*node);
            return node;
        }

        auto expr = parse_call_member();
        if (failed()) return nullptr;
        if ((check("++") || check("--")) && !on_new_line()) {
            auto update = make_from(NodeKind::Update, *expr);
            update->op = advance().text;
            update->a = std::move(expr);
            finish(*update);
            return update;
        }
        return expr;
    }

    NodePtr parse_member_name(NodePtr object) {
        const Token& name = peek();
        if (name.kind != TokenKind::Identifier && name.kind != TokenKind::Keyword) {
            fail("expected property name but found " + describe(name));
            return nullptr;
        }
        auto member = make_from(NodeKind::Member, *object);
        member->a = std::move(object);
        auto prop = make(NodeKind::Identifier, name);
        prop->name = advance().text;
        member->b = std::move(prop);
        finish(*member);
        return member;
    }

    NodePtr parse_computed_member(NodePtr object) {
        auto member = make_from(NodeKind::Member, *object);
        member->computed = true;
        member->a = std::move(object);
        {
            InScope scope(*this, false);
            member->b = parse_expression();
        }
        if (failed() || !expect("]")) return nullptr;
        finish(*member);
        return member;
    }

    NodePtr parse_call(NodePtr callee) {
        auto call = make_from(NodeKind::Call, *callee);
        call->a = std::move(callee);
        if (!parse_arguments(call->list)) return nullptr;
        finish(*call);
        return call;
    }

    NodePtr parse_call_member() {
        NodePtr expr = check_keyword("new") ? parse_new() : parse_primary();
        if (failed()) return nullptr;
        while (true) {
            if (match(".")) {
                expr = parse_member_name(std::move(expr));
            } else if (match("?.")) {
                if (match("[")) {
                    expr = parse_computed_member(std::move(expr));
                } else if (check("(")) {
                    expr = parse_call(std::move(expr));
                } else {
                    expr = parse_member_name(std::move(expr));
                }
            } else if (match("[")) {
                expr = parse_computed_member(std::move(expr));
            } else if (check("(")) {
                expr = parse_call(std::move(expr));
            } else {
                break;
            }
            if (failed()) return nullptr;
        }
        return expr;
    }

    NodePtr parse_new() {
        auto node = make(NodeKind::New, peek());
        advance(); // new
        NodePtr callee = check_keyword("new") ? parse_new() : parse_primary();
        if (failed()) return nullptr;
        while (true) {
            if (match(".")) {
                callee = parse_member_name(std::move(callee));
            } else if (match("[")) {
                callee = parse_computed_member(std::move(callee));
            } else {
                break;
            }
            if (failed()) return nullptr;
        }
        node->a = std::move(callee);
        if (check("(") && !parse_arguments(node->list)) return nullptr;
        finish(*node);
        return node;
    }

    bool parse_arguments(std::vector<NodePtr>& out) {
        if (!expect("(")) return false;
        InScope scope(*this, false);
        while (!check(")")) {
            auto arg = check("...") ? parse_spread() : parse_assignment();
            if (failed()) return false;
            out.push_back(std::move(arg));
            if (!check(")") && !expect(",")) return false;
        }
        advance(); // )
        return true;
    }

    NodePtr parse_spread() {
        auto spread = make(NodeKind::Spread, peek());
        advance(); // ...
        spread->a = parse_assignment();
        if (failed()) return nullptr;
        finish(*spread);
        return spread;
    }

    NodePtr parse_primary() {
        const Token& t = peek();
        switch (t.kind) {
        case TokenKind::Identifier: {
            auto id = make(NodeKind::Identifier, t);
            id->name = advance().text;
            return id;
        }
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::RegExp: {
            auto lit = make(NodeKind::Literal, t);
            lit->name = advance().text;
            return lit;
        }
        case TokenKind::Template: {
            auto tpl = make(NodeKind::TemplateLiteral, t);
            tpl->name = advance().text;
            return tpl;
        }
        case TokenKind::Keyword:
            if (t.text == "this") {
                auto node = make(NodeKind::This, t);
                advance();
                return node;
            }
            if (t.text == "null" || t.text == "true" || t.text == "false") {
                auto lit = make(NodeKind::Literal, t);
                lit->name = advance().text;
                return lit;
            }
            if (t.text == "function") return parse_function(NodeKind::Function, false);
            break;
        case TokenKind::Punctuator:
            if (t.text == "(") {
                advance();
                InScope scope(*this, false);
                auto inner = parse_expression();
                if (failed() || !expect(")")) return nullptr;
                return inner;
            }
            if (t.text == "[") return parse_array();
            if (t.text == "{") return parse_object();
            break;
        default:
            break;
        }
        fail("unexpected " + describe(t));
        return nullptr;
    }

    NodePtr parse_array() {
        auto arr = make(NodeKind::Array, peek());
        if (!expect("[")) return nullptr;
        InScope scope(*this, false);
        while (!check("]")) {
            if (match(",")) {
                arr->list.push_back(nullptr); // hole
                continue;
            }
            auto elem = check("...") ? parse_spread() : parse_assignment();
            if (failed()) return nullptr;
            arr->list.push_back(std::move(elem));
            if (!check("]") && !expect(",")) return nullptr;
        }
        advance(); // ]
        finish(*arr);
        return arr;
    }

    NodePtr parse_object() {
        auto obj = make(NodeKind::Object, peek());
        if (!expect("{")) return nullptr;
        InScope scope(*this, false);
        while (!check("}")) {
            auto prop = check("...") ? parse_spread() : parse_property();
            if (failed()) return nullptr;
            obj->list.push_back(std::move(prop));
            if (!check("}") && !expect(",")) return nullptr;
        }
        advance(); // }
        finish(*obj);
        return obj;
    }

    bool parse_property_key(Node& prop) {
        const Token& t = peek();
        if (t.kind == TokenKind::Identifier || t.kind == TokenKind::Keyword) {
            auto key = make(NodeKind::Identifier, t);
            key->name = t.text;
            prop.name = advance().text;
            prop.a = std::move(key);
            return true;
        }
        if (t.kind == TokenKind::String || t.kind == TokenKind::Number) {
            auto key = make(NodeKind::Literal, t);
            key->name = t.text;
            prop.name = t.kind == TokenKind::String ? unquote_string(t.text) : t.text;
            advance();
            prop.a = std::move(key);
            return true;
        }
        if (match("[")) {
            prop.computed = true;
            prop.a = parse_assignment();
            return !failed() && expect("]");
        }
        fail("expected property key but found " + describe(t));
        return false;
    }

    NodePtr parse_property() {
        auto prop = make(NodeKind::Property, peek());
        const Token& t = peek();
        if (t.kind == TokenKind::Identifier && (t.text == "get" || t.text == "set")) {
            const Token& next = peek_at(1);
            bool plain_key = next.is_punct(":") || next.is_punct("(") ||
                             next.is_punct(",") || next.is_punct("}") ||
                             next.is_punct("=");
            if (!plain_key) prop->op = advance().text;
        }
        if (!parse_property_key(*prop)) return nullptr;

        if (match(":")) {
            prop->b = parse_assignment();
        } else if (check("(")) {
            auto method = make(NodeKind::Function, peek());
            if (!parse_params(*method)) return nullptr;
            method->b = parse_block();
            if (failed()) return nullptr;
            finish(*method);
            prop->b = std::move(method);
        } else if (prop->a->is(NodeKind::Identifier) && !prop->computed && prop->op.empty()) {
            // Shorthand `{ a }`, or `{ a = 1 }` inside a destructuring pattern
            auto value = std::make_unique<Node>(NodeKind::Identifier);
            value->span = prop->a->span;
            value->name = prop->a->name;
            if (check("=")) {
                auto def = make_from(NodeKind::Assignment, *value);
                def->op = advance().text;
                def->a = std::move(value);
                def->b = parse_assignment();
                if (failed()) return nullptr;
                finish(*def);
                prop->b = std::move(def);
            } else {
                prop->b = std::move(value);
            }
        } else {
            fail("expected ':' but found " + describe(peek()));
        }
        if (failed()) return nullptr;
        finish(*prop);
        return prop;
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<NodePtr> parse(const LexResult& lex_result, const std::string& filename) {
    if (lex_result.tokens.empty() || lex_result.tokens.back().kind != TokenKind::Eof) {
        return RuleguardError{RuleguardError::InvalidArg,
            "token stream must end with an Eof token", "", filename, 0};
    }
    Parser parser(lex_result.tokens, filename);
    auto program = parser.parse_program();
    if (parser.error) return std::move(*parser.error);
    return Result<NodePtr>::ok(std::move(program));
}

} // namespace ruleguard
