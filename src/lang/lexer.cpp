#include <ruleguard/lang/lexer.hpp>
#include <cctype>
#include <unordered_set>

namespace ruleguard {

// ---------------------------------------------------------------------------
// Keyword and punctuator tables
// ---------------------------------------------------------------------------

static const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> table = {
        "var", "let", "const", "function", "return", "if", "else",
        "for", "while", "do", "break", "continue", "switch", "case",
        "default", "throw", "try", "catch", "finally", "new", "delete",
        "typeof", "instanceof", "in", "void", "this", "null", "true",
        "false", "class", "extends", "super", "yield", "debugger", "with",
    };
    return table;
}

bool is_keyword(const std::string& word) {
    return keywords().count(word) > 0;
}

// Longest first so the scanner can take the first prefix match
static const char* const kPunctuators[] = {
    ">>>=",
    "...", "===", "!==", "**=", "<<=", ">>=", ">>>",
    "=>", "==", "!=", "<=", ">=", "&&", "||", "??", "?.", "++", "--",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "**", "<<", ">>",
    "{", "}", "(", ")", "[", "]", ";", ",", "<", ">", "+", "-", "*",
    "/", "%", "&", "|", "^", "!", "~", "?", ":", "=", ".",
};

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Identifier: return "Identifier";
    case TokenKind::Keyword:    return "Keyword";
    case TokenKind::Number:     return "Number";
    case TokenKind::String:     return "String";
    case TokenKind::Template:   return "Template";
    case TokenKind::RegExp:     return "RegExp";
    case TokenKind::Punctuator: return "Punctuator";
    case TokenKind::Eof:        return "Eof";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Whitespace
// ---------------------------------------------------------------------------

bool has_bom(const std::string& text) {
    return text.compare(0, 3, "\xEF\xBB\xBF") == 0;
}

size_t whitespace_length(const std::string& text, size_t pos) {
    if (pos >= text.size()) return 0;
    auto byte = [&](size_t i) {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0u;
    };
    unsigned char c = byte(pos);
    switch (c) {
    case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
        return 1;
    case 0xC2: // U+00A0
        return byte(pos + 1) == 0xA0 ? 2 : 0;
    case 0xE1: // U+1680
        return byte(pos + 1) == 0x9A && byte(pos + 2) == 0x80 ? 3 : 0;
    case 0xE2: {
        unsigned char b1 = byte(pos + 1);
        unsigned char b2 = byte(pos + 2);
        // U+2000..U+200A, U+2028, U+2029, U+202F
        if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 ||
                           b2 == 0xA9 || b2 == 0xAF)) {
            return 3;
        }
        // U+205F
        return b1 == 0x81 && b2 == 0x9F ? 3 : 0;
    }
    case 0xE3: // U+3000
        return byte(pos + 1) == 0x80 && byte(pos + 2) == 0x80 ? 3 : 0;
    case 0xEF: // U+FEFF
        return byte(pos + 1) == 0xBB && byte(pos + 2) == 0xBF ? 3 : 0;
    default:
        return 0;
    }
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_part(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    std::vector<Token> tokens;
    std::vector<Comment> comments;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(0) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 0;
        } else if (c == '\r') {
            // \r\n counts once, on the \n
            if (at_end() || peek() != '\n') {
                ++line;
                col = 0;
            }
        } else {
            ++col;
        }
        return c;
    }

    SourcePos current_pos() const {
        return {line, col};
    }

    Span span_from(SourcePos start, size_t begin) const {
        return {start, current_pos(), begin, pos};
    }

    RuleguardError error_at(SourcePos p, const std::string& msg) const {
        return RuleguardError{RuleguardError::Lex, msg, "", filename, p.line, p.col + 1};
    }

    void emit(TokenKind kind, SourcePos start, size_t begin) {
        tokens.push_back({kind, source.substr(begin, pos - begin), span_from(start, begin)});
    }

    // A '/' here starts a regular expression unless the previous token can
    // end an operand
    bool regex_allowed() const {
        if (tokens.empty()) return true;
        const Token& prev = tokens.back();
        switch (prev.kind) {
        case TokenKind::Identifier:
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::Template:
        case TokenKind::RegExp:
            return false;
        case TokenKind::Punctuator:
            return prev.text != ")" && prev.text != "]" && prev.text != "}";
        case TokenKind::Keyword:
            return prev.text != "this" && prev.text != "super" && prev.text != "null" &&
                   prev.text != "true" && prev.text != "false";
        default:
            return true;
        }
    }

    Result<LexResult> run() {
        if (has_bom(source)) pos = 3;
        if (source.compare(pos, 2, "#!") == 0) {
            lex_shebang();
        }

        while (!at_end()) {
            skip_whitespace();
            if (at_end()) break;

            auto p = current_pos();
            size_t begin = pos;
            char c = peek();

            if (c == '/' && peek_next() == '/') {
                lex_line_comment(p, begin);
                continue;
            }
            if (c == '/' && peek_next() == '*') {
                RULEGUARD_TRY(lex_block_comment(p, begin));
                continue;
            }
            if (c == '/' && regex_allowed()) {
                RULEGUARD_TRY(lex_regex(p, begin));
                continue;
            }
            if (c == '"' || c == '\'') {
                RULEGUARD_TRY(lex_string(p, begin, c));
                continue;
            }
            if (c == '`') {
                RULEGUARD_TRY(lex_template(p, begin));
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(peek_next())))) {
                lex_number(p, begin);
                continue;
            }
            if (is_ident_start(c)) {
                lex_identifier(p, begin);
                continue;
            }
            RULEGUARD_TRY(lex_punctuator(p, begin));
        }

        auto end = current_pos();
        tokens.push_back({TokenKind::Eof, "", {end, end, pos, pos}});

        LexResult result;
        result.tokens = std::move(tokens);
        result.comments = std::move(comments);
        return Result<LexResult>::ok(std::move(result));
    }

    void skip_whitespace() {
        while (!at_end()) {
            size_t len = whitespace_length(source, pos);
            if (len == 0) break;
            for (size_t i = 0; i < len; ++i) advance();
        }
    }

    void lex_shebang() {
        auto p = current_pos();
        size_t begin = pos;
        advance(); // #
        advance(); // !
        size_t text_begin = pos;
        while (!at_end() && peek() != '\n' && peek() != '\r') {
            advance();
        }
        comments.push_back({CommentKind::Line, source.substr(text_begin, pos - text_begin),
                            span_from(p, begin)});
    }

    // Body up to the closing '/' outside a character class, then flags
    Status lex_regex(SourcePos p, size_t begin) {
        advance(); // /
        bool in_class = false;
        while (!at_end()) {
            char c = peek();
            if (c == '\n' || c == '\r') break;
            if (c == '\\') {
                advance();
                if (!at_end() && peek() != '\n' && peek() != '\r') advance();
                continue;
            }
            if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                advance();
                while (!at_end() && is_ident_part(peek())) {
                    advance();
                }
                emit(TokenKind::RegExp, p, begin);
                return ok_status();
            }
            advance();
        }
        return error_at(p, "unterminated regular expression literal");
    }

    void lex_line_comment(SourcePos p, size_t begin) {
        advance(); // /
        advance(); // /
        size_t text_begin = pos;
        while (!at_end() && peek() != '\n' && peek() != '\r') {
            advance();
        }
        comments.push_back({CommentKind::Line, source.substr(text_begin, pos - text_begin),
                            span_from(p, begin)});
    }

    Status lex_block_comment(SourcePos p, size_t begin) {
        advance(); // /
        advance(); // *
        size_t text_begin = pos;
        while (!at_end()) {
            if (peek() == '*' && peek_next() == '/') {
                size_t text_end = pos;
                advance(); // *
                advance(); // /
                comments.push_back({CommentKind::Block,
                                    source.substr(text_begin, text_end - text_begin),
                                    span_from(p, begin)});
                return ok_status();
            }
            advance();
        }
        return error_at(p, "unterminated block comment");
    }

    Status lex_string(SourcePos p, size_t begin, char quote) {
        advance(); // opening quote
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                advance();
                if (!at_end()) advance();
                continue;
            }
            if (c == quote) {
                advance();
                emit(TokenKind::String, p, begin);
                return ok_status();
            }
            if (c == '\n' || c == '\r') break;
            advance();
        }
        return error_at(p, "unterminated string literal");
    }

    // Substitutions are kept inside the token; braces are balanced so a
    // nested object literal in ${...} does not end the template early.
    Status lex_template(SourcePos p, size_t begin) {
        advance(); // `
        int brace_depth = 0;
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                advance();
                if (!at_end()) advance();
                continue;
            }
            if (brace_depth == 0 && c == '`') {
                advance();
                emit(TokenKind::Template, p, begin);
                return ok_status();
            }
            if (c == '$' && peek_next() == '{') {
                advance();
                advance();
                ++brace_depth;
                continue;
            }
            if (brace_depth > 0 && c == '{') ++brace_depth;
            if (brace_depth > 0 && c == '}') --brace_depth;
            advance();
        }
        return error_at(p, "unterminated template literal");
    }

    void lex_number(SourcePos p, size_t begin) {
        if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'X' ||
                              peek_next() == 'o' || peek_next() == 'O' ||
                              peek_next() == 'b' || peek_next() == 'B')) {
            advance();
            advance();
            while (!at_end() && (std::isxdigit(static_cast<unsigned char>(peek())) ||
                                 peek() == '_')) {
                advance();
            }
            emit(TokenKind::Number, p, begin);
            return;
        }

        while (!at_end() && (std::isdigit(static_cast<unsigned char>(peek())) ||
                             peek() == '_')) {
            advance();
        }
        if (!at_end() && peek() == '.') {
            advance();
            while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
                advance();
            }
        }
        if (!at_end() && (peek() == 'e' || peek() == 'E')) {
            char sign = peek_next();
            if (std::isdigit(static_cast<unsigned char>(sign)) ||
                ((sign == '+' || sign == '-') && pos + 2 < source.size() &&
                 std::isdigit(static_cast<unsigned char>(source[pos + 2])))) {
                advance(); // e
                if (peek() == '+' || peek() == '-') advance();
                while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
                    advance();
                }
            }
        }
        emit(TokenKind::Number, p, begin);
    }

    void lex_identifier(SourcePos p, size_t begin) {
        while (!at_end() && is_ident_part(peek()) && whitespace_length(source, pos) == 0) {
            advance();
        }
        std::string word = source.substr(begin, pos - begin);
        emit(is_keyword(word) ? TokenKind::Keyword : TokenKind::Identifier, p, begin);
    }

    Status lex_punctuator(SourcePos p, size_t begin) {
        for (const char* punct : kPunctuators) {
            size_t len = std::char_traits<char>::length(punct);
            if (source.compare(pos, len, punct) == 0) {
                // "?." followed by a digit is a conditional, not optional chaining
                if (len == 2 && punct[0] == '?' && punct[1] == '.' &&
                    pos + 2 < source.size() &&
                    std::isdigit(static_cast<unsigned char>(source[pos + 2]))) {
                    continue;
                }
                for (size_t i = 0; i < len; ++i) advance();
                emit(TokenKind::Punctuator, p, begin);
                return ok_status();
            }
        }
        return error_at(p, std::string("unexpected character '") + peek() + "'");
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<LexResult> lex(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace ruleguard
