#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ruleguard {

// Lines are 1-based, columns 0-based
struct SourcePos {
    int line = 1;
    int col = 0;
};

// end is one past the last character; offsets index into the source text
struct Span {
    SourcePos start;
    SourcePos end;
    size_t begin = 0;
    size_t end_offset = 0;
};

enum class TokenKind {
    Identifier,
    Keyword,
    Number,
    String,
    Template,
    RegExp,
    Punctuator,
    Eof
};

struct Token {
    TokenKind kind;
    std::string text;
    Span span;

    bool is(TokenKind k, const char* t) const { return kind == k && text == t; }
    bool is_punct(const char* t) const { return is(TokenKind::Punctuator, t); }
    bool is_keyword(const char* t) const { return is(TokenKind::Keyword, t); }
};

enum class CommentKind {
    Line,   // // comment
    Block   // /* comment */
};

struct Comment {
    CommentKind kind;
    std::string text;  // content without comment markers
    Span span;
};

const char* token_kind_name(TokenKind k);

} // namespace ruleguard
