#pragma once

#include <ruleguard/lang/token.hpp>
#include <ruleguard/result.hpp>
#include <string>
#include <vector>

namespace ruleguard {

struct LexResult {
    std::vector<Token> tokens;      // code tokens, terminated by Eof
    std::vector<Comment> comments;  // in source order
};

// Lex a JavaScript-style source unit into code tokens + comments.
// A leading byte order mark is skipped and a first-line `#!` is kept as a
// line comment. '/' starts a regular expression wherever an operand is
// expected.
Result<LexResult> lex(const std::string& source,
                      const std::string& filename = "<input>");

bool is_keyword(const std::string& word);

// Byte length of the whitespace character at `pos`: ASCII blanks and line
// breaks, or UTF-8 encoded NBSP, BOM and Unicode space separators. 0 when
// `pos` holds anything else.
size_t whitespace_length(const std::string& text, size_t pos);

// True when `text` starts with a UTF-8 byte order mark
bool has_bom(const std::string& text);

} // namespace ruleguard
