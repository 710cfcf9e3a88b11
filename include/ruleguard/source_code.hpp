#pragma once

#include <ruleguard/lang/ast.hpp>
#include <ruleguard/lang/lexer.hpp>
#include <ruleguard/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ruleguard {

// A code token or a comment, as found in the merged source-order index
struct SourceElement {
    bool is_comment = false;
    size_t index = 0;            // into SourceCode::tokens() or comments()
    const Span* span = nullptr;
};

// Everything the checks may look at for one source unit. Built once per
// run and never mutated afterwards.
class SourceCode {
public:
    SourceCode(std::string filename, std::string text, LexResult lexed, NodePtr ast);

    // Lex + parse `text`
    static Result<SourceCode> from_text(std::string text, std::string filename = "<input>");

    const std::string& filename() const { return filename_; }
    const std::string& text() const { return text_; }

    // Physical lines without terminators; line N is lines()[N - 1]
    const std::vector<std::string>& lines() const { return lines_; }

    // Code tokens, without the trailing Eof
    const std::vector<Token>& tokens() const { return tokens_; }
    const std::vector<Comment>& comments() const { return comments_; }
    const Node& ast() const { return *ast_; }

    // Nearest token or comment starting before / after the element whose
    // span is `span`. `span` must belong to a token or comment of this unit.
    std::optional<SourceElement> token_or_comment_before(const Span& span) const;
    std::optional<SourceElement> token_or_comment_after(const Span& span) const;

private:
    struct IndexEntry {
        size_t begin;
        bool is_comment;
        size_t index;
    };

    SourceElement element(const IndexEntry& e) const;

    std::string filename_;
    std::string text_;
    std::vector<std::string> lines_;
    std::vector<Token> tokens_;
    std::vector<Comment> comments_;
    std::vector<IndexEntry> order_;
    NodePtr ast_;
};

// Split on \r\n, \r and \n. A trailing terminator yields a final empty line.
std::vector<std::string> split_lines(const std::string& text);

// True when `left` ends on the line where `right` starts
bool is_on_same_line(const Span& left, const Span& right);

} // namespace ruleguard
