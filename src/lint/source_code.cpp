#include <ruleguard/source_code.hpp>
#include <ruleguard/lang/parser.hpp>
#include <algorithm>

namespace ruleguard {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\n' && c != '\r') continue;
        lines.push_back(text.substr(start, i - start));
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
        start = i + 1;
    }
    lines.push_back(text.substr(start));
    return lines;
}

bool is_on_same_line(const Span& left, const Span& right) {
    return left.end.line == right.start.line;
}

SourceCode::SourceCode(std::string filename, std::string text, LexResult lexed, NodePtr ast)
    : filename_(std::move(filename)),
      text_(std::move(text)),
      tokens_(std::move(lexed.tokens)),
      comments_(std::move(lexed.comments)),
      ast_(std::move(ast)) {
    lines_ = split_lines(text_);

    if (!tokens_.empty() && tokens_.back().kind == TokenKind::Eof) {
        tokens_.pop_back();
    }

    order_.reserve(tokens_.size() + comments_.size());
    for (size_t i = 0; i < tokens_.size(); ++i) {
        order_.push_back({tokens_[i].span.begin, false, i});
    }
    for (size_t i = 0; i < comments_.size(); ++i) {
        order_.push_back({comments_[i].span.begin, true, i});
    }
    std::sort(order_.begin(), order_.end(),
              [](const IndexEntry& l, const IndexEntry& r) { return l.begin < r.begin; });
}

Result<SourceCode> SourceCode::from_text(std::string text, std::string filename) {
    if (has_bom(text)) text.erase(0, 3);
    RULEGUARD_TRY_ASSIGN(lexed, lex(text, filename));
    RULEGUARD_TRY_ASSIGN(ast, parse(lexed, filename));
    return Result<SourceCode>::ok(SourceCode(std::move(filename), std::move(text),
                                             std::move(lexed), std::move(ast)));
}

SourceElement SourceCode::element(const IndexEntry& e) const {
    SourceElement el;
    el.is_comment = e.is_comment;
    el.index = e.index;
    el.span = e.is_comment ? &comments_[e.index].span : &tokens_[e.index].span;
    return el;
}

std::optional<SourceElement> SourceCode::token_or_comment_before(const Span& span) const {
    auto it = std::lower_bound(order_.begin(), order_.end(), span.begin,
                               [](const IndexEntry& e, size_t begin) { return e.begin < begin; });
    if (it == order_.begin()) return std::nullopt;
    return element(*(it - 1));
}

std::optional<SourceElement> SourceCode::token_or_comment_after(const Span& span) const {
    auto it = std::upper_bound(order_.begin(), order_.end(), span.begin,
                               [](size_t begin, const IndexEntry& e) { return begin < e.begin; });
    if (it == order_.end()) return std::nullopt;
    return element(*it);
}

} // namespace ruleguard
