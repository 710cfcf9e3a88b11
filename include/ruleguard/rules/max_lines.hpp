#pragma once

#include <ruleguard/rule.hpp>
#include <cstdint>
#include <vector>

namespace ruleguard {

struct MaxLinesOptions {
    int64_t max = 300;
    bool skip_comments = false;
    bool skip_blank_lines = false;

    // Accepts a bare non-negative integer or a table with max,
    // skipComments and skipBlankLines. Anything else is a Config error.
    static Result<MaxLinesOptions> resolve(const RuleOptions& options);
};

// Lines spanned by `comment` that hold no code token. A line the comment
// shares with code (before its start or after its end) stays counted;
// neighboring comments do not anchor.
std::vector<int> comment_only_lines(const SourceCode& source, const Comment& comment);

// Number of lines that count toward the budget under `options`
size_t count_lines(const SourceCode& source, const MaxLinesOptions& options);

class MaxLinesVisitor : public NodeVisitor {
public:
    MaxLinesVisitor(RuleContext& context, MaxLinesOptions options)
        : context_(context), options_(options) {}

    void on_unit_exit(const Node& program) override;

private:
    RuleContext& context_;
    MaxLinesOptions options_;
};

const RuleModule& max_lines_rule();

} // namespace ruleguard
