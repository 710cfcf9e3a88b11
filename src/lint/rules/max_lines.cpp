#include <ruleguard/rules/max_lines.hpp>
#include <ruleguard/lang/lexer.hpp>
#include <ruleguard/log.hpp>

namespace ruleguard {

namespace {

const char* const kRuleId = "max-lines";

bool is_blank(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size()) {
        size_t len = whitespace_length(line, pos);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

RuleguardError option_error(const std::string& msg) {
    return RuleguardError{RuleguardError::Config,
        std::string(kRuleId) + ": " + msg,
        "use an integer, or a table with max, skipComments and skipBlankLines"};
}

// Nearest neighbor of `span` in one direction that is a code token
std::optional<SourceElement> nearest_code(const SourceCode& source, const Span& span, bool forward) {
    auto next = forward ? source.token_or_comment_after(span)
                        : source.token_or_comment_before(span);
    while (next && next->is_comment) {
        next = forward ? source.token_or_comment_after(*next->span)
                       : source.token_or_comment_before(*next->span);
    }
    return next;
}

} // anonymous namespace

Result<MaxLinesOptions> MaxLinesOptions::resolve(const RuleOptions& options) {
    MaxLinesOptions out;
    if (options.bare.has_value() && !options.fields.empty()) {
        return option_error("expected a single integer or a table, not both");
    }

    if (options.bare.has_value()) {
        if (*options.bare < 0) {
            return option_error("max must be a non-negative integer, got " +
                                std::to_string(*options.bare));
        }
        out.max = *options.bare;
        return Result<MaxLinesOptions>::ok(out);
    }

    for (const auto& [key, value] : options.fields) {
        if (key == "max") {
            const auto* n = std::get_if<int64_t>(&value);
            if (!n || *n < 0) return option_error("max must be a non-negative integer");
            out.max = *n;
        } else if (key == "skipComments") {
            const auto* b = std::get_if<bool>(&value);
            if (!b) return option_error("skipComments must be a boolean");
            out.skip_comments = *b;
        } else if (key == "skipBlankLines") {
            const auto* b = std::get_if<bool>(&value);
            if (!b) return option_error("skipBlankLines must be a boolean");
            out.skip_blank_lines = *b;
        } else {
            return option_error("unknown option '" + key + "'");
        }
    }
    return Result<MaxLinesOptions>::ok(out);
}

std::vector<int> comment_only_lines(const SourceCode& source, const Comment& comment) {
    int start = comment.span.start.line;
    int end = comment.span.end.line;

    auto before = nearest_code(source, comment.span, false);
    if (before && is_on_same_line(*before->span, comment.span)) {
        ++start;
    }

    auto after = nearest_code(source, comment.span, true);
    if (after && is_on_same_line(comment.span, *after->span)) {
        --end;
    }

    std::vector<int> lines;
    for (int line = start; line <= end; ++line) {
        lines.push_back(line);
    }
    return lines;
}

size_t count_lines(const SourceCode& source, const MaxLinesOptions& options) {
    const auto& lines = source.lines();
    // counted[n] is line n; index 0 unused
    std::vector<bool> counted(lines.size() + 1, true);
    counted[0] = false;

    if (options.skip_blank_lines) {
        for (size_t i = 0; i < lines.size(); ++i) {
            if (is_blank(lines[i])) counted[i + 1] = false;
        }
    }

    if (options.skip_comments) {
        for (const auto& comment : source.comments()) {
            for (int line : comment_only_lines(source, comment)) {
                if (line >= 1 && static_cast<size_t>(line) <= lines.size()) {
                    counted[line] = false;
                }
            }
        }
    }

    size_t total = 0;
    for (bool c : counted) {
        if (c) ++total;
    }
    return total;
}

void MaxLinesVisitor::on_unit_exit(const Node&) {
    size_t total = count_lines(context_.source_code(), options_);
    log::debug("%s: %s has %zu counted lines (max %lld)", kRuleId,
               context_.source_code().filename().c_str(), total,
               static_cast<long long>(options_.max));

    if (static_cast<int64_t>(total) > options_.max) {
        context_.report(SourcePos{1, 0}, "File must be at most " +
                        std::to_string(options_.max) + " lines long");
    }
}

const RuleModule& max_lines_rule() {
    static const RuleModule module = {
        {kRuleId, "enforce a maximum number of lines per file", "Stylistic Issues", false, false},
        [](const RuleOptions& options) -> Result<VisitorFactory> {
            return MaxLinesOptions::resolve(options).map([](MaxLinesOptions opts) -> VisitorFactory {
                return [opts](RuleContext& ctx) -> std::unique_ptr<NodeVisitor> {
                    return std::make_unique<MaxLinesVisitor>(ctx, opts);
                };
            });
        },
    };
    return module;
}

} // namespace ruleguard
