#pragma once

#include <ruleguard/config.hpp>
#include <ruleguard/result.hpp>
#include <ruleguard/rule.hpp>
#include <string>
#include <vector>

namespace ruleguard {

struct LintResult {
    std::string filename;
    std::vector<Violation> violations;  // sorted by line, then column

    size_t error_count() const;
    size_t warning_count() const;
};

// Runs the configured checks over one source unit at a time. Each run gets
// fresh visitors; nothing is shared between units or between rules.
class Linter {
public:
    // Fails with UnknownRule for ids not in builtin_rules(), or with Config
    // when a rule rejects its options.
    static Result<Linter> create(const Config& config);

    Result<LintResult> lint_text(const std::string& text,
                                 const std::string& filename = "<input>") const;
    Result<LintResult> lint_file(const std::string& path) const;

    // Ids of the rules that will run, in registry order
    std::vector<std::string> enabled_rules() const;

private:
    struct ActiveRule {
        const RuleModule* module;
        Severity severity;
        VisitorFactory factory;
    };

    std::vector<ActiveRule> active_;
};

} // namespace ruleguard
