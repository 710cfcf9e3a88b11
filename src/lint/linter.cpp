#include <ruleguard/linter.hpp>
#include <ruleguard/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace ruleguard {

size_t LintResult::error_count() const {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [](const Violation& v) { return v.severity == Severity::Error; }));
}

size_t LintResult::warning_count() const {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [](const Violation& v) { return v.severity == Severity::Warn; }));
}

namespace {

std::string available_rules_hint() {
    std::string hint = "available rules: ";
    bool first = true;
    for (const auto& module : builtin_rules()) {
        if (!first) hint += ", ";
        hint += module.meta.id;
        first = false;
    }
    return hint;
}

} // anonymous namespace

Result<Linter> Linter::create(const Config& config) {
    for (const auto& [id, setting] : config.rules) {
        if (!find_rule(id)) {
            return RuleguardError{RuleguardError::UnknownRule,
                "unknown rule '" + id + "'", available_rules_hint()};
        }
    }

    Linter linter;
    for (const auto& module : builtin_rules()) {
        auto it = config.rules.find(module.meta.id);
        if (it == config.rules.end() || it->second.severity == Severity::Off) continue;

        RULEGUARD_TRY_ASSIGN(factory, module.configure(it->second.options));
        linter.active_.push_back({&module, it->second.severity, std::move(factory)});
        log::debug("enabled rule %s (%s)", module.meta.id.c_str(),
                   severity_name(it->second.severity));
    }
    return Result<Linter>::ok(std::move(linter));
}

Result<LintResult> Linter::lint_text(const std::string& text, const std::string& filename) const {
    RULEGUARD_TRY_ASSIGN(code, SourceCode::from_text(text, filename));

    LintResult result;
    result.filename = filename;

    std::vector<std::unique_ptr<RuleContext>> contexts;
    std::vector<std::unique_ptr<NodeVisitor>> visitors;
    std::vector<NodeVisitor*> dispatch;
    for (const auto& rule : active_) {
        contexts.push_back(std::make_unique<RuleContext>(rule.module->meta, rule.severity,
                                                         code, result.violations));
        visitors.push_back(rule.factory(*contexts.back()));
        dispatch.push_back(visitors.back().get());
    }

    traverse(code.ast(), dispatch);

    std::stable_sort(result.violations.begin(), result.violations.end(),
        [](const Violation& l, const Violation& r) {
            if (l.line != r.line) return l.line < r.line;
            return l.column < r.column;
        });
    log::debug("%s: %zu line(s), %zu token(s), %zu comment(s), %zu violation(s)",
               filename.c_str(), code.lines().size(), code.tokens().size(),
               code.comments().size(), result.violations.size());
    return Result<LintResult>::ok(std::move(result));
}

Result<LintResult> Linter::lint_file(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return RuleguardError{RuleguardError::IO,
            "cannot open source file: " + path,
            "check the path and file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return lint_text(buf.str(), path);
}

std::vector<std::string> Linter::enabled_rules() const {
    std::vector<std::string> ids;
    for (const auto& rule : active_) ids.push_back(rule.module->meta.id);
    return ids;
}

} // namespace ruleguard
