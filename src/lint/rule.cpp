#include <ruleguard/rule.hpp>
#include <ruleguard/rules/max_lines.hpp>
#include <ruleguard/rules/no_invalid_meta.hpp>

namespace ruleguard {

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Off:   return "off";
        case Severity::Warn:  return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

std::optional<Severity> parse_severity(const std::string& name) {
    if (name == "off") return Severity::Off;
    if (name == "warn" || name == "warning") return Severity::Warn;
    if (name == "error") return Severity::Error;
    return std::nullopt;
}

void RuleContext::report(SourcePos loc, std::string message) {
    sink_.push_back({meta_.id, severity_, loc.line, loc.col, std::move(message)});
}

void RuleContext::report(const Node& node, std::string message) {
    report(node.span.start, std::move(message));
}

const std::vector<RuleModule>& builtin_rules() {
    static const std::vector<RuleModule> rules = {
        max_lines_rule(),
        no_invalid_meta_rule(),
    };
    return rules;
}

const RuleModule* find_rule(const std::string& id) {
    for (const auto& rule : builtin_rules()) {
        if (rule.meta.id == id) return &rule;
    }
    return nullptr;
}

} // namespace ruleguard
