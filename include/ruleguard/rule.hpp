#pragma once

#include <ruleguard/lang/visitor.hpp>
#include <ruleguard/result.hpp>
#include <ruleguard/source_code.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ruleguard {

enum class Severity { Off, Warn, Error };

const char* severity_name(Severity s);
std::optional<Severity> parse_severity(const std::string& name);

struct Violation {
    std::string rule_id;
    Severity severity = Severity::Error;
    int line = 1;
    int column = 0;
    std::string message;
};

using OptionValue = std::variant<bool, int64_t, std::string>;

// Options as written in configuration: either a bare integer
// (`max-lines = 200`) or a table of named scalars.
struct RuleOptions {
    std::optional<int64_t> bare;
    std::map<std::string, OptionValue> fields;

    bool empty() const { return !bare.has_value() && fields.empty(); }
};

struct RuleMeta {
    std::string id;
    std::string description;
    std::string category;
    bool recommended = false;
    bool fixable = false;
};

// What a check sees during one run: the unit and a reporting sink
class RuleContext {
public:
    RuleContext(const RuleMeta& meta, Severity severity,
                const SourceCode& source, std::vector<Violation>& sink)
        : meta_(meta), severity_(severity), source_(source), sink_(sink) {}

    const SourceCode& source_code() const { return source_; }
    const std::string& rule_id() const { return meta_.id; }

    void report(SourcePos loc, std::string message);
    void report(const Node& node, std::string message);

private:
    const RuleMeta& meta_;
    Severity severity_;
    const SourceCode& source_;
    std::vector<Violation>& sink_;
};

// Creates the visitor for one run
using VisitorFactory = std::function<std::unique_ptr<NodeVisitor>(RuleContext&)>;

struct RuleModule {
    RuleMeta meta;
    // Validates configured options; the returned factory captures them
    std::function<Result<VisitorFactory>(const RuleOptions&)> configure;
};

const std::vector<RuleModule>& builtin_rules();
const RuleModule* find_rule(const std::string& id);

} // namespace ruleguard
