#pragma once

#include <ruleguard/rule.hpp>
#include <optional>
#include <string>

namespace ruleguard {

// Per-run accumulators, rebuilt for every unit
struct MetaContractState {
    // Last object literal assigned to module.exports (last write wins)
    const Node* exported_config = nullptr;
    // Set once a context.report({ fix }) call is seen; never reset
    bool is_fixable = false;
};

struct MetaIssue {
    const Node* node;
    std::string message;
};

// True for `module.exports = { ... }`
bool is_module_exports_assignment(const Node& assignment);

// True for `context.report({ ..., fix: ... })` with exactly one argument
bool is_fixing_report_call(const Node& call);

// Validates the meta contract of an exported rule object in order, stopping
// at the first missing property. No export means nothing to check.
std::optional<MetaIssue> check_meta_contract(const Node* exported_config, bool is_fixable);

class MetaContractVisitor : public NodeVisitor {
public:
    explicit MetaContractVisitor(RuleContext& context) : context_(context) {}

    void on_assignment(const Node& node) override;
    void on_call(const Node& node) override;
    void on_unit_exit(const Node& program) override;

    const MetaContractState& state() const { return state_; }

private:
    RuleContext& context_;
    MetaContractState state_;
};

const RuleModule& no_invalid_meta_rule();

} // namespace ruleguard
