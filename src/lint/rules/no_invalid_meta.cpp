#include <ruleguard/rules/no_invalid_meta.hpp>
#include <ruleguard/log.hpp>

namespace ruleguard {

namespace {

const char* const kRuleId = "internal-no-invalid-meta";

// Value of a property when it is an object literal; nullptr otherwise, so a
// non-literal `meta` or `docs` reads as having no properties
const Node* object_value(const Node* property) {
    if (!property || !property->b || !property->b->is(NodeKind::Object)) return nullptr;
    return property->b.get();
}

bool has_property(const Node* object, const char* key) {
    return find_property(object, key) != nullptr;
}

} // anonymous namespace

bool is_module_exports_assignment(const Node& assignment) {
    return assignment.is(NodeKind::Assignment) && assignment.op == "=" &&
           assignment.a && assignment.a->is_member_of("module", "exports") &&
           assignment.b && assignment.b->is(NodeKind::Object);
}

bool is_fixing_report_call(const Node& call) {
    if (!call.is(NodeKind::Call) || !call.a || !call.a->is_member_of("context", "report")) {
        return false;
    }
    if (call.list.size() != 1 || !call.list[0] || !call.list[0]->is(NodeKind::Object)) {
        return false;
    }
    return has_property(call.list[0].get(), "fix");
}

std::optional<MetaIssue> check_meta_contract(const Node* exported_config, bool is_fixable) {
    if (!exported_config) return std::nullopt;

    const Node* meta = find_property(exported_config, "meta");
    if (!meta) {
        return MetaIssue{exported_config, "Rule is missing a meta property."};
    }

    const Node* meta_value = object_value(meta);
    const Node* docs = find_property(meta_value, "docs");
    if (!docs) {
        return MetaIssue{meta, "Rule is missing a meta.docs property."};
    }

    const Node* docs_value = object_value(docs);
    if (!has_property(docs_value, "description")) {
        return MetaIssue{meta, "Rule is missing a meta.docs.description property."};
    }
    if (!has_property(docs_value, "category")) {
        return MetaIssue{meta, "Rule is missing a meta.docs.category property."};
    }
    if (!has_property(docs_value, "recommended")) {
        return MetaIssue{meta, "Rule is missing a meta.docs.recommended property."};
    }
    if (!has_property(meta_value, "schema")) {
        return MetaIssue{meta, "Rule is missing a meta.schema property."};
    }
    if (is_fixable && !has_property(meta_value, "fixable")) {
        return MetaIssue{meta, "Rule is fixable, but is missing a meta.fixable property."};
    }
    return std::nullopt;
}

void MetaContractVisitor::on_assignment(const Node& node) {
    if (!is_module_exports_assignment(node)) return;
    if (state_.exported_config) {
        log::debug("%s: %s assigns module.exports again at line %d, checking the last one",
                   kRuleId, context_.source_code().filename().c_str(), node.span.start.line);
    }
    state_.exported_config = node.b.get();
}

void MetaContractVisitor::on_call(const Node& node) {
    if (!state_.is_fixable && is_fixing_report_call(node)) {
        state_.is_fixable = true;
    }
}

void MetaContractVisitor::on_unit_exit(const Node&) {
    if (!state_.exported_config) {
        log::debug("%s: no module.exports object in %s", kRuleId,
                   context_.source_code().filename().c_str());
        return;
    }
    auto issue = check_meta_contract(state_.exported_config, state_.is_fixable);
    if (issue) {
        context_.report(*issue->node, issue->message);
    }
}

const RuleModule& no_invalid_meta_rule() {
    static const RuleModule module = {
        {kRuleId, "enforce correct use of `meta` property in core rules", "Internal", false, false},
        [](const RuleOptions& options) -> Result<VisitorFactory> {
            if (!options.empty()) {
                return RuleguardError{RuleguardError::Config,
                    std::string(kRuleId) + ": rule takes no options",
                    "configure it with a severity only"};
            }
            return Result<VisitorFactory>::ok([](RuleContext& ctx) -> std::unique_ptr<NodeVisitor> {
                return std::make_unique<MetaContractVisitor>(ctx);
            });
        },
    };
    return module;
}

} // namespace ruleguard
