#pragma once

#include <ruleguard/lang/ast.hpp>
#include <vector>

namespace ruleguard {

enum class Phase {
    Enter,     // node reached in pre-order
    ExitUnit   // fired once for the Program after every node was entered
};

struct TraversalEvent {
    Phase phase;
    NodeKind kind;
    const Node* node;
};

// Fixed dispatch table: override the hooks a check needs, ignore the rest.
class NodeVisitor {
public:
    virtual ~NodeVisitor() = default;

    virtual void on_assignment(const Node&) {}
    virtual void on_call(const Node&) {}
    virtual void on_unit_exit(const Node&) {}

    void dispatch(const TraversalEvent& ev);
};

// Pre-order walk of `program`, delivering each event to every visitor in
// order, then one ExitUnit event.
void traverse(const Node& program, const std::vector<NodeVisitor*>& visitors);

} // namespace ruleguard
