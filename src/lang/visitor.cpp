#include <ruleguard/lang/visitor.hpp>

namespace ruleguard {

void NodeVisitor::dispatch(const TraversalEvent& ev) {
    if (ev.phase == Phase::ExitUnit) {
        on_unit_exit(*ev.node);
        return;
    }
    switch (ev.kind) {
    case NodeKind::Assignment: on_assignment(*ev.node); break;
    case NodeKind::Call:       on_call(*ev.node); break;
    default: break;
    }
}

namespace {

void walk(const Node& node, const std::vector<NodeVisitor*>& visitors) {
    TraversalEvent ev{Phase::Enter, node.kind, &node};
    for (auto* v : visitors) v->dispatch(ev);

    // a, list, b, c, d is source order for every kind in ast.hpp
    if (node.a) walk(*node.a, visitors);
    for (const auto& child : node.list) {
        if (child) walk(*child, visitors);
    }
    if (node.b) walk(*node.b, visitors);
    if (node.c) walk(*node.c, visitors);
    if (node.d) walk(*node.d, visitors);
}

} // anonymous namespace

void traverse(const Node& program, const std::vector<NodeVisitor*>& visitors) {
    walk(program, visitors);
    TraversalEvent exit{Phase::ExitUnit, program.kind, &program};
    for (auto* v : visitors) v->dispatch(exit);
}

} // namespace ruleguard
