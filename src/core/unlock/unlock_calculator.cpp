#include <progressengine/core/unlock/unlock_calculator.hpp>

namespace ProgressEngine {

const char* nodeStatusString(NodeStatus status) {
    switch (status) {
        case NodeStatus::LOCKED:   return "locked";
        case NodeStatus::UNLOCKED: return "unlocked";
        case NodeStatus::PASSED:   return "passed";
    }
    return "unknown";
}

NodeStates UnlockCalculator::compute(const StructureTree& tree, const Bytes& bitmap) {
    const auto& nodes = tree.nodes();
    const auto& order = tree.preorder();

    // Pass 1: reverse pre-order visits every child before its parent
    std::vector<bool> passed(nodes.size(), true);
    NodeStates result;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const StructureNode& n = nodes[*it];
        if (n.isLesson()) {
            bool bit = Bitmap::test(bitmap, n.bitPosition());
            passed[*it] = bit;
            ++result.totalLessons;
            continue;
        }
        bool all = true;
        for (uint32_t child : n.children) {
            if (!passed[child]) {
                all = false;
                break;
            }
        }
        passed[*it] = all;
    }

    // Pass 2: parents are resolved before their children in pre-order
    result.status.assign(nodes.size(), NodeStatus::LOCKED);
    result.status[0] = passed[0] ? NodeStatus::PASSED : NodeStatus::UNLOCKED;

    for (uint32_t idx : order) {
        const StructureNode& parent = nodes[idx];
        if (parent.isLesson()) continue;

        if (result.status[idx] == NodeStatus::LOCKED) {
            // Children were initialised to LOCKED; nothing to do
            continue;
        }

        bool earlierAllPassed = true;
        for (uint32_t child : parent.children) {
            bool reachable = !parent.sequential() || earlierAllPassed;
            if (reachable) {
                result.status[child] = passed[child] ? NodeStatus::PASSED : NodeStatus::UNLOCKED;
            } else {
                result.status[child] = NodeStatus::LOCKED;
            }
            earlierAllPassed = earlierAllPassed && passed[child];
        }
    }

    // Completion counts completed lessons, whatever their displayed status
    for (uint32_t idx : order) {
        if (nodes[idx].isLesson() && passed[idx]) {
            ++result.passedLessons;
        }
    }

    return result;
}

} // namespace ProgressEngine
