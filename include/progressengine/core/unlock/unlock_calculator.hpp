#pragma once

#include <progressengine/core/bitmap/completion_bitmap.hpp>
#include <progressengine/core/structure/structure_tree.hpp>
#include <cstdint>
#include <vector>

namespace ProgressEngine {

enum class NodeStatus : uint8_t {
    LOCKED,
    UNLOCKED,
    PASSED
};

const char* nodeStatusString(NodeStatus status);

/**
 * @brief Resolved status of every node, indexed like StructureTree::nodes().
 */
struct NodeStates {
    std::vector<NodeStatus> status;
    size_t totalLessons = 0;
    size_t passedLessons = 0;  // bit set, including lessons shown as locked

    NodeStatus operator[](uint32_t index) const { return status[index]; }
};

/**
 * @brief Computes Passed/Unlocked/Locked for a tree and a completion bitmap.
 *
 * Pass 1 (post-order): a lesson is passed iff its bit is set, a container iff
 * every descendant lesson is passed. Containers with no lessons are vacuously
 * passed.
 *
 * Pass 2 (pre-order): the root is always reachable. A locked parent locks its
 * whole subtree. Under a sequential parent a child is reachable only when
 * every earlier sibling passed pass 1. Under a parallel parent every child is
 * reachable. A reachable node is Passed if it passed pass 1, else Unlocked.
 *
 * Pure function. No I/O, no shared state.
 */
class UnlockCalculator {
public:
    static NodeStates compute(const StructureTree& tree, const Bytes& bitmap);
};

} // namespace ProgressEngine
