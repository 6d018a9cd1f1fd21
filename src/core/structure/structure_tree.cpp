#include <progressengine/core/structure/structure_tree.hpp>
#include <progressengine/core/common/errors.hpp>
#include <unordered_set>

namespace ProgressEngine {

const char* nodeTypeString(NodeType type) {
    switch (type) {
        case NodeType::SUBJECT: return "subject";
        case NodeType::TRACK:   return "track";
        case NodeType::UNIT:    return "unit";
        case NodeType::TOPIC:   return "topic";
        case NodeType::LESSON:  return "lesson";
    }
    return "unknown";
}

std::optional<NodeType> parseNodeType(const std::string& name) {
    if (name == "subject") return NodeType::SUBJECT;
    if (name == "track")   return NodeType::TRACK;
    if (name == "unit")    return NodeType::UNIT;
    if (name == "topic")   return NodeType::TOPIC;
    if (name == "lesson")  return NodeType::LESSON;
    return std::nullopt;
}

StructureTree::StructureTree(std::string subjectId, std::string version,
                             std::vector<StructureNode> nodes)
    : subject_id_(std::move(subjectId)),
      version_(std::move(version)),
      nodes_(std::move(nodes)) {
    if (nodes_.empty() || nodes_.front().isLesson() || nodes_.front().parent != -1) {
        throw ProgressError(ErrorCode::INVALID_STRUCTURE,
                            "subject " + subject_id_ + ": root must be a container");
    }

    std::unordered_set<uint32_t> positions;
    index_by_id_.reserve(nodes_.size());
    for (uint32_t i = 0; i < nodes_.size(); ++i) {
        const auto& n = nodes_[i];
        if (!index_by_id_.emplace(n.id, i).second) {
            throw ProgressError(ErrorCode::INVALID_STRUCTURE,
                                "subject " + subject_id_ + ": duplicate node id " + n.id);
        }
        if (n.isLesson()) {
            uint32_t pos = n.bitPosition();
            if (!positions.insert(pos).second) {
                throw ProgressError(ErrorCode::INVALID_STRUCTURE,
                                    "subject " + subject_id_ + ": bit position "
                                    + std::to_string(pos) + " used twice");
            }
            ++lesson_count_;
            if (!max_bit_position_ || pos > *max_bit_position_) {
                max_bit_position_ = pos;
            }
        }
    }

    // Pre-order walk; push children reversed so the first child pops first
    preorder_.reserve(nodes_.size());
    std::vector<uint32_t> stack{0};
    while (!stack.empty()) {
        uint32_t idx = stack.back();
        stack.pop_back();
        preorder_.push_back(idx);
        const auto& children = nodes_[idx].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

std::optional<uint32_t> StructureTree::findNode(const std::string& id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint32_t> StructureTree::findLesson(const std::string& lessonId) const {
    auto idx = findNode(lessonId);
    if (!idx || !nodes_[*idx].isLesson()) return std::nullopt;
    return idx;
}

} // namespace ProgressEngine
