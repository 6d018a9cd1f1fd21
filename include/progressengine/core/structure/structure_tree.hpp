#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ProgressEngine {

enum class NodeType : uint8_t {
    SUBJECT,
    TRACK,
    UNIT,
    TOPIC,
    LESSON
};

const char* nodeTypeString(NodeType type);
std::optional<NodeType> parseNodeType(const std::string& name);

struct ContainerInfo {
    bool sequential = false;
};

struct LessonInfo {
    uint32_t bitPosition = 0;
};

/**
 * @brief One node of an immutable subject hierarchy.
 *
 * Nodes live in a flat vector owned by StructureTree and reference each other
 * by index. Index 0 is always the subject root. Children are stored in
 * current sort order.
 */
struct StructureNode {
    std::string id;
    std::string title;
    NodeType type = NodeType::LESSON;
    int32_t sortOrder = 0;
    int32_t parent = -1;
    std::vector<uint32_t> children;
    std::variant<ContainerInfo, LessonInfo> kind;

    bool isLesson() const { return std::holds_alternative<LessonInfo>(kind); }
    bool sequential() const {
        const auto* c = std::get_if<ContainerInfo>(&kind);
        return c != nullptr && c->sequential;
    }
    uint32_t bitPosition() const { return std::get<LessonInfo>(kind).bitPosition; }
};

class StructureTree {
public:
    StructureTree(std::string subjectId, std::string version, std::vector<StructureNode> nodes);

    const std::string& subjectId() const { return subject_id_; }
    const std::string& version() const { return version_; }

    const StructureNode& root() const { return nodes_.front(); }
    const StructureNode& node(uint32_t index) const { return nodes_[index]; }
    const std::vector<StructureNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }

    size_t lessonCount() const { return lesson_count_; }
    /// Highest bit position referenced by the tree, nullopt when it has no lessons.
    std::optional<uint32_t> maxBitPosition() const { return max_bit_position_; }

    std::optional<uint32_t> findNode(const std::string& id) const;
    /// Returns the lesson's node index, nullopt if the id is absent or not a lesson.
    std::optional<uint32_t> findLesson(const std::string& lessonId) const;

    /// Node indices in pre-order (root first, children in sort order).
    const std::vector<uint32_t>& preorder() const { return preorder_; }

private:
    std::string subject_id_;
    std::string version_;
    std::vector<StructureNode> nodes_;
    std::unordered_map<std::string, uint32_t> index_by_id_;
    std::vector<uint32_t> preorder_;
    size_t lesson_count_ = 0;
    std::optional<uint32_t> max_bit_position_;
};

} // namespace ProgressEngine
