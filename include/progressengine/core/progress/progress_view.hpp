#pragma once

#include <progressengine/core/structure/structure_tree.hpp>
#include <progressengine/core/unlock/unlock_calculator.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ProgressEngine {

struct ProgressNode {
    std::string id;
    std::string title;
    NodeType type = NodeType::LESSON;
    NodeStatus status = NodeStatus::LOCKED;
    std::optional<int64_t> bestScore;  // passed lessons only
    std::vector<ProgressNode> children;
};

/// Read-path response for one (learner, subject).
struct ProgressView {
    std::string subjectId;
    double completionPercentage = 0.0;
    std::optional<std::string> suggestedNextLessonId;
    size_t totalLessons = 0;
    size_t passedLessons = 0;
    bool servedFromDurable = false;  // cache was down, state read from the snapshot
    ProgressNode root;
};

/// Write-path response.
struct CompletionResult {
    bool success = false;
    int64_t xpAwarded = 0;
    int64_t newTotalXp = 0;
    bool isFirstCompletion = false;
    bool isNewRecord = false;
};

} // namespace ProgressEngine
