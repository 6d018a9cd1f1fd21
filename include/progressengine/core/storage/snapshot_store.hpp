#pragma once

#include <optional>
#include <string>

namespace ProgressEngine {

/**
 * @brief Durable record of one learner-subject pair.
 *
 * bestScoresJson is a flat JSON object {"lessonId": score, ...}.
 */
struct ProgressSnapshot {
    std::string learnerId;
    std::string subjectId;
    std::string completionBitmapBase64;
    std::string bestScoresJson;
};

/**
 * @brief Durable backing store for progress snapshots.
 *
 * Implementations throw ProgressError(STORE_UNAVAILABLE) on I/O failure.
 * upsert() must be idempotent: replaying the same snapshot leaves the same row.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual std::optional<ProgressSnapshot> load(const std::string& learnerId,
                                                 const std::string& subjectId) = 0;
    virtual void upsert(const ProgressSnapshot& snapshot) = 0;
};

} // namespace ProgressEngine
