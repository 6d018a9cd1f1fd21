#pragma once

#include <string>
#include <utility>

namespace ProgressEngine {

/**
 * @brief Cache key layout for one (learner, subject) pair.
 *
 *   user_prog:{learner}:{subject}    completion bitmap (byte string)
 *   best_scores:{learner}:{subject}  lessonId -> best score (integer hash)
 *
 * The dirty set stores the bitmap key as its member.
 */
namespace Keys {

/// Throws ProgressError(INVALID_ARGUMENT) on an empty id or one containing ':'.
void validateId(const std::string& id, const char* what);

std::string bitmapKey(const std::string& learnerId, const std::string& subjectId);
std::string scoresKey(const std::string& learnerId, const std::string& subjectId);

/// Splits a dirty-set member back into (learner, subject).
/// Throws ProgressError(INVALID_ARGUMENT) if the member is not a bitmap key.
std::pair<std::string, std::string> parseBitmapKey(const std::string& key);

} // namespace Keys

} // namespace ProgressEngine
