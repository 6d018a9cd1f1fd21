#pragma once

#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/progress/progress_view.hpp>
#include <json/json.h>
#include <string>

namespace ProgressEngine {

/**
 * @brief JSON shapes of the read and write responses.
 *
 *   progress: {subjectId, completionPercentage, suggestedNextLessonId|null,
 *              totalLessons, passedLessons, tree: [{id, title, type, status,
 *              bestScore?, children: [...]}]}
 *   complete: {success, xpAwarded, newTotalXp, isFirstCompletion, isNewRecord}
 *   error:    {success: false, error: {code, message, retryable}}
 */
namespace ProgressJson {

Json::Value toJson(const ProgressNode& node);
Json::Value toJson(const ProgressView& view);
Json::Value toJson(const CompletionResult& result);
Json::Value errorToJson(const ProgressError& error);

/// Compact single-line rendering.
std::string write(const Json::Value& value);

} // namespace ProgressJson

} // namespace ProgressEngine
