#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ProgressEngine {

enum class ErrorCode : uint8_t {
    LESSON_NOT_FOUND,
    SUBJECT_NOT_FOUND,
    INVALID_STRUCTURE,
    INVALID_ARGUMENT,
    CACHE_UNAVAILABLE,
    STORE_UNAVAILABLE,
    SYNC_FAILURE,
    CORRUPT_SNAPSHOT
};

/**
 * @brief Single exception type raised by every engine component.
 *
 * Structural errors (not found, invalid input) indicate a caller or data bug
 * and are never retried. Infrastructure errors (cache/store unavailable,
 * sync failure) are transient and report retryable() == true.
 */
class ProgressError : public std::runtime_error {
public:
    ProgressError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    bool retryable() const noexcept {
        return code_ == ErrorCode::CACHE_UNAVAILABLE
            || code_ == ErrorCode::STORE_UNAVAILABLE
            || code_ == ErrorCode::SYNC_FAILURE;
    }

    static const char* codeString(ErrorCode code) {
        switch (code) {
            case ErrorCode::LESSON_NOT_FOUND:  return "LessonNotFound";
            case ErrorCode::SUBJECT_NOT_FOUND: return "SubjectNotFound";
            case ErrorCode::INVALID_STRUCTURE: return "InvalidStructure";
            case ErrorCode::INVALID_ARGUMENT:  return "InvalidArgument";
            case ErrorCode::CACHE_UNAVAILABLE: return "CacheUnavailable";
            case ErrorCode::STORE_UNAVAILABLE: return "StoreUnavailable";
            case ErrorCode::SYNC_FAILURE:      return "SyncFailure";
            case ErrorCode::CORRUPT_SNAPSHOT:  return "CorruptSnapshot";
        }
        return "Unknown";
    }

private:
    ErrorCode code_;
};

} // namespace ProgressEngine
