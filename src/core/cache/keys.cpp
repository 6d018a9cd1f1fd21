#include <progressengine/core/cache/keys.hpp>
#include <progressengine/core/common/errors.hpp>

namespace ProgressEngine {
namespace Keys {

namespace {
constexpr const char* BITMAP_PREFIX = "user_prog:";
constexpr const char* SCORES_PREFIX = "best_scores:";
constexpr size_t BITMAP_PREFIX_LEN = 10;
}

void validateId(const std::string& id, const char* what) {
    if (id.empty()) {
        throw ProgressError(ErrorCode::INVALID_ARGUMENT, std::string(what) + " must not be empty");
    }
    if (id.find(':') != std::string::npos) {
        throw ProgressError(ErrorCode::INVALID_ARGUMENT,
                            std::string(what) + " must not contain ':' (" + id + ")");
    }
    // Subject ids name structure files
    if (id.find_first_of("/\\") != std::string::npos || id.find("..") != std::string::npos) {
        throw ProgressError(ErrorCode::INVALID_ARGUMENT,
                            std::string(what) + " must not contain path components (" + id + ")");
    }
}

std::string bitmapKey(const std::string& learnerId, const std::string& subjectId) {
    return BITMAP_PREFIX + learnerId + ":" + subjectId;
}

std::string scoresKey(const std::string& learnerId, const std::string& subjectId) {
    return SCORES_PREFIX + learnerId + ":" + subjectId;
}

std::pair<std::string, std::string> parseBitmapKey(const std::string& key) {
    if (key.compare(0, BITMAP_PREFIX_LEN, BITMAP_PREFIX) != 0) {
        throw ProgressError(ErrorCode::INVALID_ARGUMENT, "not a progress key: " + key);
    }
    auto rest = key.substr(BITMAP_PREFIX_LEN);
    auto sep = rest.find(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 == rest.size()
        || rest.find(':', sep + 1) != std::string::npos) {
        throw ProgressError(ErrorCode::INVALID_ARGUMENT, "malformed progress key: " + key);
    }
    return {rest.substr(0, sep), rest.substr(sep + 1)};
}

} // namespace Keys
} // namespace ProgressEngine
