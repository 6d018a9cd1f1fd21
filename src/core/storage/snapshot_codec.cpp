#include <progressengine/core/storage/snapshot_codec.hpp>
#include <progressengine/core/common/errors.hpp>
#include <json/json.h>
#include <map>
#include <sstream>
#include <stdexcept>

namespace ProgressEngine {
namespace SnapshotCodec {

std::string encodeScores(const BestScores& scores) {
    // Sorted keys keep repeated upserts of the same state byte-identical
    std::map<std::string, int64_t> ordered(scores.begin(), scores.end());
    Json::Value obj(Json::objectValue);
    for (const auto& [lesson, score] : ordered) {
        obj[lesson] = static_cast<Json::Int64>(score);
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, obj);
}

BestScores decodeScores(const std::string& json) {
    BestScores scores;
    if (json.empty()) return scores;

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream in(json);
    if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
        throw ProgressError(ErrorCode::CORRUPT_SNAPSHOT, "best scores are not a JSON object: " + errs);
    }
    for (const auto& lesson : root.getMemberNames()) {
        const Json::Value& v = root[lesson];
        if (!v.isIntegral()) {
            throw ProgressError(ErrorCode::CORRUPT_SNAPSHOT,
                                "best score for lesson " + lesson + " is not an integer");
        }
        scores[lesson] = v.asInt64();
    }
    return scores;
}

ProgressSnapshot encode(const std::string& learnerId, const std::string& subjectId,
                        const Bytes& bitmap, const BestScores& scores) {
    ProgressSnapshot snap;
    snap.learnerId = learnerId;
    snap.subjectId = subjectId;
    snap.completionBitmapBase64 = Bitmap::encodeBase64(bitmap);
    snap.bestScoresJson = encodeScores(scores);
    return snap;
}

Bytes decodeBitmap(const ProgressSnapshot& snapshot) {
    try {
        return Bitmap::decodeBase64(snapshot.completionBitmapBase64);
    } catch (const std::invalid_argument& e) {
        throw ProgressError(ErrorCode::CORRUPT_SNAPSHOT,
                            "bitmap for " + snapshot.learnerId + ":" + snapshot.subjectId
                            + " is not valid base64: " + e.what());
    }
}

} // namespace SnapshotCodec
} // namespace ProgressEngine
