#pragma once

#include <progressengine/core/bitmap/completion_bitmap.hpp>
#include <progressengine/core/storage/snapshot_store.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace ProgressEngine {

using BestScores = std::unordered_map<std::string, int64_t>;

/**
 * @brief Conversion between cache state and the durable record format.
 *
 * Decoders throw ProgressError(CORRUPT_SNAPSHOT) on malformed input.
 */
namespace SnapshotCodec {

std::string encodeScores(const BestScores& scores);
BestScores decodeScores(const std::string& json);

ProgressSnapshot encode(const std::string& learnerId, const std::string& subjectId,
                        const Bytes& bitmap, const BestScores& scores);

Bytes decodeBitmap(const ProgressSnapshot& snapshot);

} // namespace SnapshotCodec

} // namespace ProgressEngine
