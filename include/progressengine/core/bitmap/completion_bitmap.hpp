#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ProgressEngine {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Bit-level helpers over a raw completion bitmap.
 *
 * Layout matches a Redis SETBIT string: position p lives in byte p / 8 under
 * mask 0x80 >> (p % 8). Growing the bitmap only appends bytes, so existing
 * positions never move.
 */
namespace Bitmap {

inline size_t byteIndex(uint32_t position) { return position / 8; }
inline uint8_t bitMask(uint32_t position) {
    return static_cast<uint8_t>(0x80u >> (position % 8));
}

/// Number of bytes required to address positions [0, lessonCount).
inline size_t bytesFor(size_t lessonCount) { return (lessonCount + 7) / 8; }

bool test(const Bytes& bitmap, uint32_t position);

/// Sets the bit, growing the buffer if needed. Returns the previous value.
bool set(Bytes& bitmap, uint32_t position);

size_t popcount(const Bytes& bitmap);

std::string encodeBase64(const Bytes& bitmap);

/// Throws std::invalid_argument on malformed input. Empty string yields an
/// empty bitmap.
Bytes decodeBase64(const std::string& encoded);

} // namespace Bitmap

} // namespace ProgressEngine
