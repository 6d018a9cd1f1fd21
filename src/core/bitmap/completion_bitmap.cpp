#include <progressengine/core/bitmap/completion_bitmap.hpp>
#include <array>
#include <stdexcept>

namespace ProgressEngine {
namespace Bitmap {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Reverse lookup, -1 for characters outside the alphabet
std::array<int8_t, 256> buildReverseTable() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

} // namespace

bool test(const Bytes& bitmap, uint32_t position) {
    size_t idx = byteIndex(position);
    if (idx >= bitmap.size()) return false;
    return (bitmap[idx] & bitMask(position)) != 0;
}

bool set(Bytes& bitmap, uint32_t position) {
    size_t idx = byteIndex(position);
    if (idx >= bitmap.size()) {
        bitmap.resize(idx + 1, 0);
    }
    bool previous = (bitmap[idx] & bitMask(position)) != 0;
    bitmap[idx] |= bitMask(position);
    return previous;
}

size_t popcount(const Bytes& bitmap) {
    size_t count = 0;
    for (uint8_t byte : bitmap) {
        count += static_cast<size_t>(__builtin_popcount(byte));
    }
    return count;
}

std::string encodeBase64(const Bytes& bitmap) {
    std::string out;
    out.reserve(((bitmap.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bitmap.size(); i += 3) {
        uint32_t chunk = (static_cast<uint32_t>(bitmap[i]) << 16)
                       | (static_cast<uint32_t>(bitmap[i + 1]) << 8)
                       | static_cast<uint32_t>(bitmap[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
    }

    size_t rest = bitmap.size() - i;
    if (rest == 1) {
        uint32_t chunk = static_cast<uint32_t>(bitmap[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t chunk = (static_cast<uint32_t>(bitmap[i]) << 16)
                       | (static_cast<uint32_t>(bitmap[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

Bytes decodeBase64(const std::string& encoded) {
    static const std::array<int8_t, 256> reverse = buildReverseTable();

    Bytes out;
    if (encoded.empty()) return out;
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 length must be a multiple of 4");
    }
    out.reserve((encoded.size() / 4) * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        uint32_t chunk = 0;
        int padding = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = encoded[i + j];
            if (c == '=') {
                // Padding only allowed in the last two slots of the final quad
                if (i + 4 != encoded.size() || j < 2) {
                    throw std::invalid_argument("unexpected base64 padding");
                }
                ++padding;
                chunk <<= 6;
                continue;
            }
            if (padding > 0) {
                throw std::invalid_argument("data after base64 padding");
            }
            int8_t v = reverse[static_cast<uint8_t>(c)];
            if (v < 0) {
                throw std::invalid_argument("invalid base64 character");
            }
            chunk = (chunk << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<uint8_t>((chunk >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((chunk >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(chunk & 0xFF));
    }
    return out;
}

} // namespace Bitmap
} // namespace ProgressEngine
