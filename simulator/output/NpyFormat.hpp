#pragma once

#include <cstdint>
#include <cstring>
#include <string>

// Constants and byte helpers for the NumPy .npy v1.0 container.
// Layout: magic (6) | major, minor (2) | header length, uint16 LE (2) |
// ASCII dict header padded with spaces and ending in '\n' | raw data.
namespace npy {
    constexpr char magic[] = "\x93NUMPY";
    constexpr size_t magicSize = 6;
    constexpr size_t preambleSize = 10;
    constexpr size_t headerAlignment = 64;
    constexpr char float64Descr[] = "<f8";

    // Little-endian encoding independent of the host byte order
    inline void encodeDouble(double value, unsigned char* out) {
        std::uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int b = 0; b < 8; ++b) {
            out[b] = static_cast<unsigned char>((bits >> (8 * b)) & 0xFFu);
        }
    }

    inline double decodeDouble(const unsigned char* in) {
        std::uint64_t bits = 0;
        for (int b = 0; b < 8; ++b) {
            bits |= static_cast<std::uint64_t>(in[b]) << (8 * b);
        }
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }
}
