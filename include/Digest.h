#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace ringsim {
namespace digest {

// FNV-1a32 and CRC32 helpers for run signatures. Bit patterns are hashed,
// so -0.0 and 0.0 differ; callers hash values as stored.

inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

inline std::uint32_t fnv1a32_add_str(std::uint32_t h, const std::string& s) {
    h = fnv1a32_update(h, s.data(), s.size());
    return fnv1a32_add_u32(h, static_cast<std::uint32_t>(s.size()));
}

inline std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t len) {
    static bool table_init = false;
    static std::uint32_t table[256];
    if (!table_init) {
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        table_init = true;
    }
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        c = table[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

inline std::uint32_t crc32_add_u32(std::uint32_t crc, std::uint32_t v) {
    return crc32_update(crc, &v, sizeof(v));
}

inline std::uint32_t crc32_add_f32(std::uint32_t crc, float v) {
    std::uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected float size");
    std::memcpy(&bits, &v, sizeof(v));
    return crc32_update(crc, &bits, sizeof(bits));
}

} // namespace digest
} // namespace ringsim
