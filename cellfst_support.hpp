#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace cellfst {

// ============================================================================
// bitmap_256 -- one bit per input byte
//
// Used by dense automaton nodes: the rank of an input byte among the set
// bits is the slot of its transition.
// ============================================================================

struct bitmap_256 {
    uint64_t words[4]{};

    [[nodiscard]] bool has_bit(uint8_t idx) const noexcept {
        return (words[idx >> 6] >> (idx & 63)) & 1;
    }

    void set_bit(uint8_t idx) noexcept {
        words[idx >> 6] |= uint64_t(1) << (idx & 63);
    }

    [[nodiscard]] int find_slot(uint8_t idx) const noexcept {
        if (!has_bit(idx)) return -1;
        return count_below(idx);
    }

    [[nodiscard]] int count_below(uint8_t idx) const noexcept {
        int w = idx >> 6;
        uint64_t mask = (uint64_t(1) << (idx & 63)) - 1;
        int cnt = 0;
        for (int i = 0; i < w; ++i)
            cnt += std::popcount(words[i]);
        cnt += std::popcount(words[w] & mask);
        return cnt;
    }

    [[nodiscard]] int popcount() const noexcept {
        return std::popcount(words[0]) + std::popcount(words[1]) +
               std::popcount(words[2]) + std::popcount(words[3]);
    }

    // Byte value of the n-th set bit (0-based). Caller guarantees n < popcount.
    [[nodiscard]] uint8_t byte_for_slot(int n) const noexcept {
        for (int w = 0; w < 4; ++w) {
            int pc = std::popcount(words[w]);
            if (n < pc) {
                uint64_t x = words[w];
                for (int i = 0; i < n; ++i) x &= x - 1;
                return static_cast<uint8_t>(w * 64 + std::countr_zero(x));
            }
            n -= pc;
        }
        return 0;
    }
};

static_assert(sizeof(bitmap_256) == 32);

// ============================================================================
// Little-endian fixed-width encoding
// ============================================================================

// Number of bytes needed to hold v (0 for v == 0).
inline constexpr uint8_t bytes_needed(uint64_t v) noexcept {
    return static_cast<uint8_t>((std::bit_width(v) + 7) / 8);
}

inline void write_uint(uint8_t* p, uint64_t v, unsigned width) noexcept {
    for (unsigned i = 0; i < width; ++i) {
        p[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

inline uint64_t read_uint(const uint8_t* p, unsigned width) noexcept {
    uint64_t v = 0;
    for (unsigned i = width; i > 0; --i)
        v = (v << 8) | p[i - 1];
    return v;
}

inline void append_uint(std::vector<uint8_t>& out, uint64_t v, unsigned width) {
    std::size_t at = out.size();
    out.resize(at + width);
    write_uint(out.data() + at, v, width);
}

inline uint16_t read_u16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>(read_uint(p, 2));
}

inline uint32_t read_u32(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(read_uint(p, 4));
}

inline uint64_t read_u64(const uint8_t* p) noexcept {
    return read_uint(p, 8);
}

// ============================================================================
// Output arithmetic
//
// Outputs form the (min, +) semiring over uint64_t: the shared part of two
// outputs is their minimum, and outputs along a path add up.
// ============================================================================

struct output_ops {
    static constexpr uint64_t zero() noexcept { return 0; }

    static constexpr uint64_t prefix(uint64_t a, uint64_t b) noexcept {
        return std::min(a, b);
    }

    static constexpr uint64_t cat(uint64_t a, uint64_t b) noexcept {
        return a + b;
    }

    // Caller guarantees b <= a (b is a prefix of a).
    static constexpr uint64_t sub(uint64_t a, uint64_t b) noexcept {
        return a - b;
    }
};

// ============================================================================
// Checksum -- FNV-1a, 64 bit
// ============================================================================

inline constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
inline constexpr uint64_t FNV_PRIME  = 0x100000001b3ULL;

inline uint64_t fnv1a(std::span<const uint8_t> bytes,
                      uint64_t h = FNV_OFFSET) noexcept {
    for (uint8_t b : bytes) {
        h ^= b;
        h *= FNV_PRIME;
    }
    return h;
}

// ============================================================================
// Byte string helpers
// ============================================================================

template <class T>
inline int makecmp(T a, T b) noexcept {
    return (a < b) ? -1 : (a > b) ? 1 : 0;
}

// Lexicographic three-way compare of two byte strings.
inline int bytes_cmp(std::span<const uint8_t> a,
                     std::span<const uint8_t> b) noexcept {
    std::size_t n = std::min(a.size(), b.size());
    int cmp = n ? std::memcmp(a.data(), b.data(), n) : 0;
    if (cmp != 0) return cmp < 0 ? -1 : 1;
    return makecmp(a.size(), b.size());
}

inline std::string to_hex(std::span<const uint8_t> bytes) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s.push_back(DIGITS[b >> 4]);
        s.push_back(DIGITS[b & 15]);
    }
    return s;
}

// View any contiguous byte container as a span of bytes.
template <typename DATA>
inline std::span<const uint8_t> byte_span(const DATA& d) noexcept {
    using elem = std::remove_cv_t<std::remove_reference_t<decltype(*d.data())>>;
    static_assert(sizeof(elem) == 1, "blob storage must hold bytes");
    return {reinterpret_cast<const uint8_t*>(d.data()), d.size()};
}

} // namespace cellfst
