#pragma once

#include "cellfst_error.hpp"

#include <array>
#include <charconv>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cellfst {

// ============================================================================
// cell_index -- H3 cell identifier
//
// Bit layout (MSB first):
//   [63]     reserved, 0
//   [59..62] mode, 1 (cell)
//   [56..58] reserved, 0
//   [52..55] resolution 0..15
//   [45..51] base cell 0..121
//   [0..44]  fifteen 3-bit digits, digit r at offset (15 - r) * 3
//
// Digits up to the resolution are 0..6; the rest hold UNUSED_DIGIT.
// A cell_index is always valid: it can only be obtained through the
// validating factories below.
// ============================================================================

class cell_index {
public:
    static constexpr int      MAX_RESOLUTION  = 15;
    static constexpr uint8_t  BASE_CELL_COUNT = 122;
    static constexpr uint8_t  DIGIT_COUNT     = 7;
    static constexpr uint8_t  UNUSED_DIGIT    = 7;
    static constexpr uint8_t  K_AXES_DIGIT    = 1;

private:
    static constexpr uint64_t MODE_CELL    = 1;
    static constexpr int      MODE_OFFSET  = 59;
    static constexpr int      RES_OFFSET   = 52;
    static constexpr int      BASE_OFFSET  = 45;
    static constexpr int      DIGIT_BITS   = 3;
    static constexpr uint64_t DIGIT_MASK   = 7;
    static constexpr uint64_t ALL_UNUSED   = (uint64_t(1) << 45) - 1;

    static constexpr std::array<uint8_t, 12> PENTAGONS = {
        4, 14, 24, 38, 49, 58, 63, 72, 83, 97, 107, 117
    };

    uint64_t bits_ = (MODE_CELL << MODE_OFFSET) | ALL_UNUSED;

    explicit constexpr cell_index(uint64_t bits) noexcept : bits_(bits) {}

    static constexpr int digit_offset(int res) noexcept {
        return (MAX_RESOLUTION - res) * DIGIT_BITS;
    }

    static constexpr uint8_t raw_digit(uint64_t bits, int res) noexcept {
        return static_cast<uint8_t>((bits >> digit_offset(res)) & DIGIT_MASK);
    }

    static constexpr uint64_t with_digit(uint64_t bits, int res,
                                         uint64_t d) noexcept {
        int off = digit_offset(res);
        return (bits & ~(DIGIT_MASK << off)) | (d << off);
    }

    static constexpr uint64_t with_resolution(uint64_t bits, int res) noexcept {
        return (bits & ~(uint64_t(15) << RES_OFFSET)) |
               (static_cast<uint64_t>(res) << RES_OFFSET);
    }

public:
    // Base cell 0 at resolution 0.
    constexpr cell_index() noexcept = default;

    // ------------------------------------------------------------------
    // Validation and construction
    // ------------------------------------------------------------------

    static constexpr bool is_pentagon_base(uint8_t base) noexcept {
        for (uint8_t p : PENTAGONS)
            if (p == base) return true;
        return false;
    }

    static constexpr bool is_valid(uint64_t bits) noexcept {
        if (bits >> 63) return false;
        if (((bits >> MODE_OFFSET) & 15) != MODE_CELL) return false;
        if ((bits >> 56) & 7) return false;

        int res = static_cast<int>((bits >> RES_OFFSET) & 15);
        uint8_t base = static_cast<uint8_t>((bits >> BASE_OFFSET) & 127);
        if (base >= BASE_CELL_COUNT) return false;

        for (int r = 1; r <= MAX_RESOLUTION; ++r) {
            uint8_t d = raw_digit(bits, r);
            if (r <= res ? d == UNUSED_DIGIT : d != UNUSED_DIGIT)
                return false;
        }

        // Pentagons have no K axis sub-sequence: the first non-zero
        // digit below the base cell cannot be 1.
        if (is_pentagon_base(base)) {
            for (int r = 1; r <= res; ++r) {
                uint8_t d = raw_digit(bits, r);
                if (d == 0) continue;
                if (d == K_AXES_DIGIT) return false;
                break;
            }
        }
        return true;
    }

    static constexpr std::optional<cell_index>
    try_from_bits(uint64_t bits) noexcept {
        if (!is_valid(bits)) return std::nullopt;
        return cell_index(bits);
    }

    static cell_index from_bits(uint64_t bits) {
        if (!is_valid(bits))
            throw error(errc::invalid_cell, "0x" + hex_bits(bits));
        return cell_index(bits);
    }

    // Rebuild a cell from its resolution, base cell and meaningful digits
    // (digits.size() == res).
    static constexpr std::optional<cell_index>
    try_from_parts(uint8_t base, std::span<const uint8_t> digits) noexcept {
        if (digits.size() > static_cast<std::size_t>(MAX_RESOLUTION))
            return std::nullopt;
        if (base >= BASE_CELL_COUNT) return std::nullopt;

        int res = static_cast<int>(digits.size());
        uint64_t bits = (MODE_CELL << MODE_OFFSET) |
                        (static_cast<uint64_t>(res) << RES_OFFSET) |
                        (static_cast<uint64_t>(base) << BASE_OFFSET) |
                        ALL_UNUSED;
        for (int r = 1; r <= res; ++r) {
            uint8_t d = digits[r - 1];
            if (d >= DIGIT_COUNT) return std::nullopt;
            bits = with_digit(bits, r, d);
        }
        return try_from_bits(bits);
    }

    // Accepts "8a1fb46622dffff" or "0x8a1fb46622dffff".
    static cell_index parse(std::string_view text) {
        std::string_view digits = text;
        if (digits.size() > 2 && digits[0] == '0' &&
            (digits[1] == 'x' || digits[1] == 'X'))
            digits.remove_prefix(2);

        uint64_t bits = 0;
        auto [end, ec] = std::from_chars(digits.data(),
                                         digits.data() + digits.size(),
                                         bits, 16);
        if (digits.empty() || ec != std::errc{} ||
            end != digits.data() + digits.size())
            throw error(errc::invalid_cell,
                        "not a hexadecimal index: '" + std::string(text) + "'");
        return from_bits(bits);
    }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    [[nodiscard]] constexpr uint64_t bits() const noexcept { return bits_; }

    [[nodiscard]] constexpr int resolution() const noexcept {
        return static_cast<int>((bits_ >> RES_OFFSET) & 15);
    }

    [[nodiscard]] constexpr uint8_t base_cell() const noexcept {
        return static_cast<uint8_t>((bits_ >> BASE_OFFSET) & 127);
    }

    // Digit at resolution r (1..15). UNUSED_DIGIT past the cell resolution.
    [[nodiscard]] constexpr uint8_t digit(int r) const noexcept {
        return raw_digit(bits_, r);
    }

    [[nodiscard]] constexpr bool is_pentagon() const noexcept {
        if (!is_pentagon_base(base_cell())) return false;
        for (int r = 1; r <= resolution(); ++r)
            if (digit(r) != 0) return false;
        return true;
    }

    // ------------------------------------------------------------------
    // Hierarchy
    // ------------------------------------------------------------------

    [[nodiscard]] constexpr std::optional<cell_index>
    parent(int res) const noexcept {
        if (res < 0 || res > resolution()) return std::nullopt;
        uint64_t bits = with_resolution(bits_, res);
        for (int r = res + 1; r <= MAX_RESOLUTION; ++r)
            bits = with_digit(bits, r, UNUSED_DIGIT);
        return cell_index(bits);
    }

    [[nodiscard]] constexpr bool is_ancestor_of(cell_index other) const noexcept {
        if (other.resolution() <= resolution()) return false;
        auto p = other.parent(resolution());
        return p && *p == *this;
    }

    // All descendants at resolution res, in digit order. Empty when res is
    // coarser than the cell or out of range.
    [[nodiscard]] std::vector<cell_index> children(int res) const {
        std::vector<cell_index> level;
        if (res < resolution() || res > MAX_RESOLUTION) return level;
        level.push_back(*this);

        for (int r = resolution() + 1; r <= res; ++r) {
            std::vector<cell_index> next;
            next.reserve(level.size() * DIGIT_COUNT);
            for (cell_index c : level) {
                uint64_t base = with_resolution(c.bits_, r);
                for (uint8_t d = 0; d < DIGIT_COUNT; ++d) {
                    // Skips the deleted K sub-sequence of pentagons.
                    if (auto child = try_from_bits(with_digit(base, r, d)))
                        next.push_back(*child);
                }
            }
            level = std::move(next);
        }
        return level;
    }

    // ------------------------------------------------------------------
    // Formatting and comparison (raw index order)
    // ------------------------------------------------------------------

    static std::string hex_bits(uint64_t bits) {
        char buf[17];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), bits, 16);
        (void)ec;
        return std::string(buf, end);
    }

    [[nodiscard]] std::string to_string() const { return hex_bits(bits_); }

    friend constexpr bool operator==(cell_index, cell_index) noexcept = default;
    friend constexpr auto operator<=>(cell_index, cell_index) noexcept = default;
};

static_assert(sizeof(cell_index) == 8);

} // namespace cellfst

template <>
struct std::hash<cellfst::cell_index> {
    std::size_t operator()(cellfst::cell_index c) const noexcept {
        return std::hash<uint64_t>{}(c.bits());
    }
};
