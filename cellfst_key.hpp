#pragma once

#include "cellfst_cell.hpp"
#include "cellfst_error.hpp"
#include "cellfst_support.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace cellfst {

// ============================================================================
// cell_key -- automaton key of a cell
//
// Layout: [base cell] [digit 1] ... [digit res], one byte each.
//
// Only meaningful digits are emitted, so an ancestor key is a byte prefix
// of its descendants' keys, and byte order is depth-first hierarchy order:
// base cell first, then digit 1, digit 2, ... with an ancestor sorting
// before all of its descendants.
// ============================================================================

inline constexpr std::size_t BASE_WIDTH  = 1;
inline constexpr std::size_t DIGIT_WIDTH = 1;
inline constexpr std::size_t KEY_MAX =
    BASE_WIDTH + DIGIT_WIDTH * cell_index::MAX_RESOLUTION;

struct cell_key {
    std::array<uint8_t, KEY_MAX> bytes{};
    uint8_t len = 0;

    [[nodiscard]] std::span<const uint8_t> span() const noexcept {
        return {bytes.data(), len};
    }

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes.data(); }
    [[nodiscard]] std::size_t size() const noexcept { return len; }

    friend bool operator==(const cell_key& a, const cell_key& b) noexcept {
        return bytes_cmp(a.span(), b.span()) == 0;
    }
};

// Resolution implied by a key length; -1 for malformed lengths.
inline constexpr int key_resolution(std::size_t len) noexcept {
    if (len < BASE_WIDTH || len > KEY_MAX) return -1;
    if ((len - BASE_WIDTH) % DIGIT_WIDTH != 0) return -1;
    return static_cast<int>((len - BASE_WIDTH) / DIGIT_WIDTH);
}

// ----------------------------------------------------------------------------
// encode
// ----------------------------------------------------------------------------

inline cell_key encode(cell_index cell) noexcept {
    cell_key k;
    int res = cell.resolution();
    k.bytes[0] = cell.base_cell();
    for (int r = 1; r <= res; ++r)
        k.bytes[BASE_WIDTH + (r - 1) * DIGIT_WIDTH] = cell.digit(r);
    k.len = static_cast<uint8_t>(BASE_WIDTH + res * DIGIT_WIDTH);
    return k;
}

inline cell_key encode(uint64_t raw) {
    return encode(cell_index::from_bits(raw));
}

// ----------------------------------------------------------------------------
// decode
//
// Key bytes may come from a borrowed blob, so every byte is checked.
// ----------------------------------------------------------------------------

inline cell_index decode(std::span<const uint8_t> key) {
    int res = key_resolution(key.size());
    if (res < 0)
        throw error(errc::invalid_cell,
                    "key length " + std::to_string(key.size()) +
                    " is not a cell key length");

    std::array<uint8_t, cell_index::MAX_RESOLUTION> digits{};
    for (int r = 1; r <= res; ++r)
        digits[r - 1] = key[BASE_WIDTH + (r - 1) * DIGIT_WIDTH];

    auto cell = cell_index::try_from_parts(
        key[0], std::span<const uint8_t>(digits.data(),
                                         static_cast<std::size_t>(res)));
    if (!cell)
        throw error(errc::invalid_cell, "key bytes " + to_hex(key));
    return *cell;
}

// ----------------------------------------------------------------------------
// Key order of cells
// ----------------------------------------------------------------------------

inline int key_compare(cell_index a, cell_index b) noexcept {
    cell_key ka = encode(a);
    cell_key kb = encode(b);
    return bytes_cmp(ka.span(), kb.span());
}

// Strict weak ordering matching the order builders require. Raw index order
// is resolution-major and does not match it.
struct key_less {
    bool operator()(cell_index a, cell_index b) const noexcept {
        return key_compare(a, b) < 0;
    }
};

} // namespace cellfst
