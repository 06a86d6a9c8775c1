#pragma once

#include "cellfst_cell.hpp"
#include "cellfst_fst.hpp"
#include "cellfst_key.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <utility>

namespace cellfst {

// ============================================================================
// bound -- one end of a cell range, in key order
// ============================================================================

struct bound {
    fst_bound::kind k = fst_bound::kind::unbounded;
    cell_index      cell{};

    static bound unbounded() noexcept { return {}; }
    static bound included(cell_index c) noexcept { return {fst_bound::kind::included, c}; }
    static bound excluded(cell_index c) noexcept { return {fst_bound::kind::excluded, c}; }

    [[nodiscard]] fst_bound to_fst() const {
        if (k == fst_bound::kind::unbounded) return fst_bound::unbounded();
        cell_key key = encode(cell);
        std::span<const uint8_t> b = key.span();
        return {k, {b.begin(), b.end()}};
    }
};

// Stream bounds covering every proper descendant of cell: keys that extend
// encode(cell). Digits never reach 0xFF, so prefix + 0xFF is above them all.
// This is wider than first_child..=last_child at the next resolution, which
// would stop at the last child itself and skip the cells below it.
inline std::pair<fst_bound, fst_bound> descendant_bounds(cell_index cell) {
    cell_key key = encode(cell);
    fst_bound lower = fst_bound::excluded(key.span());
    fst_bound upper = fst_bound::excluded(key.span());
    upper.bytes.push_back(0xFF);
    return {std::move(lower), std::move(upper)};
}

// ============================================================================
// Item policies -- what an iterator yields for a (key, output) pair
// ============================================================================

struct set_item {
    using value_type = cell_index;
    static value_type make(std::span<const uint8_t> key, uint64_t) {
        return decode(key);
    }
};

struct map_item {
    using value_type = std::pair<cell_index, uint64_t>;
    static value_type make(std::span<const uint8_t> key, uint64_t out) {
        return {decode(key), out};
    }
};

struct map_key_item {
    using value_type = cell_index;
    static value_type make(std::span<const uint8_t> key, uint64_t) {
        return decode(key);
    }
};

struct map_value_item {
    using value_type = uint64_t;
    static value_type make(std::span<const uint8_t>, uint64_t out) noexcept {
        return out;
    }
};

// ============================================================================
// cell_iterator -- input iterator over an fst_stream
//
// A default-constructed iterator is the end iterator. Decoding throws
// errc::invalid_cell if the blob holds bytes that are not a cell key.
// ============================================================================

template <typename ITEM>
class cell_iterator {
    std::optional<fst_stream>  stream_;
    typename ITEM::value_type  current_{};

    void advance() {
        if (stream_ && stream_->next())
            current_ = ITEM::make(stream_->key(), stream_->output());
        else
            stream_.reset();
    }

public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = typename ITEM::value_type;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    cell_iterator() = default;
    explicit cell_iterator(fst_stream s) : stream_(std::move(s)) { advance(); }

    reference operator*() const noexcept { return current_; }
    pointer operator->() const noexcept { return &current_; }

    cell_iterator& operator++() {
        advance();
        return *this;
    }

    cell_iterator operator++(int) {
        cell_iterator t = *this;
        advance();
        return t;
    }

    friend bool operator==(const cell_iterator& a, const cell_iterator& b) noexcept {
        if (!a.stream_ || !b.stream_) return !a.stream_ && !b.stream_;
        return bytes_cmp(a.stream_->key(), b.stream_->key()) == 0;
    }
};

// ============================================================================
// cell_range -- restartable range; every begin() starts a fresh walk
// ============================================================================

template <typename ITEM>
class cell_range {
    fst_view  fst_;
    fst_bound lower_;
    fst_bound upper_;

public:
    using iterator = cell_iterator<ITEM>;

    explicit cell_range(const fst_view& fst,
                        fst_bound lower = fst_bound::unbounded(),
                        fst_bound upper = fst_bound::unbounded())
        : fst_(fst), lower_(std::move(lower)), upper_(std::move(upper)) {}

    iterator begin() const { return iterator(fst_stream(fst_, lower_, upper_)); }
    iterator end() const noexcept { return iterator(); }
};

} // namespace cellfst
