#pragma once

#include "cellfst_builder.hpp"
#include "cellfst_cell.hpp"
#include "cellfst_fst.hpp"
#include "cellfst_iter.hpp"
#include "cellfst_mmap.hpp"
#include "cellfst_query.hpp"
#include "cellfst_storage.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cellfst {

// ============================================================================
// basic_frozen_set -- read-only set of H3 cells
//
// Built once from cells sorted in key order, then only queried. All member
// functions are const and safe to call from many threads at once.
// ============================================================================

template <typename DATA>
class basic_frozen_set {
public:
    using value_type = cell_index;
    using size_type  = std::size_t;
    using iterator   = cell_iterator<set_item>;
    using range_type = cell_range<set_item>;

private:
    frozen_storage<DATA> store_;

    explicit basic_frozen_set(DATA data)
        : store_(std::move(data), fst_kind::set) {}

public:
    // ------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------

    // Wrap a blob without copying it. Throws errc::corrupt_buffer when the
    // bytes are not a set blob of a supported format version.
    static basic_frozen_set from_bytes(DATA data) {
        return basic_frozen_set(std::move(data));
    }

    // Build in memory from cells sorted in key order.
    template <typename RANGE>
    static basic_frozen_set build(const RANGE& cells)
        requires std::same_as<DATA, std::vector<uint8_t>> {
        frozen_set_builder b;
        b.extend(cells);
        return basic_frozen_set(b.finish());
    }

    static basic_frozen_set open(const std::string& path)
        requires std::same_as<DATA, mapped_file> {
        return basic_frozen_set(mapped_file(path));
    }

    // ------------------------------------------------------------------
    // Capacity
    // ------------------------------------------------------------------

    [[nodiscard]] size_type size() const noexcept {
        return static_cast<size_type>(store_.fst().size());
    }

    [[nodiscard]] bool empty() const noexcept { return store_.fst().empty(); }

    // ------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------

    // True only if this exact cell (same resolution) was stored.
    [[nodiscard]] bool contains(cell_index cell) const {
        return set_query::exact(store_.fst(), cell).has_value();
    }

    // True if the cell or one of its ancestors was stored.
    [[nodiscard]] bool contains_compacted(cell_index cell) const {
        return set_query::compacted(store_.fst(), cell).has_value();
    }

    // The stored ancestor-or-self of cell, if any.
    [[nodiscard]] std::optional<cell_index> find_compacted(cell_index cell) const {
        auto m = set_query::compacted(store_.fst(), cell);
        if (!m) return std::nullopt;
        return set_query::matched_cell(cell, *m);
    }

    // ------------------------------------------------------------------
    // Iteration (key order)
    // ------------------------------------------------------------------

    iterator begin() const { return iterator(fst_stream(store_.fst())); }
    iterator end() const noexcept { return iterator(); }

    range_type range(const bound& lower, const bound& upper) const {
        return range_type(store_.fst(), lower.to_fst(), upper.to_fst());
    }

    // Every stored proper descendant of cell, at any resolution.
    range_type descendants(cell_index cell) const {
        auto [lower, upper] = descendant_bounds(cell);
        return range_type(store_.fst(), std::move(lower), std::move(upper));
    }

    // ------------------------------------------------------------------
    // Serialisation
    // ------------------------------------------------------------------

    [[nodiscard]] std::span<const uint8_t> as_bytes() const noexcept {
        return store_.bytes();
    }

    [[nodiscard]] std::vector<uint8_t> to_bytes() const {
        auto b = as_bytes();
        return {b.begin(), b.end()};
    }

    void verify() const { store_.fst().verify(); }
    void save(const std::string& path) const { store_.save(path); }
};

using frozen_set        = basic_frozen_set<std::vector<uint8_t>>;
using frozen_set_view   = basic_frozen_set<std::span<const uint8_t>>;
using mapped_frozen_set = basic_frozen_set<mapped_file>;

} // namespace cellfst
