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
// basic_frozen_map -- read-only map from H3 cells to uint64_t
//
// Values live on the automaton transitions; a lookup sums the outputs along
// the path it takes. Same storage and threading rules as basic_frozen_set.
// ============================================================================

template <typename DATA>
class basic_frozen_map {
public:
    using key_type    = cell_index;
    using mapped_type = uint64_t;
    using value_type  = std::pair<cell_index, uint64_t>;
    using size_type   = std::size_t;
    using iterator    = cell_iterator<map_item>;
    using range_type  = cell_range<map_item>;

private:
    frozen_storage<DATA> store_;

    explicit basic_frozen_map(DATA data)
        : store_(std::move(data), fst_kind::map) {}

public:
    static basic_frozen_map from_bytes(DATA data) {
        return basic_frozen_map(std::move(data));
    }

    // Build in memory from (cell, value) pairs sorted in key order.
    template <typename RANGE>
    static basic_frozen_map build(const RANGE& entries)
        requires std::same_as<DATA, std::vector<uint8_t>> {
        frozen_map_builder b;
        b.extend(entries);
        return basic_frozen_map(b.finish());
    }

    static basic_frozen_map open(const std::string& path)
        requires std::same_as<DATA, mapped_file> {
        return basic_frozen_map(mapped_file(path));
    }

    [[nodiscard]] size_type size() const noexcept {
        return static_cast<size_type>(store_.fst().size());
    }

    [[nodiscard]] bool empty() const noexcept { return store_.fst().empty(); }

    // ------------------------------------------------------------------
    // Exact lookup
    // ------------------------------------------------------------------

    [[nodiscard]] std::optional<uint64_t> get(cell_index cell) const {
        auto m = map_query::exact(store_.fst(), cell);
        if (!m) return std::nullopt;
        return m->output;
    }

    [[nodiscard]] bool contains_key(cell_index cell) const {
        return map_query::exact(store_.fst(), cell).has_value();
    }

    // ------------------------------------------------------------------
    // Compacted lookup: the value of the stored ancestor-or-self
    // ------------------------------------------------------------------

    [[nodiscard]] std::optional<uint64_t> get_compacted(cell_index cell) const {
        auto m = map_query::compacted(store_.fst(), cell);
        if (!m) return std::nullopt;
        return m->output;
    }

    [[nodiscard]] std::optional<value_type> find_compacted(cell_index cell) const {
        auto m = map_query::compacted(store_.fst(), cell);
        if (!m) return std::nullopt;
        return value_type{map_query::matched_cell(cell, *m), m->output};
    }

    [[nodiscard]] bool contains_key_compacted(cell_index cell) const {
        return map_query::compacted(store_.fst(), cell).has_value();
    }

    // ------------------------------------------------------------------
    // Iteration (key order)
    // ------------------------------------------------------------------

    iterator begin() const { return iterator(fst_stream(store_.fst())); }
    iterator end() const noexcept { return iterator(); }

    cell_range<map_key_item> keys() const {
        return cell_range<map_key_item>(store_.fst());
    }

    cell_range<map_value_item> values() const {
        return cell_range<map_value_item>(store_.fst());
    }

    range_type range(const bound& lower, const bound& upper) const {
        return range_type(store_.fst(), lower.to_fst(), upper.to_fst());
    }

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

using frozen_map        = basic_frozen_map<std::vector<uint8_t>>;
using frozen_map_view   = basic_frozen_map<std::span<const uint8_t>>;
using mapped_frozen_map = basic_frozen_map<mapped_file>;

} // namespace cellfst
