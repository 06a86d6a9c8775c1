#pragma once

#include "cellfst_cell.hpp"
#include "cellfst_error.hpp"
#include "cellfst_fst_builder.hpp"
#include "cellfst_key.hpp"
#include "cellfst_support.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cellfst {

template <typename DATA> class basic_frozen_set;
template <typename DATA> class basic_frozen_map;

// ============================================================================
// cell_builder -- validating front end of fst_builder
//
// Cells must arrive strictly increasing in key order (see key_less). A
// repeated or smaller key is rejected with a build_error naming its
// zero-based position in the input before anything reaches the engine, as
// is a raw identifier that is not a valid cell. WITH_VALUE selects set
// (cell) or map (cell, value) input.
// ============================================================================

template <bool WITH_VALUE>
class cell_builder {
    fst_builder fst_;
    cell_key    last_{};
    std::size_t count_ = 0;

    void push(cell_index cell, uint64_t value) {
        cell_key key = encode(cell);
        if (count_ > 0) {
            int cmp = bytes_cmp(key.span(), last_.span());
            if (cmp == 0)
                throw build_error(errc::duplicate_key, count_, cell.bits(),
                                  "cell " + cell.to_string() + " at position " +
                                  std::to_string(count_));
            if (cmp < 0)
                throw build_error(errc::out_of_order_key, count_, cell.bits(),
                                  "cell " + cell.to_string() + " at position " +
                                  std::to_string(count_) + " sorts before " +
                                  decode(last_.span()).to_string());
        }
        fst_.insert(key.span(), value);
        last_ = key;
        ++count_;
    }

    cell_index checked(uint64_t raw) const {
        if (auto cell = cell_index::try_from_bits(raw)) return *cell;
        throw build_error(errc::invalid_cell, count_, raw,
                          "0x" + cell_index::hex_bits(raw) + " at position " +
                          std::to_string(count_) + " is not a valid cell index");
    }

public:
    explicit cell_builder(
        std::size_t registry_slots = fst_builder::DEFAULT_REGISTRY_SLOTS)
        : fst_(WITH_VALUE ? fst_kind::map : fst_kind::set, registry_slots) {}

    // Writes the blob to out while building; finish() then returns nothing
    // and the result is read back with from_bytes or open.
    explicit cell_builder(
        std::ostream& out,
        std::size_t registry_slots = fst_builder::DEFAULT_REGISTRY_SLOTS)
        : fst_(out, WITH_VALUE ? fst_kind::map : fst_kind::set, registry_slots) {}

    void insert(cell_index cell) requires (!WITH_VALUE) { push(cell, 0); }
    void insert(uint64_t raw) requires (!WITH_VALUE) {
        push(checked(raw), 0);
    }

    void insert(cell_index cell, uint64_t value) requires WITH_VALUE {
        push(cell, value);
    }
    void insert(uint64_t raw, uint64_t value) requires WITH_VALUE {
        push(checked(raw), value);
    }

    // Inserts every element of r; stops at the first rejected one.
    template <typename RANGE>
    void extend(const RANGE& r) {
        for (const auto& e : r) {
            if constexpr (WITH_VALUE)
                insert(e.first, e.second);
            else
                insert(e);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] const fst_build_stats& stats() const noexcept {
        return fst_.stats();
    }

    [[nodiscard]] bool streaming() const noexcept { return fst_.streaming(); }

    std::vector<uint8_t> finish() { return fst_.finish(); }

    // finish() wrapped in an owning container (needs cellfst_set.hpp /
    // cellfst_map.hpp). In-memory builders only.
    template <typename SET = basic_frozen_set<std::vector<uint8_t>>>
    SET into_set() requires (!WITH_VALUE) {
        if (streaming())
            throw std::logic_error("cell_builder: into_set on a streaming builder");
        return SET::from_bytes(finish());
    }

    template <typename MAP = basic_frozen_map<std::vector<uint8_t>>>
    MAP into_map() requires WITH_VALUE {
        if (streaming())
            throw std::logic_error("cell_builder: into_map on a streaming builder");
        return MAP::from_bytes(finish());
    }
};

using frozen_set_builder = cell_builder<false>;
using frozen_map_builder = cell_builder<true>;

} // namespace cellfst
