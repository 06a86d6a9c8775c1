#pragma once

#include "cellfst_cell.hpp"
#include "cellfst_fst.hpp"
#include "cellfst_key.hpp"
#include "cellfst_support.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace cellfst {

// ============================================================================
// query_engine -- exact and compacted traversals
//
// WITH_OUTPUT selects whether transition outputs are accumulated (maps) or
// skipped (sets). Both walks are a single pass over the key bytes and never
// backtrack.
// ============================================================================

template <bool WITH_OUTPUT>
struct query_engine {
    struct match {
        std::size_t len;      // key bytes consumed when the final state was hit
        uint64_t    output;   // accumulated output, 0 when !WITH_OUTPUT
    };

    // ------------------------------------------------------------------
    // Exact: every byte must match and the last state must be final.
    // ------------------------------------------------------------------

    static std::optional<match> exact(const fst_view& fst,
                                      std::span<const uint8_t> key) {
        fst_node node = fst.root();
        uint64_t out = output_ops::zero();

        for (uint8_t b : key) {
            int slot = node.find_input(b);
            if (slot < 0) return std::nullopt;
            if constexpr (WITH_OUTPUT)
                out = output_ops::cat(out, node.output(slot));
            node = fst.node(node.target(slot));
        }

        if (!node.is_final()) return std::nullopt;
        if constexpr (WITH_OUTPUT)
            out = output_ops::cat(out, node.final_output());
        return match{key.size(), out};
    }

    // ------------------------------------------------------------------
    // Compacted: a final state at the end of any complete segment (base
    // cell, then each digit) is a match. The first one is the only one in a
    // compacted set, since stored cells never overlap.
    // ------------------------------------------------------------------

    static std::optional<match> compacted(const fst_view& fst,
                                          std::span<const uint8_t> key) {
        fst_node node = fst.root();
        uint64_t out = output_ops::zero();
        std::size_t boundary = BASE_WIDTH;

        for (std::size_t i = 0; i < key.size(); ++i) {
            int slot = node.find_input(key[i]);
            if (slot < 0) return std::nullopt;
            if constexpr (WITH_OUTPUT)
                out = output_ops::cat(out, node.output(slot));
            node = fst.node(node.target(slot));

            if (i + 1 < boundary) continue;
            if (node.is_final()) {
                if constexpr (WITH_OUTPUT)
                    out = output_ops::cat(out, node.final_output());
                return match{i + 1, out};
            }
            boundary += DIGIT_WIDTH;
        }
        return std::nullopt;
    }

    // ------------------------------------------------------------------
    // Cell entry points
    // ------------------------------------------------------------------

    static std::optional<match> exact(const fst_view& fst, cell_index cell) {
        cell_key k = encode(cell);
        return exact(fst, k.span());
    }

    static std::optional<match> compacted(const fst_view& fst, cell_index cell) {
        cell_key k = encode(cell);
        return compacted(fst, k.span());
    }

    // Stored ancestor-or-self of cell that a compacted match stopped at.
    static cell_index matched_cell(cell_index cell, const match& m) {
        // m.len comes from a prefix of encode(cell), so the parent exists.
        return *cell.parent(key_resolution(m.len));
    }
};

using set_query = query_engine<false>;
using map_query = query_engine<true>;

} // namespace cellfst
