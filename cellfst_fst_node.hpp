#pragma once

#include "cellfst_error.hpp"
#include "cellfst_support.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cellfst {

// ============================================================================
// Blob layout (all integers little endian)
//
//   [header 16B] [node ...] [node ...] ... [footer 24B]
//
//   header: magic "CFST" (u32), version (u32), kind (u32), reserved (u32)
//   footer: key count (u64), root address (u64), checksum (u64)
//
// The checksum is FNV-1a 64 over every byte before it. Nodes are written
// children first, so a transition target is always strictly below the
// address of the node that holds it.
// ============================================================================

inline constexpr uint32_t    FST_MAGIC       = 0x54534643;  // "CFST"
inline constexpr uint32_t    FST_VERSION     = 1;
inline constexpr std::size_t FST_HEADER_SIZE = 16;
inline constexpr std::size_t FST_FOOTER_SIZE = 24;

enum class fst_kind : uint32_t {
    set = 0,
    map = 1
};

inline const char* fst_kind_name(fst_kind k) noexcept {
    return k == fst_kind::set ? "set" : "map";
}

// ============================================================================
// Node layout
//
//   [flags 1B] [widths 1B] [count 2B] [final output] [index] [outputs] [targets]
//
//   flags:   bit0 final, bit1 dense
//   widths:  low nibble output width (0..8), high nibble address width (0..8)
//   final output: output width bytes, present only when final
//   index:   dense  -> 32B input bitmap, slot = rank of the input bit
//            sparse -> count input bytes, ascending
//   outputs: count * output width bytes
//   targets: count * address width bytes
//
// Nodes with more than DENSE_THRESHOLD transitions use the bitmap index.
// ============================================================================

inline constexpr std::size_t NODE_HEADER_SIZE = 4;
inline constexpr uint16_t    DENSE_THRESHOLD  = 32;
inline constexpr uint16_t    MAX_TRANSITIONS  = 256;

inline constexpr uint8_t NODE_FINAL = 1;
inline constexpr uint8_t NODE_DENSE = 2;

struct fst_transition {
    uint8_t  input;
    uint64_t output;
    uint64_t addr;
};

// ----------------------------------------------------------------------------
// fst_node -- decoded view of one node, pointing into the blob
// ----------------------------------------------------------------------------

class fst_node {
    const uint8_t* outputs_ = nullptr;
    const uint8_t* targets_ = nullptr;
    const uint8_t* inputs_  = nullptr;   // sparse only
    bitmap_256     bitmap_{};            // dense only
    uint64_t       addr_ = 0;
    uint64_t       final_output_ = 0;
    uint16_t       count_ = 0;
    uint8_t        flags_ = 0;
    uint8_t        out_w_ = 0;
    uint8_t        addr_w_ = 0;

    [[noreturn]] static void corrupt(uint64_t addr, const char* why) {
        throw error(errc::corrupt_buffer,
                    "node at " + std::to_string(addr) + ": " + why);
    }

public:
    fst_node() = default;

    static std::size_t encoded_size(uint8_t flags, uint8_t out_w,
                                    uint8_t addr_w, uint16_t count) noexcept {
        std::size_t sz = NODE_HEADER_SIZE;
        if (flags & NODE_FINAL) sz += out_w;
        sz += (flags & NODE_DENSE) ? sizeof(bitmap_256) : count;
        sz += std::size_t(count) * (out_w + addr_w);
        return sz;
    }

    // Decode the node at addr. Every field is range checked against the
    // node region of the blob.
    static fst_node decode(std::span<const uint8_t> blob, uint64_t addr) {
        if (blob.size() < FST_HEADER_SIZE + FST_FOOTER_SIZE)
            corrupt(addr, "blob too small");
        const uint64_t end = blob.size() - FST_FOOTER_SIZE;
        if (addr < FST_HEADER_SIZE || addr > end || end - addr < NODE_HEADER_SIZE)
            corrupt(addr, "address outside node region");

        const uint8_t* p = blob.data() + addr;
        fst_node n;
        n.addr_   = addr;
        n.flags_  = p[0];
        n.out_w_  = p[1] & 15;
        n.addr_w_ = p[1] >> 4;
        n.count_  = read_u16(p + 2);

        if (n.flags_ & ~(NODE_FINAL | NODE_DENSE)) corrupt(addr, "unknown flags");
        if (n.out_w_ > 8 || n.addr_w_ > 8) corrupt(addr, "bad field width");
        if (n.count_ > MAX_TRANSITIONS) corrupt(addr, "bad transition count");
        if (n.count_ > 0 && n.addr_w_ == 0) corrupt(addr, "zero address width");
        if (n.is_dense() && n.count_ == 0) corrupt(addr, "empty dense node");

        std::size_t sz = encoded_size(n.flags_, n.out_w_, n.addr_w_, n.count_);
        if (sz > end - addr) corrupt(addr, "node overruns node region");

        const uint8_t* cur = p + NODE_HEADER_SIZE;
        if (n.is_final()) {
            n.final_output_ = read_uint(cur, n.out_w_);
            cur += n.out_w_;
        }
        if (n.is_dense()) {
            for (int w = 0; w < 4; ++w)
                n.bitmap_.words[w] = read_u64(cur + w * 8);
            if (n.bitmap_.popcount() != n.count_)
                corrupt(addr, "bitmap does not match transition count");
            cur += sizeof(bitmap_256);
        } else {
            n.inputs_ = cur;
            cur += n.count_;
        }
        n.outputs_ = cur;
        cur += std::size_t(n.count_) * n.out_w_;
        n.targets_ = cur;
        return n;
    }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    [[nodiscard]] uint64_t addr()         const noexcept { return addr_; }
    [[nodiscard]] bool     is_final()     const noexcept { return flags_ & NODE_FINAL; }
    [[nodiscard]] bool     is_dense()     const noexcept { return flags_ & NODE_DENSE; }
    [[nodiscard]] uint16_t count()        const noexcept { return count_; }
    [[nodiscard]] uint64_t final_output() const noexcept { return final_output_; }

    [[nodiscard]] uint8_t input(int i) const noexcept {
        return is_dense() ? bitmap_.byte_for_slot(i) : inputs_[i];
    }

    [[nodiscard]] uint64_t output(int i) const noexcept {
        return out_w_ ? read_uint(outputs_ + std::size_t(i) * out_w_, out_w_) : 0;
    }

    uint64_t target(int i) const {
        uint64_t t = read_uint(targets_ + std::size_t(i) * addr_w_, addr_w_);
        if (t >= addr_) corrupt(addr_, "transition does not point backwards");
        return t;
    }

    fst_transition transition(int i) const {
        return {input(i), output(i), target(i)};
    }

    // ------------------------------------------------------------------
    // Input search
    // ------------------------------------------------------------------

    // Slot of the transition on byte b, -1 if absent.
    [[nodiscard]] int find_input(uint8_t b) const noexcept {
        if (is_dense()) return bitmap_.find_slot(b);
        for (int i = 0; i < count_; ++i) {
            if (inputs_[i] == b) return i;
            if (inputs_[i] > b) break;
        }
        return -1;
    }

    // Slot of the first transition whose input is >= b (count() if none).
    [[nodiscard]] int lower_bound(uint8_t b) const noexcept {
        if (is_dense()) return bitmap_.count_below(b);
        int i = 0;
        while (i < count_ && inputs_[i] < b) ++i;
        return i;
    }
};

} // namespace cellfst
