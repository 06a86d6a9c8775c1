#pragma once

#include "cellfst_error.hpp"
#include "cellfst_fst_node.hpp"
#include "cellfst_support.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cellfst {

// ============================================================================
// fst_view -- read-only access to a finished blob
//
// Holds a span only; the owner of the bytes keeps them alive. open()
// checks the header, footer and root node. The checksum is only
// recomputed by verify().
// ============================================================================

class fst_view {
    std::span<const uint8_t> blob_;
    uint64_t                 len_  = 0;
    uint64_t                 root_ = 0;
    fst_kind                 kind_ = fst_kind::set;

    [[noreturn]] static void corrupt(const std::string& why) {
        throw error(errc::corrupt_buffer, why);
    }

public:
    fst_view() = default;

    static fst_view open(std::span<const uint8_t> blob,
                         std::optional<fst_kind> expected = std::nullopt) {
        if (blob.size() < FST_HEADER_SIZE + NODE_HEADER_SIZE + FST_FOOTER_SIZE)
            corrupt("blob of " + std::to_string(blob.size()) +
                    " bytes is too small");

        const uint8_t* p = blob.data();
        if (read_u32(p) != FST_MAGIC) corrupt("bad magic");

        uint32_t version = read_u32(p + 4);
        if (version != FST_VERSION)
            corrupt("unsupported format version " + std::to_string(version));

        uint32_t kind = read_u32(p + 8);
        if (kind > static_cast<uint32_t>(fst_kind::map))
            corrupt("unknown blob kind " + std::to_string(kind));

        fst_view v;
        v.blob_ = blob;
        v.kind_ = static_cast<fst_kind>(kind);
        if (expected && *expected != v.kind_)
            corrupt(std::string("blob holds a ") + fst_kind_name(v.kind_) +
                    ", expected a " + fst_kind_name(*expected));

        const uint8_t* footer = p + blob.size() - FST_FOOTER_SIZE;
        v.len_  = read_u64(footer);
        v.root_ = read_u64(footer + 8);

        // Throws on a root outside the node region.
        (void)fst_node::decode(blob, v.root_);
        return v;
    }

    // Same view over an identical copy of the blob at another address.
    [[nodiscard]] fst_view rebind(std::span<const uint8_t> blob) const noexcept {
        fst_view v = *this;
        v.blob_ = blob;
        return v;
    }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    [[nodiscard]] uint64_t size()  const noexcept { return len_; }
    [[nodiscard]] bool     empty() const noexcept { return len_ == 0; }
    [[nodiscard]] fst_kind kind()  const noexcept { return kind_; }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return blob_;
    }

    fst_node root() const { return fst_node::decode(blob_, root_); }
    fst_node node(uint64_t addr) const { return fst_node::decode(blob_, addr); }

    void verify() const {
        if (blob_.size() < FST_FOOTER_SIZE) corrupt("blob too small");
        std::size_t body = blob_.size() - 8;
        uint64_t expected = read_u64(blob_.data() + body);
        uint64_t actual = fnv1a(blob_.first(body));
        if (expected != actual) corrupt("checksum mismatch");
    }
};

// ============================================================================
// fst_bound -- one end of a stream range
// ============================================================================

struct fst_bound {
    enum class kind : uint8_t { unbounded, included, excluded };

    kind                 k = kind::unbounded;
    std::vector<uint8_t> bytes;

    static fst_bound unbounded() { return {}; }

    static fst_bound included(std::span<const uint8_t> b) {
        return {kind::included, {b.begin(), b.end()}};
    }

    static fst_bound excluded(std::span<const uint8_t> b) {
        return {kind::excluded, {b.begin(), b.end()}};
    }

    [[nodiscard]] bool is_unbounded() const noexcept {
        return k == kind::unbounded;
    }
};

// ============================================================================
// fst_stream -- lexicographic enumeration of keys and outputs
//
// Depth-first walk with an explicit stack. key_ holds the bytes leading to
// the node of the top frame, so key_.size() == stack_.size() - 1.
// ============================================================================

class fst_stream {
    struct frame {
        fst_node node;
        int      next;         // next transition slot to follow
        uint64_t out;          // output accumulated before this node
        bool     emit_final;   // node's own final state not yet reported
    };

    fst_view             fst_;
    std::vector<frame>   stack_;
    std::vector<uint8_t> key_;
    fst_bound            upper_;
    uint64_t             out_ = 0;

    // Position the stack on the first key >= lower (> lower if excluded).
    void seek(const fst_bound& lower) {
        fst_node node = fst_.root();
        uint64_t out = output_ops::zero();

        if (lower.is_unbounded()) {
            stack_.push_back({node, 0, out, true});
            return;
        }

        for (uint8_t b : lower.bytes) {
            int slot = node.lower_bound(b);
            if (slot < node.count() && node.input(slot) == b) {
                stack_.push_back({node, slot + 1, out, false});
                fst_transition t = node.transition(slot);
                out = output_ops::cat(out, t.output);
                node = fst_.node(t.addr);
                key_.push_back(b);
            } else {
                // Everything from slot onwards sorts after lower.
                stack_.push_back({node, slot, out, false});
                return;
            }
        }
        stack_.push_back({node, 0, out, lower.k == fst_bound::kind::included});
    }

    // True while key_ (and so every key below it) can still be in range.
    [[nodiscard]] bool below_upper() const noexcept {
        if (upper_.is_unbounded()) return true;
        int cmp = bytes_cmp(key_, upper_.bytes);
        if (cmp < 0) return true;
        return cmp == 0 && upper_.k == fst_bound::kind::included;
    }

public:
    explicit fst_stream(const fst_view& fst,
                        const fst_bound& lower = fst_bound::unbounded(),
                        fst_bound upper = fst_bound::unbounded())
        : fst_(fst), upper_(std::move(upper)) {
        seek(lower);
    }

    // Advance to the next key. Returns false once exhausted.
    bool next() {
        while (!stack_.empty()) {
            frame& f = stack_.back();

            if (f.emit_final) {
                f.emit_final = false;
                if (f.node.is_final()) {
                    if (!below_upper()) break;
                    out_ = output_ops::cat(f.out, f.node.final_output());
                    return true;
                }
            }

            if (f.next >= f.node.count()) {
                stack_.pop_back();
                if (!key_.empty()) key_.pop_back();
                continue;
            }

            fst_transition t = f.node.transition(f.next++);
            uint64_t out = output_ops::cat(f.out, t.output);
            fst_node child = fst_.node(t.addr);

            key_.push_back(t.input);
            if (!below_upper()) break;
            stack_.push_back({child, 0, out, true});
        }

        stack_.clear();
        key_.clear();
        return false;
    }

    [[nodiscard]] std::span<const uint8_t> key() const noexcept { return key_; }
    [[nodiscard]] uint64_t output() const noexcept { return out_; }
};

} // namespace cellfst
