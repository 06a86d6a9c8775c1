#pragma once

#include "cellfst_error.hpp"
#include "cellfst_fst_node.hpp"
#include "cellfst_support.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cellfst {

// ============================================================================
// Build-time node representation
// ============================================================================

struct builder_transition {
    uint8_t  input;
    uint64_t output;
    uint64_t addr;

    friend bool operator==(const builder_transition&,
                           const builder_transition&) = default;
};

struct builder_node {
    bool     is_final = false;
    uint64_t final_output = 0;
    std::vector<builder_transition> trans;

    friend bool operator==(const builder_node&, const builder_node&) = default;

    [[nodiscard]] bool is_empty_final() const noexcept {
        return is_final && final_output == 0 && trans.empty();
    }
};

// Serialise n at the end of out. Layout in cellfst_fst_node.hpp.
inline void encode_node(const builder_node& n, std::vector<uint8_t>& out) {
    uint16_t count = static_cast<uint16_t>(n.trans.size());
    uint8_t out_w  = n.is_final ? bytes_needed(n.final_output) : 0;
    uint8_t addr_w = 0;
    for (const auto& t : n.trans) {
        out_w  = std::max(out_w,  bytes_needed(t.output));
        addr_w = std::max(addr_w, bytes_needed(t.addr));
    }

    uint8_t flags = 0;
    if (n.is_final) flags |= NODE_FINAL;
    if (count > DENSE_THRESHOLD) flags |= NODE_DENSE;

    out.push_back(flags);
    out.push_back(static_cast<uint8_t>((addr_w << 4) | out_w));
    append_uint(out, count, 2);

    if (n.is_final) append_uint(out, n.final_output, out_w);

    if (flags & NODE_DENSE) {
        bitmap_256 bm;
        for (const auto& t : n.trans) bm.set_bit(t.input);
        for (uint64_t w : bm.words) append_uint(out, w, 8);
    } else {
        for (const auto& t : n.trans) out.push_back(t.input);
    }
    for (const auto& t : n.trans) append_uint(out, t.output, out_w);
    for (const auto& t : n.trans) append_uint(out, t.addr, addr_w);
}

// ============================================================================
// node_registry -- fixed-size hash table of compiled nodes
//
// One entry per bucket, newest wins. Misses only cost compression, never
// correctness, so the working set stays bounded regardless of key count.
// ============================================================================

class node_registry {
    struct entry {
        builder_node node;
        uint64_t     addr = 0;
        bool         used = false;
    };

    std::vector<entry> table_;

    static uint64_t hash(const builder_node& n) noexcept {
        uint64_t h = FNV_OFFSET;
        auto mix = [&h](uint64_t v) {
            h ^= v;
            h *= FNV_PRIME;
        };
        mix(n.is_final);
        mix(n.final_output);
        for (const auto& t : n.trans) {
            mix(t.input);
            mix(t.output);
            mix(t.addr);
        }
        return h;
    }

public:
    explicit node_registry(std::size_t slots) : table_(slots) {}

    // Address of an identical node compiled earlier, or the slot to fill.
    std::optional<uint64_t> find(const builder_node& n, std::size_t& slot) const {
        if (table_.empty()) return std::nullopt;
        slot = static_cast<std::size_t>(hash(n) % table_.size());
        const entry& e = table_[slot];
        if (e.used && e.node == n) return e.addr;
        return std::nullopt;
    }

    void insert(std::size_t slot, const builder_node& n, uint64_t addr) {
        if (table_.empty()) return;
        table_[slot] = entry{n, addr, true};
    }
};

// ============================================================================
// unfinished_nodes -- the path of the last inserted key that may still change
//
// stack_[i] is the node reached after i bytes of the last key. Its
// outgoing transition on key byte i is held apart in `last` until the
// node below it is compiled and its address is known.
// ============================================================================

class unfinished_nodes {
    struct last_transition {
        uint8_t  input;
        uint64_t output;
    };

    struct unfinished {
        builder_node node;
        std::optional<last_transition> last;

        void freeze(uint64_t addr) {
            if (last) {
                node.trans.push_back({last->input, last->output, addr});
                last.reset();
            }
        }

        void add_output_prefix(uint64_t prefix) {
            if (node.is_final)
                node.final_output = output_ops::cat(prefix, node.final_output);
            for (auto& t : node.trans)
                t.output = output_ops::cat(prefix, t.output);
            if (last)
                last->output = output_ops::cat(prefix, last->output);
        }
    };

    std::vector<unfinished> stack_;

public:
    unfinished_nodes() { push_empty(false); }

    [[nodiscard]] std::size_t len() const noexcept { return stack_.size(); }

    void push_empty(bool is_final) {
        unfinished u;
        u.node.is_final = is_final;
        stack_.push_back(std::move(u));
    }

    void set_root_output(uint64_t out) {
        stack_[0].node.is_final = true;
        stack_[0].node.final_output = out;
    }

    builder_node pop_root() {
        assert(stack_.size() == 1 && !stack_.back().last);
        builder_node n = std::move(stack_.back().node);
        stack_.pop_back();
        return n;
    }

    builder_node pop_freeze(uint64_t addr) {
        unfinished u = std::move(stack_.back());
        stack_.pop_back();
        u.freeze(addr);
        return std::move(u.node);
    }

    builder_node pop_empty() {
        unfinished u = std::move(stack_.back());
        stack_.pop_back();
        assert(!u.last);
        return std::move(u.node);
    }

    void top_last_freeze(uint64_t addr) {
        stack_.back().freeze(addr);
    }

    void add_suffix(std::span<const uint8_t> bs, uint64_t out) {
        if (bs.empty()) return;
        assert(!stack_.back().last);
        stack_.back().last = last_transition{bs[0], out};
        for (std::size_t i = 1; i < bs.size(); ++i) {
            unfinished u;
            u.last = last_transition{bs[i], output_ops::zero()};
            stack_.push_back(std::move(u));
        }
        push_empty(true);
    }

    // Walk the shared prefix of bs and the last key. Along the way the
    // shared transitions keep only the common part of their output and
    // push the remainder one node down. Returns the prefix length and the
    // part of out that is left for the new suffix.
    std::pair<std::size_t, uint64_t>
    find_common_prefix_and_set_output(std::span<const uint8_t> bs,
                                      uint64_t out) {
        std::size_t i = 0;
        while (i < bs.size()) {
            auto& last = stack_[i].last;
            if (!last || last->input != bs[i]) break;
            ++i;
            uint64_t common = output_ops::prefix(last->output, out);
            uint64_t add    = output_ops::sub(last->output, common);
            out = output_ops::sub(out, common);
            last->output = common;
            if (add != output_ops::zero())
                stack_[i].add_output_prefix(add);
        }
        return {i, out};
    }
};

// ============================================================================
// fst_build_stats
// ============================================================================

struct fst_build_stats {
    uint64_t keys          = 0;
    uint64_t nodes_written = 0;
    uint64_t nodes_shared  = 0;   // compile requests answered by the registry
    uint64_t bytes         = 0;
};

// ============================================================================
// fst_builder -- incremental construction of a minimal acyclic transducer
//
// Keys must arrive in strictly increasing byte order. The blob is either
// kept in memory and returned by finish(), or written to a std::ostream as
// nodes are frozen, so only the unfinished path and the registry stay
// resident. Addresses are byte offsets from the start of the output in both
// cases. The builder is spent after finish().
// ============================================================================

class fst_builder {
public:
    static constexpr std::size_t DEFAULT_REGISTRY_SLOTS = 10000;

private:
    std::vector<uint8_t>    out_;            // whole blob, or staged bytes when streaming
    std::ostream*           sink_ = nullptr;
    uint64_t                written_ = 0;    // bytes already handed to sink_
    uint64_t                checksum_ = FNV_OFFSET;
    unfinished_nodes        unfinished_;
    node_registry           registry_;
    std::vector<uint8_t>    last_;
    std::optional<uint64_t> empty_final_addr_;
    fst_build_stats         stats_;
    fst_kind                kind_;
    bool                    has_last_ = false;
    bool                    finished_ = false;

    [[nodiscard]] uint64_t position() const noexcept {
        return written_ + out_.size();
    }

    // Hand the staged bytes to the stream. A no-op for in-memory builds.
    void emit() {
        if (!sink_ || out_.empty()) return;
        checksum_ = fnv1a(out_, checksum_);
        sink_->write(reinterpret_cast<const char*>(out_.data()),
                     static_cast<std::streamsize>(out_.size()));
        if (!*sink_)
            throw error(errc::io, "fst_builder: stream write failed at offset " +
                                  std::to_string(written_));
        written_ += out_.size();
        out_.clear();
    }

    void write_header() {
        append_uint(out_, FST_MAGIC, 4);
        append_uint(out_, FST_VERSION, 4);
        append_uint(out_, static_cast<uint32_t>(kind_), 4);
        append_uint(out_, 0, 4);
        emit();
    }

    void check_order(std::span<const uint8_t> key) const {
        if (!has_last_) return;
        int cmp = bytes_cmp(key, last_);
        if (cmp == 0)
            throw error(errc::duplicate_key, "key " + to_hex(key));
        if (cmp < 0)
            throw error(errc::out_of_order_key,
                        "key " + to_hex(key) + " after " + to_hex(last_));
    }

    uint64_t compile(const builder_node& n) {
        if (n.is_empty_final() && empty_final_addr_) {
            ++stats_.nodes_shared;
            return *empty_final_addr_;
        }

        std::size_t slot = 0;
        if (auto addr = registry_.find(n, slot)) {
            ++stats_.nodes_shared;
            return *addr;
        }

        uint64_t addr = position();
        encode_node(n, out_);
        emit();
        registry_.insert(slot, n, addr);
        if (n.is_empty_final()) empty_final_addr_ = addr;
        ++stats_.nodes_written;
        return addr;
    }

    // Compile every unfinished node deeper than istate.
    void compile_from(std::size_t istate) {
        std::optional<uint64_t> addr;
        while (istate + 1 < unfinished_.len()) {
            builder_node n = addr ? unfinished_.pop_freeze(*addr)
                                  : unfinished_.pop_empty();
            addr = compile(n);
        }
        if (addr) unfinished_.top_last_freeze(*addr);
    }

public:
    explicit fst_builder(fst_kind kind,
                         std::size_t registry_slots = DEFAULT_REGISTRY_SLOTS)
        : registry_(registry_slots), kind_(kind) {
        write_header();
    }

    // Streams the blob to out. out must outlive the builder.
    fst_builder(std::ostream& out, fst_kind kind,
                std::size_t registry_slots = DEFAULT_REGISTRY_SLOTS)
        : sink_(&out), registry_(registry_slots), kind_(kind) {
        write_header();
    }

    fst_builder(const fst_builder&) = delete;
    fst_builder& operator=(const fst_builder&) = delete;
    fst_builder(fst_builder&&) = default;
    fst_builder& operator=(fst_builder&&) = default;

    [[nodiscard]] fst_kind kind() const noexcept { return kind_; }
    [[nodiscard]] uint64_t size() const noexcept { return stats_.keys; }
    [[nodiscard]] const fst_build_stats& stats() const noexcept { return stats_; }
    [[nodiscard]] bool     streaming() const noexcept { return sink_ != nullptr; }

    void insert(std::span<const uint8_t> key, uint64_t output = 0) {
        if (finished_)
            throw std::logic_error("fst_builder: insert after finish");
        check_order(key);

        if (key.empty()) {
            unfinished_.set_root_output(output);
        } else {
            auto [prefix_len, rest] =
                unfinished_.find_common_prefix_and_set_output(key, output);
            compile_from(prefix_len);
            unfinished_.add_suffix(key.subspan(prefix_len), rest);
        }

        last_.assign(key.begin(), key.end());
        has_last_ = true;
        ++stats_.keys;
    }

    // Returns the blob of an in-memory build. A streaming build returns an
    // empty vector once the footer is written and the stream flushed.
    std::vector<uint8_t> finish() {
        if (finished_)
            throw std::logic_error("fst_builder: finish called twice");
        finished_ = true;

        compile_from(0);
        uint64_t root = compile(unfinished_.pop_root());

        append_uint(out_, stats_.keys, 8);
        append_uint(out_, root, 8);
        append_uint(out_, fnv1a(out_, checksum_), 8);
        stats_.bytes = position();
        emit();

        if (sink_) {
            sink_->flush();
            if (!*sink_) throw error(errc::io, "fst_builder: stream flush failed");
        }
        return std::move(out_);
    }
};

} // namespace cellfst
