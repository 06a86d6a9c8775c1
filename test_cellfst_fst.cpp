#include "cellfst_fst.hpp"
#include "cellfst_fst_builder.hpp"
#include "cellfst_query.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace cellfst;

// ============================================================================
// Helpers
// ============================================================================

static std::span<const uint8_t> bs(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

static std::vector<uint8_t> build(fst_kind kind,
        const std::vector<std::pair<std::string, uint64_t>>& entries) {
    fst_builder b(kind);
    for (auto& [k, v] : entries) b.insert(bs(k), v);
    return b.finish();
}

static std::vector<std::pair<std::string, uint64_t>>
collect(const fst_view& fst, const fst_bound& lo = fst_bound::unbounded(),
        fst_bound hi = fst_bound::unbounded()) {
    std::vector<std::pair<std::string, uint64_t>> out;
    fst_stream s(fst, lo, std::move(hi));
    while (s.next()) {
        auto k = s.key();
        out.emplace_back(std::string(k.begin(), k.end()), s.output());
    }
    return out;
}

template <typename F>
static bool throws_code(errc code, F&& f) {
    try {
        f();
    } catch (const error& e) {
        return e.code() == code;
    }
    return false;
}

// ============================================================================
// Support pieces
// ============================================================================

static void test_bitmap256() {
    std::printf("test_bitmap256...");

    bitmap_256 bm{};
    bm.set_bit(3);
    bm.set_bit(64);
    bm.set_bit(255);
    assert(bm.has_bit(3) && bm.has_bit(64) && bm.has_bit(255));
    assert(!bm.has_bit(4));
    assert(bm.popcount() == 3);
    assert(bm.find_slot(64) == 1);
    assert(bm.find_slot(65) == -1);
    assert(bm.count_below(64) == 1);
    assert(bm.count_below(255) == 2);
    assert(bm.byte_for_slot(2) == 255);

    std::printf(" OK\n");
}

static void test_output_ops() {
    std::printf("test_output_ops...");

    assert(output_ops::zero() == 0);
    assert(output_ops::prefix(5, 3) == 3);
    assert(output_ops::cat(3, 2) == 5);
    assert(output_ops::sub(5, 3) == 2);

    assert(bytes_needed(0) == 0);
    assert(bytes_needed(255) == 1);
    assert(bytes_needed(256) == 2);
    assert(bytes_needed(~uint64_t(0)) == 8);

    std::printf(" OK\n");
}

// ============================================================================
// Build and lookup
// ============================================================================

static void test_empty_fst() {
    std::printf("test_empty_fst...");

    auto blob = build(fst_kind::set, {});
    assert(blob.size() == FST_HEADER_SIZE + NODE_HEADER_SIZE + FST_FOOTER_SIZE);

    fst_view v = fst_view::open(blob);
    assert(v.empty());
    assert(v.size() == 0);
    assert(!v.root().is_final());
    assert(v.root().count() == 0);
    assert(!set_query::exact(v, bs("a")));
    assert(collect(v).empty());
    v.verify();

    std::printf(" OK\n");
}

static void test_set_lookup() {
    std::printf("test_set_lookup...");

    auto blob = build(fst_kind::set,
                      {{"a", 0}, {"ab", 0}, {"abc", 0}, {"b", 0}, {"ba", 0}, {"c", 0}});
    fst_view v = fst_view::open(blob, fst_kind::set);
    assert(v.size() == 6);
    assert(v.kind() == fst_kind::set);

    for (const char* k : {"a", "ab", "abc", "b", "ba", "c"})
        assert(set_query::exact(v, bs(k)));
    for (const char* k : {"", "aa", "abcd", "bb", "d", "bab"})
        assert(!set_query::exact(v, bs(k)));

    std::printf(" OK\n");
}

static void test_map_outputs() {
    std::printf("test_map_outputs...");

    const std::vector<std::pair<std::string, uint64_t>> entries = {
        {"", 7}, {"a", 5}, {"ab", 3}, {"abc", 10}, {"b", 0},
        {"ba", 1}, {"c", uint64_t(1) << 40}};
    auto blob = build(fst_kind::map, entries);
    fst_view v = fst_view::open(blob, fst_kind::map);
    assert(v.size() == entries.size());

    for (auto& [k, out] : entries) {
        auto m = map_query::exact(v, bs(k));
        assert(m && m->output == out && m->len == k.size());
    }
    assert(!map_query::exact(v, bs("bb")));

    // stream reports the same outputs in key order
    assert(collect(v) == entries);

    std::printf(" OK\n");
}

static void test_compacted_walk() {
    std::printf("test_compacted_walk...");

    // segments are one byte each after the one-byte base
    auto blob = build(fst_kind::map, {{"\x01\x02", 20}, {"\x03", 30}});
    fst_view v = fst_view::open(blob);

    auto m = map_query::compacted(v, bs("\x01\x02\x05\x06"));
    assert(m && m->len == 2 && m->output == 20);
    m = map_query::compacted(v, bs("\x03\x04"));
    assert(m && m->len == 1 && m->output == 30);
    assert(!map_query::compacted(v, bs("\x01")));
    assert(!map_query::compacted(v, bs("\x01\x03")));
    assert(!map_query::compacted(v, bs("\x02")));

    std::printf(" OK\n");
}

static void test_dense_nodes() {
    std::printf("test_dense_nodes...");

    fst_builder b(fst_kind::map);
    for (int i = 0; i < 256; i += 2) {
        uint8_t k = static_cast<uint8_t>(i);
        b.insert(std::span<const uint8_t>(&k, 1), uint64_t(i) * 3);
    }
    auto blob = b.finish();
    fst_view v = fst_view::open(blob);

    fst_node root = v.root();
    assert(root.is_dense());
    assert(root.count() == 128);
    assert(root.find_input(4) == 2);
    assert(root.find_input(5) == -1);
    assert(root.lower_bound(5) == 3);
    assert(root.lower_bound(255) == 128);

    for (int i = 0; i < 256; ++i) {
        uint8_t k = static_cast<uint8_t>(i);
        auto m = map_query::exact(v, std::span<const uint8_t>(&k, 1));
        if (i % 2) {
            assert(!m);
        } else {
            assert(m && m->output == uint64_t(i) * 3);
        }
    }

    // sparse below the threshold
    auto small = build(fst_kind::set, {{"a", 0}, {"b", 0}});
    assert(!fst_view::open(small).root().is_dense());

    std::printf(" OK\n");
}

static void test_minimisation() {
    std::printf("test_minimisation...");

    // every two-byte key over 0..6: one root, one shared middle node and
    // one shared final leaf
    fst_builder b(fst_kind::set);
    for (uint8_t x = 0; x < 7; ++x)
        for (uint8_t y = 0; y < 7; ++y) {
            uint8_t k[] = {x, y};
            b.insert(k);
        }
    auto blob = b.finish();
    const fst_build_stats& st = b.stats();
    assert(st.keys == 49);
    assert(st.nodes_written == 3);
    assert(st.nodes_shared > 0);
    assert(st.bytes == blob.size());

    fst_view v = fst_view::open(blob);
    assert(v.size() == 49);
    assert(collect(v).size() == 49);

    // no registry: correct, just larger
    fst_builder nb(fst_kind::set, 0);
    for (uint8_t x = 0; x < 7; ++x)
        for (uint8_t y = 0; y < 7; ++y) {
            uint8_t k[] = {x, y};
            nb.insert(k);
        }
    auto big = nb.finish();
    assert(big.size() > blob.size());
    assert(collect(fst_view::open(big)) == collect(v));

    std::printf(" OK\n");
}

static void test_builder_order() {
    std::printf("test_builder_order...");

    fst_builder b(fst_kind::set);
    b.insert(bs("b"));
    assert(throws_code(errc::duplicate_key, [&] { b.insert(bs("b")); }));
    assert(throws_code(errc::out_of_order_key, [&] { b.insert(bs("a")); }));
    assert(throws_code(errc::out_of_order_key, [&] { b.insert(bs("")); }));
    b.insert(bs("ba"));
    assert(b.size() == 2);

    auto blob = b.finish();
    assert(fst_view::open(blob).size() == 2);

    bool threw = false;
    try {
        b.insert(bs("c"));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::printf(" OK\n");
}

static void test_streamed_output() {
    std::printf("test_streamed_output...");

    // dense root, shared suffixes and non-zero outputs
    std::vector<std::pair<std::string, uint64_t>> entries;
    for (int a = 0; a < 40; ++a)
        for (int c = 0; c < 3; ++c)
            entries.push_back({std::string{char(a + 1), char(c + 1)},
                               uint64_t(a) * 300 + c});

    fst_builder mem(fst_kind::map);
    for (auto& [k, v] : entries) mem.insert(bs(k), v);
    auto expected = mem.finish();

    std::ostringstream sink;
    fst_builder streamed(sink, fst_kind::map);
    assert(streamed.streaming() && !mem.streaming());
    for (auto& [k, v] : entries) streamed.insert(bs(k), v);
    assert(streamed.finish().empty());
    assert(streamed.stats().bytes == expected.size());
    assert(streamed.stats().nodes_shared == mem.stats().nodes_shared);

    std::string out = sink.str();
    std::vector<uint8_t> blob(out.begin(), out.end());
    assert(blob == expected);

    fst_view v = fst_view::open(blob, fst_kind::map);
    v.verify();
    assert(collect(v) == entries);

    // a stream that cannot be written fails the build
    std::ostringstream broken;
    broken.setstate(std::ios::badbit);
    assert(throws_code(errc::io, [&] { fst_builder b(broken, fst_kind::set); }));

    std::printf(" OK\n");
}

// ============================================================================
// Streams
// ============================================================================

static void test_stream_bounds() {
    std::printf("test_stream_bounds...");

    auto blob = build(fst_kind::set,
                      {{"a", 0}, {"ab", 0}, {"abc", 0}, {"b", 0}, {"ba", 0}, {"c", 0}});
    fst_view v = fst_view::open(blob);

    auto keys = [&](const fst_bound& lo, fst_bound hi) {
        std::vector<std::string> out;
        for (auto& [k, _] : collect(v, lo, std::move(hi))) out.push_back(k);
        return out;
    };
    using sv = std::vector<std::string>;

    assert(keys(fst_bound::unbounded(), fst_bound::unbounded()) ==
           (sv{"a", "ab", "abc", "b", "ba", "c"}));
    assert(keys(fst_bound::included(bs("ab")), fst_bound::excluded(bs("ba"))) ==
           (sv{"ab", "abc", "b"}));
    assert(keys(fst_bound::excluded(bs("ab")), fst_bound::included(bs("ba"))) ==
           (sv{"abc", "b", "ba"}));
    assert(keys(fst_bound::included(bs("aa")), fst_bound::unbounded()) ==
           (sv{"ab", "abc", "b", "ba", "c"}));
    assert(keys(fst_bound::unbounded(), fst_bound::excluded(bs("a"))).empty());
    assert(keys(fst_bound::unbounded(), fst_bound::included(bs("a"))) ==
           (sv{"a"}));
    assert(keys(fst_bound::excluded(bs("c")), fst_bound::unbounded()).empty());
    assert(keys(fst_bound::included(bs("bz")), fst_bound::unbounded()) ==
           (sv{"c"}));
    // lower above upper
    assert(keys(fst_bound::included(bs("c")), fst_bound::excluded(bs("a"))).empty());

    // prefix range: everything strictly below "ab"
    std::vector<uint8_t> hi = {'a', 'b', 0xFF};
    assert(keys(fst_bound::excluded(bs("ab")), fst_bound::excluded(hi)) ==
           (sv{"abc"}));

    std::printf(" OK\n");
}

// ============================================================================
// Corrupt buffers
// ============================================================================

static void test_corrupt_buffers() {
    std::printf("test_corrupt_buffers...");

    const auto good = build(fst_kind::map, {{"a", 1}, {"b", 2}, {"c", 3}});
    fst_view::open(good).verify();

    auto rejected = [](std::vector<uint8_t> blob,
                       std::optional<fst_kind> kind = std::nullopt) {
        return throws_code(errc::corrupt_buffer,
                           [&] { (void)fst_view::open(blob, kind); });
    };

    // too small
    assert(rejected({}));
    assert(rejected(std::vector<uint8_t>(good.begin(), good.begin() + 20)));

    // magic
    auto bad = good;
    bad[0] ^= 0xFF;
    assert(rejected(bad));

    // version
    bad = good;
    bad[4] = 2;
    assert(rejected(bad));

    // unknown kind, and kind mismatch
    bad = good;
    bad[8] = 9;
    assert(rejected(bad));
    assert(rejected(good, fst_kind::set));

    // root address outside the node region
    bad = good;
    bad[bad.size() - 16] = 0xFF;
    bad[bad.size() - 15] = 0xFF;
    assert(rejected(bad));

    // root addresses whose node header or body would run past the end,
    // including ones where addr + size wraps around
    for (uint64_t root : {~uint64_t(0), ~uint64_t(0) - 1, ~uint64_t(0) - 3,
                          uint64_t(good.size() - FST_FOOTER_SIZE - 1),
                          uint64_t(good.size() - FST_FOOTER_SIZE)}) {
        bad = good;
        write_uint(bad.data() + bad.size() - 16, root, 8);
        assert(rejected(bad));
    }

    // a flipped byte that open() does not look at is caught by verify()
    bad = good;
    bad[12] ^= 0x01;
    fst_view v = fst_view::open(bad);
    assert(throws_code(errc::corrupt_buffer, [&] { v.verify(); }));

    std::printf(" OK\n");
}

int main() {
    test_bitmap256();
    test_output_ops();
    test_empty_fst();
    test_set_lookup();
    test_map_outputs();
    test_compacted_walk();
    test_dense_nodes();
    test_minimisation();
    test_builder_order();
    test_streamed_output();
    test_stream_bounds();
    test_corrupt_buffers();

    std::printf("\nAll tests passed.\n");
    return 0;
}
