// tests/core/test_encoding.cpp
#define BOOST_TEST_MODULE Encoding_Tests
#include <boost/test/included/unit_test.hpp>

#include <algorithm>
#include <array>
#include <numeric>
#include <string_view>

#include <xmss/encoding.hpp>
#include <xmss/parameter_set.hpp>
#include <xmss/util/mpz.hpp>

using namespace xmss;

namespace {

// All length-v vectors over [0, w-1] summing to d0, lexicographic order
std::vector<vertex_t> enumerate_layer(u32 w, u32 v, u32 d0) {
    std::vector<vertex_t> out;
    vertex_t cur;

    auto rec = [&](auto&& self, u32 pos, u32 sum) -> void {
        if (pos == v) {
            if (sum == d0) out.push_back(cur);
            return;
        }
        const u32 max_x = std::min(w - 1, d0 - sum);
        for (u32 x = 0; x <= max_x; x++) {
            cur.push_back(static_cast<u16>(x));
            self(self, pos + 1, sum + x);
            cur.pop_back();
        }
    };
    rec(rec, 0, 0);
    return out;
}

u32 sum_of(const vertex_t& v) {
    return std::accumulate(v.begin(), v.end(), u32(0));
}

bytes as_bytes(std::string_view s) {
    return bytes(s.begin(), s.end());
}

}  // namespace

// ============================================================================
// Test Suite: integer_to_vertex
// ============================================================================

BOOST_AUTO_TEST_SUITE(Integer_To_Vertex_Tests)

BOOST_AUTO_TEST_CASE(matches_brute_force_enumeration) {
    const std::array<std::array<u32, 3>, 6> cases = {{
        { 3, 3, 3 },
        { 2, 1, 1 },
        { 4, 4, 4 },
        { 5, 3, 0 },
        { 5, 3, 12 },
        { 8, 4, 13 },
    }};

    for (const auto& [w, v, d0] : cases) {
        BOOST_TEST_CONTEXT("w=" << w << ", v=" << v << ", d0=" << d0) {
            const auto all = enumerate_layer(w, v, d0);
            BOOST_REQUIRE(!all.empty());

            // Two full periods: every index hits the expected vector
            for (u64 i = 0; i < 2 * all.size(); i++) {
                const auto got = integer_to_vertex(i, w, v, d0);
                BOOST_REQUIRE(got.ok());
                BOOST_CHECK(got.value() == all[i % all.size()]);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(small_layer_in_order) {
    const std::vector<vertex_t> expected = {
        { 0, 1, 2 }, { 0, 2, 1 }, { 1, 0, 2 }, { 1, 1, 1 },
        { 1, 2, 0 }, { 2, 0, 1 }, { 2, 1, 0 },
    };
    for (u64 i = 0; i < expected.size(); i++) {
        const auto got = integer_to_vertex(i, 3, 3, 3);
        BOOST_REQUIRE(got.ok());
        BOOST_CHECK_EQUAL_COLLECTIONS(got.value().begin(), got.value().end(),
                                      expected[i].begin(), expected[i].end());
    }
}

BOOST_AUTO_TEST_CASE(result_shape_invariants) {
    const u32 w = 16, v = 12, d0 = 70;
    for (u64 index : { u64(0), u64(1), u64(977), u64(1) << 40, ~u64(0) }) {
        const auto got = integer_to_vertex(index, w, v, d0);
        BOOST_REQUIRE(got.ok());
        BOOST_CHECK_EQUAL(got.value().size(), v);
        BOOST_CHECK_EQUAL(sum_of(got.value()), d0);
        for (u16 x : got.value()) {
            BOOST_CHECK_LT(x, w);
        }
    }
}

BOOST_AUTO_TEST_CASE(index_wraps_modulo_layer_size) {
    // Layer (4, 4, 4) holds 31 vertices
    const auto size = layer_size(4, 4, 4);
    BOOST_REQUIRE(size.has_value());
    BOOST_CHECK(*size == 31);

    for (u64 index : { u64(31), u64(62), u64(1000), ~u64(0) }) {
        const auto wrapped = integer_to_vertex(index, 4, 4, 4);
        const auto reduced = integer_to_vertex(index % 31, 4, 4, 4);
        BOOST_REQUIRE(wrapped.ok() && reduced.ok());
        BOOST_CHECK(wrapped.value() == reduced.value());
    }

    const vertex_t expected = { 1, 0, 3, 0 };
    BOOST_CHECK(integer_to_vertex(~u64(0), 4, 4, 4).value() == expected);
}

BOOST_AUTO_TEST_CASE(extreme_sums_have_single_vertex) {
    const auto zero = integer_to_vertex(12345, 6, 5, 0);
    BOOST_REQUIRE(zero.ok());
    BOOST_CHECK(zero.value() == vertex_t(5, 0));

    const auto full = integer_to_vertex(12345, 6, 5, 25);
    BOOST_REQUIRE(full.ok());
    BOOST_CHECK(full.value() == vertex_t(5, 5));
}

BOOST_AUTO_TEST_CASE(rejects_invalid_params) {
    BOOST_CHECK(integer_to_vertex(0, 4, 0, 0).error() == mapping_error::invalid_params);
    BOOST_CHECK(integer_to_vertex(0, 1, 4, 0).error() == mapping_error::invalid_params);
    BOOST_CHECK(integer_to_vertex(0, 0, 4, 0).error() == mapping_error::invalid_params);
    BOOST_CHECK(integer_to_vertex(0, 4, 4, 13).error() == mapping_error::invalid_params);
    BOOST_CHECK(!layer_size(4, 4, 13).has_value());
}

BOOST_AUTO_TEST_CASE(wide_layer_is_total) {
    // 1101 x 1001 counting table
    for (u64 index : { u64(0), u64(12345), ~u64(0) }) {
        const auto got = integer_to_vertex(index, 2, 1100, 1000);
        BOOST_REQUIRE(got.ok());
        BOOST_CHECK_EQUAL(got.value().size(), 1100u);
        BOOST_CHECK_EQUAL(sum_of(got.value()), 1000u);
    }
}

BOOST_AUTO_TEST_CASE(saturated_layer_unranks) {
    // C(200, 100) > 2^128, so the counts saturate
    BOOST_REQUIRE(layer_size(2, 200, 100).has_value());
    BOOST_CHECK(*layer_size(2, 200, 100) == ~u128(0));

    for (u64 index : { u64(0), u64(12345), ~u64(0) }) {
        const auto got = integer_to_vertex(index, 2, 200, 100);
        BOOST_REQUIRE(got.ok());
        BOOST_CHECK_EQUAL(got.value().size(), 200u);
        BOOST_CHECK_EQUAL(sum_of(got.value()), 100u);
        for (u16 x : got.value()) {
            BOOST_CHECK_LE(x, 1);
        }
    }

    // Distinct indices below every count stay distinct
    BOOST_CHECK(integer_to_vertex(0, 2, 200, 100).value() !=
                integer_to_vertex(1, 2, 200, 100).value());
}

BOOST_AUTO_TEST_CASE(rejects_unallocatable_table) {
    // 2^16 x (2^30 + 1) entries of 16 bytes exceed the address space
    const auto got = integer_to_vertex(0, 65535, 65535, 1u << 30);
    BOOST_REQUIRE(!got.ok());
    BOOST_CHECK(got.error() == mapping_error::table_too_large);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: layer_size
// ============================================================================

BOOST_AUTO_TEST_SUITE(Layer_Size_Tests)

BOOST_AUTO_TEST_CASE(agrees_with_exact_count) {
    const std::array<std::array<u32, 3>, 5> cases = {{
        { 3, 3, 3 },
        { 4, 36, 3 },
        { 8, 18, 2 },
        { 16, 64, 480 },
        { 256, 40, 5000 },
    }};

    for (const auto& [w, v, d0] : cases) {
        BOOST_TEST_CONTEXT("w=" << w << ", v=" << v << ", d0=" << d0) {
            const mpz_class exact = layer_size_exact(w, v, d0);
            const auto size = layer_size(w, v, d0);
            BOOST_REQUIRE(size.has_value());

            // Layers below 2^128 are counted exactly, larger ones saturate
            if (mpz_sizeinbase(exact.get_mpz_t(), 2) <= 128) {
                BOOST_CHECK(mpz_from_u128(*size) == exact);
            }
            else {
                BOOST_CHECK(*size == ~u128(0));
            }
        }
    }

    BOOST_CHECK(*layer_size(4, 36, 3) == 8436);
    BOOST_CHECK(*layer_size(8, 18, 2) == 171);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: encode_vertex
// ============================================================================

BOOST_AUTO_TEST_SUITE(Encode_Vertex_Tests)

BOOST_AUTO_TEST_CASE(deterministic) {
    const params p{ .w = 4, .v = 4, .d0 = 4, .security_bits = 128, .tree_height = 0 };
    const bytes msg = as_bytes("hello");
    const bytes rnd(32, 7);

    const auto a = encode_vertex(msg, rnd, p);
    const auto b = encode_vertex(msg, rnd, p);
    BOOST_REQUIRE(a.ok() && b.ok());
    BOOST_CHECK(a.value() == b.value());
    BOOST_CHECK_EQUAL(a.value().size(), p.v);
    BOOST_CHECK_EQUAL(sum_of(a.value()), p.d0);
}

BOOST_AUTO_TEST_CASE(known_answer_epoch_domain) {
    // SHA256(le64(0) || "hello" || 0^32), first 8 bytes LE = 5139095341883333289
    const params p{ .w = 4, .v = 4, .d0 = 4, .security_bits = 128, .tree_height = 0 };

    bytes domain(8, 0);
    const bytes msg = as_bytes("hello");
    domain.insert(domain.end(), msg.begin(), msg.end());
    const bytes zero(32, 0);

    const auto got = encode_vertex(domain, zero, p);
    BOOST_REQUIRE(got.ok());

    const vertex_t expected = { 0, 2, 1, 1 };
    BOOST_CHECK(got.value() == expected);
    BOOST_CHECK(integer_to_vertex(5139095341883333289ULL, 4, 4, 4).value() == expected);
}

BOOST_AUTO_TEST_CASE(known_answer_message_randomness) {
    const params p{ .w = 4, .v = 4, .d0 = 4, .security_bits = 128, .tree_height = 0 };
    const auto got = encode_vertex(as_bytes("hello"), bytes(32, 7), p);
    BOOST_REQUIRE(got.ok());

    const vertex_t expected = { 2, 0, 2, 0 };
    BOOST_CHECK(got.value() == expected);
}

BOOST_AUTO_TEST_CASE(randomness_changes_index) {
    const params p{ .w = 16, .v = 16, .d0 = 120, .security_bits = 128, .tree_height = 0 };
    const auto a = encode_vertex(as_bytes("message"), bytes(32, 0), p);
    const auto b = encode_vertex(as_bytes("message"), bytes(32, 1), p);
    BOOST_REQUIRE(a.ok() && b.ok());
    BOOST_CHECK(a.value() != b.value());
}

BOOST_AUTO_TEST_CASE(propagates_invalid_params) {
    const params p{ .w = 1, .v = 4, .d0 = 0, .security_bits = 128, .tree_height = 0 };
    const auto got = encode_vertex(as_bytes("message"), bytes(32, 0), p);
    BOOST_REQUIRE(!got.ok());
    BOOST_CHECK(got.error() == mapping_error::invalid_params);
}

BOOST_AUTO_TEST_SUITE_END()
