// tests/core/test_merkle.cpp
#define BOOST_TEST_MODULE Merkle_Tests
#include <boost/test/included/unit_test.hpp>

#include <algorithm>
#include <string_view>

#include <boost/algorithm/hex.hpp>

#include <xmss/chain.hpp>
#include <xmss/fixture.hpp>
#include <xmss/hash.hpp>
#include <xmss/merkle.hpp>

using namespace xmss;
namespace utf = boost::unit_test;

namespace {

node_t filled(u8 byte) {
    node_t n;
    n.fill(byte);
    return n;
}

node_t node_from_hex(std::string_view hex) {
    digest_t d{};
    boost::algorithm::unhex(hex.begin(), hex.end(), d.begin());
    return truncate_node(d);
}

node_t leaf_of(std::string_view s) {
    return hash_node(bytes(s.begin(), s.end()));
}

}  // namespace

// ============================================================================
// Test Suite: hash chains
// ============================================================================

BOOST_AUTO_TEST_SUITE(Chain_Tests)

BOOST_AUTO_TEST_CASE(zero_steps_is_identity) {
    const node_t start = filled(0x5a);
    BOOST_CHECK(advance_chain(start, 0) == start);
}

BOOST_AUTO_TEST_CASE(steps_compose) {
    const node_t start = leaf_of("chain");
    BOOST_CHECK(advance_chain(advance_chain(start, 3), 4) == advance_chain(start, 7));
    BOOST_CHECK(advance_chain(start, 1) == hash_node(start));
}

BOOST_AUTO_TEST_CASE(leaf_completes_every_chain) {
    const u32 w = 8;
    const std::vector<node_t> starts = { leaf_of("a"), leaf_of("b"), leaf_of("c") };
    const std::vector<u16> steps = { 0, 3, 7 };

    std::vector<node_t> ends;
    for (size_t i = 0; i < starts.size(); i++) {
        ends.push_back(advance_chain(starts[i], steps[i]));
    }

    sha256 h;
    for (const auto& s : starts) {
        h.update(advance_chain(s, w - 1));
    }
    BOOST_CHECK(chain_leaf(w, steps, ends) == truncate_node(h.finalize()));
}

BOOST_AUTO_TEST_CASE(top_of_chain_is_not_hashed_again) {
    // steps == w - 1: the signature already carries the chain top
    const std::vector<node_t> ends = { filled(3) };
    const std::vector<u16> steps = { 3 };
    BOOST_CHECK(chain_leaf(4, steps, ends) == hash_node(filled(3)));

    // Out-of-range steps saturate at the top
    const std::vector<u16> over = { 9 };
    BOOST_CHECK(chain_leaf(4, over, ends) == hash_node(filled(3)));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: authentication paths
// ============================================================================

BOOST_AUTO_TEST_SUITE(Merkle_Path_Tests)

BOOST_AUTO_TEST_CASE(empty_path_returns_leaf) {
    const node_t leaf = leaf_of("leaf");
    BOOST_CHECK(merkle_root_from_path(leaf, 0, {}, filled(9)) == leaf);
    BOOST_CHECK(merkle_root_from_path(leaf, 12345, {}, filled(9)) == leaf);
}

BOOST_AUTO_TEST_CASE(node_preimage_layout) {
    const parameter_t param = filled(9);
    const node_t left = filled(1), right = filled(2);

    bytes preimage = { merkle_node_tag };
    preimage.insert(preimage.end(), param.begin(), param.end());
    const u8 height_be[4] = { 0, 0, 0, 3 };
    const u8 index_be[4]  = { 0, 0, 1, 2 };
    preimage.insert(preimage.end(), height_be, height_be + 4);
    preimage.insert(preimage.end(), index_be, index_be + 4);
    preimage.insert(preimage.end(), left.begin(), left.end());
    preimage.insert(preimage.end(), right.begin(), right.end());

    BOOST_CHECK(merkle_node(param, 3, 0x0102, left, right) == hash_node(preimage));
}

BOOST_AUTO_TEST_CASE(known_roots, * utf::enable_if<node_width == digest_size>()) {
    const node_t leaf = leaf_of("leaf");
    const std::vector<node_t> path = { filled(1), filled(2) };
    const parameter_t param = filled(9);

    BOOST_CHECK(merkle_root_from_path(leaf, 0, path, param) ==
        node_from_hex("d857b0fbc07f80baffb841a351b936e7d5deaa885d3d31ed999af5a3d7aac0b0"));
    BOOST_CHECK(merkle_root_from_path(leaf, 1, path, param) ==
        node_from_hex("3ec82def884b7fabea6f443f58d1b763cc500753684ec7c06aafcd34e0fdab77"));
    BOOST_CHECK(merkle_root_from_path(leaf, 3, path, param) ==
        node_from_hex("0c6817b4bdb612599349da39eaac23086dbd4eb68d1c89fdf8ab1dfdab064916"));
}

BOOST_AUTO_TEST_CASE(position_is_bound) {
    // Same sibling set, different positions: parent indices differ too
    const node_t leaf = leaf_of("leaf");
    const std::vector<node_t> path = { filled(1), filled(2) };
    const parameter_t param = filled(9);

    const node_t r0 = merkle_root_from_path(leaf, 0, path, param);
    const node_t r1 = merkle_root_from_path(leaf, 1, path, param);
    const node_t r2 = merkle_root_from_path(leaf, 2, path, param);
    BOOST_CHECK(r0 != r1);
    BOOST_CHECK(r0 != r2);
    BOOST_CHECK(r1 != r2);
}

BOOST_AUTO_TEST_CASE(parameter_is_bound) {
    const node_t leaf = leaf_of("leaf");
    const std::vector<node_t> path = { filled(1) };
    BOOST_CHECK(merkle_root_from_path(leaf, 0, path, filled(9)) !=
                merkle_root_from_path(leaf, 0, path, filled(8)));
}

BOOST_AUTO_TEST_CASE(index_bits_above_path_are_bound) {
    const node_t leaf = leaf_of("leaf");
    const std::vector<node_t> path = { filled(1), filled(2) };
    const parameter_t param = filled(9);

    // Only the low bits select sides; the parent index carries the rest
    const node_t low  = merkle_root_from_path(leaf, 1, path, param);
    const node_t high = merkle_root_from_path(leaf, 1 | (u64(1) << 20), path, param);
    BOOST_CHECK(low != high);
    BOOST_CHECK_NO_THROW(merkle_root_from_path(leaf, ~u64(0), path, param));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: fixture tree
// ============================================================================

BOOST_AUTO_TEST_SUITE(Fixture_Tree_Tests)

BOOST_AUTO_TEST_CASE(every_leaf_opens_to_root) {
    const parameter_t param = filled(4);
    std::vector<node_t> leaves;
    for (u8 i = 0; i < 8; i++) {
        leaves.push_back(filled(i));
    }

    const fixture::merkle_tree tree(param, leaves);
    BOOST_CHECK_EQUAL(tree.height(), 3u);

    for (u64 i = 0; i < leaves.size(); i++) {
        const auto path = tree.auth_path(i);
        BOOST_CHECK_EQUAL(path.size(), 3u);
        BOOST_CHECK(merkle_root_from_path(leaves[i], i, path, param) == tree.root());
    }
}

BOOST_AUTO_TEST_CASE(single_leaf_tree) {
    const fixture::merkle_tree tree(filled(4), { filled(7) });
    BOOST_CHECK_EQUAL(tree.height(), 0u);
    BOOST_CHECK(tree.root() == filled(7));
    BOOST_CHECK(tree.auth_path(0).empty());
}

BOOST_AUTO_TEST_CASE(rejects_bad_shapes) {
    BOOST_CHECK_THROW((void)fixture::merkle_tree(filled(4), {}), std::invalid_argument);
    BOOST_CHECK_THROW((void)fixture::merkle_tree(filled(4), std::vector<node_t>(3)), std::invalid_argument);

    const fixture::merkle_tree tree(filled(4), std::vector<node_t>(4));
    BOOST_CHECK_THROW(tree.auth_path(4), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()
