// tests/core/test_parameter_set.cpp
#define BOOST_TEST_MODULE Parameter_Set_Tests
#include <boost/test/included/unit_test.hpp>

#include <xmss/encoding.hpp>
#include <xmss/parameter_set.hpp>
#include <xmss/util/mpz.hpp>

using namespace xmss;

BOOST_AUTO_TEST_SUITE(Metadata_Tests)

BOOST_AUTO_TEST_CASE(instantiation_names) {
    BOOST_CHECK_EQUAL(instantiation_type(parameter_set::sha256_h18_w4), "SIGWinternitzLifetime18W4");
    BOOST_CHECK_EQUAL(instantiation_type(parameter_set::sha256_h18_w8), "SIGWinternitzLifetime18W8");
    BOOST_CHECK_EQUAL(instantiation_type(parameter_set::sha256_h20_w4), "SIGWinternitzLifetime20W4");
}

BOOST_AUTO_TEST_CASE(size_estimates) {
    const auto h18w4 = metadata(parameter_set::sha256_h18_w4);
    BOOST_CHECK_EQUAL(h18w4.lifetime, 1u << 18);
    BOOST_CHECK_EQUAL(h18w4.tree_height, 18);
    BOOST_CHECK_EQUAL(h18w4.winternitz_parameter, 4);
    BOOST_CHECK_EQUAL(h18w4.hash_function, "SHA-256");
    BOOST_CHECK_EQUAL(h18w4.signature_size_bytes, 1428u);
    BOOST_CHECK_EQUAL(h18w4.public_key_size_bytes, 44u);

    const auto h18w8 = metadata(parameter_set::sha256_h18_w8);
    BOOST_CHECK_EQUAL(h18w8.signature_size_bytes, 1032u);
    BOOST_CHECK_EQUAL(h18w8.public_key_size_bytes, 46u);

    const auto h20w4 = metadata(parameter_set::sha256_h20_w4);
    BOOST_CHECK_EQUAL(h20w4.lifetime, 1u << 20);
    BOOST_CHECK_EQUAL(h20w4.signature_size_bytes, 1480u);
}

BOOST_AUTO_TEST_CASE(checksum_targets) {
    BOOST_CHECK_EQUAL(checksum_target(1), 8u);
    BOOST_CHECK_EQUAL(checksum_target(2), 4u);
    BOOST_CHECK_EQUAL(checksum_target(4), 3u);
    BOOST_CHECK_EQUAL(checksum_target(8), 2u);
    BOOST_CHECK_EQUAL(checksum_target(16), 3u);
}

BOOST_AUTO_TEST_CASE(encoding_params) {
    const params p = to_params(parameter_set::sha256_h18_w4);
    BOOST_CHECK_EQUAL(p.w, 4);
    BOOST_CHECK_EQUAL(p.v, 36);
    BOOST_CHECK_EQUAL(p.d0, 3u);
    BOOST_CHECK_EQUAL(p.tree_height, 18);
    BOOST_CHECK(p.valid());

    const params q = to_params(parameter_set::sha256_h18_w8);
    BOOST_CHECK_EQUAL(q.v, 18);
    BOOST_CHECK_EQUAL(q.d0, 2u);
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_SUITE(Exact_Layer_Tests)

BOOST_AUTO_TEST_CASE(named_sets) {
    BOOST_CHECK(layer_size_exact(4, 36, 3) == 8436);
    BOOST_CHECK(layer_size_exact(8, 18, 2) == 171);

    for (parameter_set set : all_parameter_sets) {
        const params p = to_params(set);
        const mpz_class exact = layer_size_exact(p.w, p.v, p.d0);
        BOOST_CHECK(mpz_from_u128(*layer_size(p.w, p.v, p.d0)) == exact);
    }
}

BOOST_AUTO_TEST_CASE(beyond_128_bits) {
    // Middle layer of [0,1]^200 is C(200, 100), about 2^196
    const mpz_class exact = layer_size_exact(2, 200, 100);
    BOOST_CHECK_GT(mpz_sizeinbase(exact.get_mpz_t(), 2), 128u);

    mpz_class binom;
    mpz_bin_uiui(binom.get_mpz_t(), 200, 100);
    BOOST_CHECK(exact == binom);
}

BOOST_AUTO_TEST_CASE(invalid_layers_are_empty) {
    BOOST_CHECK(layer_size_exact(1, 4, 0) == 0);
    BOOST_CHECK(layer_size_exact(4, 0, 0) == 0);
    BOOST_CHECK(layer_size_exact(4, 4, 13) == 0);
}

BOOST_AUTO_TEST_SUITE_END()
