// tests/zkp/test_stark_curve.cpp
#define BOOST_TEST_MODULE Stark_Curve_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmpxx.h>
#include <types.hpp>
#include <zkp/ecdsa.hpp>
#include <zkp/stark_curve.hpp>
#include <array>
#include <cstdint>

using namespace cairo;
using namespace cairo::vm::zkp;

using field_t = stark252_gmp;
using curve   = stark_curve;
using point   = stark_point;

namespace {

field_t felt(const char *hex) {
    return field_t::from_string(hex);
}

// Signature over `msg_hash` by the key d = 1 (Q = G)
const char *msg_hash = "0x397e76d1667c4454bfb83514e120583af836f8e32a516765497823eabe16a3f";
const char *sig_r    = "0x64b77f345d5192d8c572e3a62c9c9c2031947c2b6374dddb41d072536933c39";
const char *sig_s_g  = "0x3725789f0d38e2c6983e583a6e3161987b82e38c5722ad0d142084e4fe77047";

// Same message and nonce signed by d = N - 1 (Q = -G)
const char *sig_s_neg_g = "0x68dfd91ea16491c50941c1ade8af22e1a4992958337347049c2342e446b65ad";

ecdsa_signature make_signature(const char *r, const char *s) {
    return ecdsa_signature{ mpz_class(r + 2, 16), mpz_class(s + 2, 16) };
}

}  // namespace

// ============================================================================
// Test Suite: Group law
// ============================================================================

BOOST_AUTO_TEST_SUITE(Group_Law_Tests)

BOOST_AUTO_TEST_CASE(generator_is_on_curve) {
    BOOST_CHECK(curve::on_curve(curve::generator()));
}

BOOST_AUTO_TEST_CASE(generator_y_is_canonical_root) {
    const point& g = curve::generator();
    mpz_class root;
    BOOST_REQUIRE(field_t::sqrt(root, curve::eval_rhs(g.x()).data()));
    BOOST_CHECK_EQUAL(root, g.y().data());
}

BOOST_AUTO_TEST_CASE(infinity_is_identity) {
    const point& g = curve::generator();
    BOOST_CHECK(curve::point_add(point::infinity(), g) == g);
    BOOST_CHECK(curve::point_add(g, point::infinity()) == g);
    BOOST_CHECK(curve::point_add(g, curve::negate(g)).is_infinity());
}

BOOST_AUTO_TEST_CASE(doubling_matches_addition) {
    const point& g = curve::generator();
    point g2 = curve::point_double(g);
    BOOST_CHECK(curve::point_add(g, g) == g2);
    BOOST_CHECK(curve::on_curve(g2));

    point g3 = curve::point_add(g2, g);
    BOOST_CHECK(curve::scalar_mul(mpz_class(3), g) == g3);
    BOOST_CHECK(curve::on_curve(g3));
}

BOOST_AUTO_TEST_CASE(order_annihilates_generator) {
    const point& g = curve::generator();
    mpz_class n = stark_curve_def::order();
    BOOST_CHECK(curve::scalar_mul(n, g).is_infinity());
    BOOST_CHECK(curve::scalar_mul(mpz_class(n - 1), g) == curve::negate(g));
    BOOST_CHECK(curve::scalar_mul(mpz_class(n + 1), g) == g);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: ECDSA verification
// ============================================================================

BOOST_AUTO_TEST_SUITE(ECDSA_Verify_Tests)

BOOST_AUTO_TEST_CASE(valid_signature_by_generator_key) {
    auto msg = felt(msg_hash).to_bytes_be();
    auto sig = make_signature(sig_r, sig_s_g);
    BOOST_CHECK(ecdsa_verify<stark_curve_def>(curve::generator(), msg, sig));
}

BOOST_AUTO_TEST_CASE(signature_is_bound_to_the_key_sign) {
    auto msg = felt(msg_hash).to_bytes_be();
    const point g = curve::generator();
    const point neg_g = curve::negate(g);

    auto sig_g = make_signature(sig_r, sig_s_g);
    auto sig_neg_g = make_signature(sig_r, sig_s_neg_g);

    BOOST_CHECK(!ecdsa_verify<stark_curve_def>(neg_g, msg, sig_g));
    BOOST_CHECK(ecdsa_verify<stark_curve_def>(neg_g, msg, sig_neg_g));
    BOOST_CHECK(!ecdsa_verify<stark_curve_def>(g, msg, sig_neg_g));
}

BOOST_AUTO_TEST_CASE(wrong_message_is_rejected) {
    field_t other = felt(msg_hash) + field_t(1);
    auto msg = other.to_bytes_be();
    auto sig = make_signature(sig_r, sig_s_g);
    BOOST_CHECK(!ecdsa_verify<stark_curve_def>(curve::generator(), msg, sig));
}

BOOST_AUTO_TEST_CASE(out_of_range_scalars_are_rejected) {
    auto msg = felt(msg_hash).to_bytes_be();
    const mpz_class& n = stark_curve_def::order();
    ecdsa_signature zero_r{ mpz_class(0), mpz_class(sig_s_g + 2, 16) };
    ecdsa_signature big_s{ mpz_class(sig_r + 2, 16), n };
    BOOST_CHECK(!ecdsa_verify<stark_curve_def>(curve::generator(), msg, zero_r));
    BOOST_CHECK(!ecdsa_verify<stark_curve_def>(curve::generator(), msg, big_s));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: Signature encoding
// ============================================================================

BOOST_AUTO_TEST_SUITE(Signature_Encoding_Tests)

BOOST_AUTO_TEST_CASE(bytes_are_r_then_s) {
    auto sig = make_signature(sig_r, sig_s_g);
    auto bytes = sig.to_bytes();
    BOOST_CHECK_EQUAL(bytes.size(), 64u);

    auto decoded = ecdsa_signature::from_bytes(bytes, stark_curve_def::order());
    BOOST_CHECK_EQUAL(decoded.r, sig.r);
    BOOST_CHECK_EQUAL(decoded.s, sig.s);
}

BOOST_AUTO_TEST_CASE(wrong_length_is_rejected) {
    std::array<uint8_t, 63> bytes{};
    bytes[0] = 1;
    BOOST_CHECK_EXCEPTION(ecdsa_signature::from_bytes(bytes, stark_curve_def::order()),
                          vm_error,
                          [](const vm_error& e) { return e.kind() == error_kind::encoding; });
}

BOOST_AUTO_TEST_CASE(non_canonical_scalars_are_rejected) {
    const mpz_class& n = stark_curve_def::order();
    auto is_encoding = [](const vm_error& e) { return e.kind() == error_kind::encoding; };

    ecdsa_signature r_is_n{ n, mpz_class(1) };
    BOOST_CHECK_EXCEPTION(ecdsa_signature::from_bytes(r_is_n.to_bytes(), n), vm_error, is_encoding);

    ecdsa_signature s_is_zero{ mpz_class(1), mpz_class(0) };
    BOOST_CHECK_EXCEPTION(ecdsa_signature::from_bytes(s_is_zero.to_bytes(), n), vm_error, is_encoding);

    ecdsa_signature largest{ mpz_class(n - 1), mpz_class(n - 1) };
    BOOST_CHECK_NO_THROW(ecdsa_signature::from_bytes(largest.to_bytes(), n));
}

BOOST_AUTO_TEST_CASE(scalar_inverse) {
    const mpz_class& n = stark_curve_def::order();
    mpz_class w = scalar_invert(mpz_class(sig_s_g + 2, 16), n);
    BOOST_CHECK_EQUAL(w, mpz_class("6c0e852eabd389aac023018daec203167e8e21b6fa819a65c3271c7846e585f", 16));

    BOOST_CHECK_EXCEPTION(scalar_invert(mpz_class(0), n), vm_error,
                          [](const vm_error& e) { return e.kind() == error_kind::encoding; });
}

BOOST_AUTO_TEST_CASE(hash_keeps_leading_bits) {
    std::array<uint8_t, 32> hash;
    hash.fill(0xff);
    mpz_class e = hash_to_int(hash, 252);
    // 256 bits of ones truncated to the leading 252
    mpz_class expected = (mpz_class(1) << 252) - 1;
    BOOST_CHECK_EQUAL(e, expected);

    auto msg = field_t(2718).to_bytes_be();
    BOOST_CHECK_EQUAL(hash_to_int(msg, 252), mpz_class(2718));
}

BOOST_AUTO_TEST_SUITE_END()
