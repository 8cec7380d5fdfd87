// tests/builtins/test_air_private_input.cpp
#define BOOST_TEST_MODULE Air_Private_Input_Tests
#include <boost/test/included/unit_test.hpp>
#include <builtins/air_private_input.hpp>
#include <builtins/ecdsa.hpp>
#include <memory/segment.hpp>
#include <nlohmann/json.hpp>
#include <types.hpp>
#include <util/log.hpp>
#include <gmpxx.h>

using namespace cairo;
using namespace cairo::vm;

using json = nlohmann::json;
using field_t = zkp::stark252_gmp;

namespace {

field_t felt(const char *str) {
    return field_t::from_string(str);
}

const char *cairo_pubkey_hex = "0x3d60886c2353d93ec2862e91e23036cd9999a534481166e5a616a983070434d";
const char *cairo_r_hex      = "0x6d2e2e00dfceffd6a375db04764da249a5a1534c7584738dfe01cb3944a33ee";
const char *cairo_s          = "598673427589502599949712887611119751108407514580626464031881322743364689811";
const char *cairo_w_hex      = "0x396362a34ff391372fca63f691e27753ce8f0c2271a614cbd240e1dc1596b28";

const char *gen_x_hex   = "0x1ef15c18599971b7beced415a40f0c7deacfd9b0d1819e03d723d8bc943cfca";
const char *gen_msg_hex = "0x397e76d1667c4454bfb83514e120583af836f8e32a516765497823eabe16a3f";
const char *gen_r_hex   = "0x64b77f345d5192d8c572e3a62c9c9c2031947c2b6374dddb41d072536933c39";
const char *gen_s_hex   = "0x3725789f0d38e2c6983e583a6e3161987b82e38c5722ad0d142084e4fe77047";
const char *gen_w_hex   = "0x6c0e852eabd389aac023018daec203167e8e21b6fa819a65c3271c7846e585f";

struct export_fixture {
    export_fixture() {
        disable_logging();
        segment.with_builtin_runner(&builtin);
    }

    void run_cairo_instance(address_t base) {
        builtin.add_signature(base, felt(cairo_r_hex), felt(cairo_s));
        segment.write(base, felt(cairo_pubkey_hex));
        segment.write(base + 1, field_t(2718));
    }

    void run_generator_instance(address_t base) {
        builtin.add_signature(base, felt(gen_r_hex), felt(gen_s_hex));
        segment.write(base, felt(gen_x_hex));
        segment.write(base + 1, felt(gen_msg_hex));
    }

    ecdsa_builtin builtin;
    memory_segment segment;
};

}  // namespace

// ============================================================================
// Test Suite: Builtin export
// ============================================================================

BOOST_AUTO_TEST_SUITE(Builtin_Export_Tests)

BOOST_FIXTURE_TEST_CASE(nothing_registered, export_fixture) {
    BOOST_CHECK(builtin.air_private_input(segment).empty());
}

BOOST_FIXTURE_TEST_CASE(single_instance_record, export_fixture) {
    run_cairo_instance(0);

    auto records = builtin.air_private_input(segment);
    BOOST_REQUIRE_EQUAL(records.size(), 1u);

    const auto& rec = records[0];
    BOOST_CHECK_EQUAL(rec.index, 0u);
    BOOST_CHECK_EQUAL(rec.pubkey, cairo_pubkey_hex);
    BOOST_CHECK_EQUAL(rec.msg, "0xa9e");
    BOOST_CHECK_EQUAL(rec.signature_input.r, cairo_r_hex);
    BOOST_CHECK_EQUAL(rec.signature_input.w, cairo_w_hex);
}

BOOST_FIXTURE_TEST_CASE(w_inverts_s, export_fixture) {
    run_generator_instance(0);

    auto records = builtin.air_private_input(segment);
    BOOST_REQUIRE_EQUAL(records.size(), 1u);

    mpz_class s(gen_s_hex + 2, 16);
    mpz_class w(records[0].signature_input.w.substr(2), 16);
    mpz_class prod = s * w;
    mpz_class n = zkp::stark_curve_def::order();
    mpz_fdiv_r(prod.get_mpz_t(), prod.get_mpz_t(), n.get_mpz_t());
    BOOST_CHECK_EQUAL(prod, mpz_class(1));
    BOOST_CHECK_EQUAL(records[0].signature_input.w, gen_w_hex);
}

BOOST_FIXTURE_TEST_CASE(records_follow_instance_order, export_fixture) {
    // Register the later instance first
    run_generator_instance(4);
    run_cairo_instance(0);

    auto records = builtin.air_private_input(segment);
    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].index, 0u);
    BOOST_CHECK_EQUAL(records[0].msg, "0xa9e");
    BOOST_CHECK_EQUAL(records[1].index, 2u);
    BOOST_CHECK_EQUAL(records[1].pubkey, gen_x_hex);
    BOOST_CHECK_EQUAL(records[1].msg, gen_msg_hex);
}

BOOST_FIXTURE_TEST_CASE(unwritten_instance_fails_export, export_fixture) {
    builtin.add_signature(0, felt(gen_r_hex), felt(gen_s_hex));
    segment.write(0, felt(gen_x_hex));
    BOOST_CHECK_EXCEPTION(builtin.air_private_input(segment), vm_error,
        [](const vm_error& e) { return e.kind() == error_kind::unknown_cell; });
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: JSON layout
// ============================================================================

BOOST_AUTO_TEST_SUITE(JSON_Layout_Tests)

BOOST_AUTO_TEST_CASE(record_keys) {
    air_private_ecdsa rec{ 3, "0x1", "0x2", { "0x3", "0x4" } };
    json j = rec;

    BOOST_CHECK_EQUAL(j["index"].get<u64>(), 3u);
    BOOST_CHECK_EQUAL(j["pubkey"].get<std::string>(), "0x1");
    BOOST_CHECK_EQUAL(j["msg"].get<std::string>(), "0x2");
    BOOST_CHECK_EQUAL(j["signature_input"]["r"].get<std::string>(), "0x3");
    BOOST_CHECK_EQUAL(j["signature_input"]["w"].get<std::string>(), "0x4");
    BOOST_CHECK_EQUAL(j.size(), 4u);
}

BOOST_AUTO_TEST_CASE(record_parses_back) {
    json j = json::parse(R"({
        "index": 7,
        "pubkey": "0xabc",
        "msg": "0xa9e",
        "signature_input": { "r": "0x10", "w": "0x20" }
    })");

    auto rec = j.get<air_private_ecdsa>();
    air_private_ecdsa expected{ 7, "0xabc", "0xa9e", { "0x10", "0x20" } };
    BOOST_CHECK(rec == expected);
}

BOOST_AUTO_TEST_CASE(document_is_keyed_by_builtin_and_sorted) {
    std::vector<air_private_ecdsa> records {
        { 2, "0x1", "0x2", { "0x3", "0x4" } },
        { 0, "0x5", "0x6", { "0x7", "0x8" } },
    };

    json doc = make_air_private_input(records);
    BOOST_REQUIRE(doc.contains("ecdsa"));
    BOOST_CHECK_EQUAL(doc.size(), 1u);

    const auto& arr = doc["ecdsa"];
    BOOST_REQUIRE_EQUAL(arr.size(), 2u);
    BOOST_CHECK_EQUAL(arr[0]["index"].get<u64>(), 0u);
    BOOST_CHECK_EQUAL(arr[1]["index"].get<u64>(), 2u);
}

BOOST_AUTO_TEST_CASE(empty_document) {
    json doc = make_air_private_input({});
    BOOST_REQUIRE(doc.contains("ecdsa"));
    BOOST_CHECK(doc["ecdsa"].is_array());
    BOOST_CHECK(doc["ecdsa"].empty());
}

BOOST_AUTO_TEST_SUITE_END()
