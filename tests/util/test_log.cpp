// tests/util/test_log.cpp
#define BOOST_TEST_MODULE Log_Tests
#include <boost/test/included/unit_test.hpp>
#include <util/log.hpp>

// ============================================================================
// Test Suite: Level names
// ============================================================================

BOOST_AUTO_TEST_SUITE(Level_Name_Tests)

BOOST_AUTO_TEST_CASE(known_names) {
    BOOST_CHECK(parse_log_level("disabled") == log_level::disabled);
    BOOST_CHECK(parse_log_level("debug") == log_level::debug_only);
    BOOST_CHECK(parse_log_level("info") == log_level::info_only);
    BOOST_CHECK(parse_log_level("full") == log_level::full);
}

BOOST_AUTO_TEST_CASE(unknown_names) {
    BOOST_CHECK(!parse_log_level("").has_value());
    BOOST_CHECK(!parse_log_level("INFO").has_value());
    BOOST_CHECK(!parse_log_level("verbose").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: Core state
// ============================================================================

BOOST_AUTO_TEST_SUITE(Core_State_Tests)

BOOST_AUTO_TEST_CASE(disabled_level_turns_logging_off) {
    set_logging_level(log_level::info_only);
    BOOST_CHECK(logging::core::get()->get_logging_enabled());

    set_logging_level(log_level::disabled);
    BOOST_CHECK(!logging::core::get()->get_logging_enabled());
}

BOOST_AUTO_TEST_CASE(any_other_level_turns_it_back_on) {
    for (auto level : { log_level::debug_only, log_level::info_only, log_level::full }) {
        disable_logging();
        set_logging_level(level);
        BOOST_CHECK(logging::core::get()->get_logging_enabled());
    }
    enable_logging();
}

BOOST_AUTO_TEST_SUITE_END()
