/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE IdentityConfigTests
#include <boost/test/unit_test.hpp>

#include "core/IdentityConfig.hpp"
#include <filesystem>
#include <fstream>

using namespace Tether;

struct ConfigFileFixture {
    std::filesystem::path path;

    ConfigFileFixture()
        : path(std::filesystem::temp_directory_path() / "tether_identity_config_test.json") {
        std::filesystem::remove(path);
    }

    ~ConfigFileFixture() {
        std::filesystem::remove(path);
    }

    void write(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

// ===================================================================
// Defaults and enum helpers
// ===================================================================

BOOST_AUTO_TEST_SUITE(IdentityConfigDefaultsTests)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    IdentityConfig config;
    BOOST_CHECK_EQUAL(config.counterStart, 1u);
    BOOST_CHECK_EQUAL(config.libraryIdSpace, 10000000u);
    BOOST_CHECK(config.sweepOnLoad);
    BOOST_CHECK(config.sweepOrder == SweepOrder::ScanOrder);
}

BOOST_AUTO_TEST_CASE(TestSweepOrderStrings) {
    BOOST_CHECK_EQUAL(std::string(sweepOrderToString(SweepOrder::ScanOrder)), "scan_order");
    BOOST_CHECK_EQUAL(std::string(sweepOrderToString(SweepOrder::NameDescending)),
                      "name_descending");
    BOOST_CHECK(sweepOrderFromString("name_descending") == SweepOrder::NameDescending);
    BOOST_CHECK(!sweepOrderFromString("random").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ===================================================================
// Loading
// ===================================================================

BOOST_AUTO_TEST_SUITE(IdentityConfigLoadTests)

BOOST_AUTO_TEST_CASE(TestLoadFromString) {
    IdentityConfig config;
    BOOST_REQUIRE(config.loadFromString(R"({
        "identity": {
            "counter_start": 100,
            "library_id_space": 5000,
            "sweep_on_load": false,
            "sweep_order": "name_descending"
        }
    })"));

    BOOST_CHECK_EQUAL(config.counterStart, 100u);
    BOOST_CHECK_EQUAL(config.libraryIdSpace, 5000u);
    BOOST_CHECK(!config.sweepOnLoad);
    BOOST_CHECK(config.sweepOrder == SweepOrder::NameDescending);
}

BOOST_AUTO_TEST_CASE(TestPartialConfigKeepsDefaults) {
    IdentityConfig config;
    BOOST_REQUIRE(config.loadFromString(R"({"identity": {"counter_start": 7}})"));
    BOOST_CHECK_EQUAL(config.counterStart, 7u);
    BOOST_CHECK_EQUAL(config.libraryIdSpace, IdentityConfig::DEFAULT_LIBRARY_ID_SPACE);
    BOOST_CHECK(config.sweepOnLoad);
}

BOOST_AUTO_TEST_CASE(TestWrongTypesKeepCurrentValues) {
    IdentityConfig config;
    BOOST_REQUIRE(config.loadFromString(R"({
        "identity": {
            "counter_start": "ten",
            "library_id_space": -4,
            "sweep_on_load": 1,
            "sweep_order": "shuffled",
            "unknown_key": true
        }
    })"));

    BOOST_CHECK_EQUAL(config.counterStart, 1u);
    BOOST_CHECK_EQUAL(config.libraryIdSpace, IdentityConfig::DEFAULT_LIBRARY_ID_SPACE);
    BOOST_CHECK(config.sweepOnLoad);
    BOOST_CHECK(config.sweepOrder == SweepOrder::ScanOrder);
}

BOOST_AUTO_TEST_CASE(TestZeroValuesRejected) {
    IdentityConfig config;
    BOOST_REQUIRE(config.loadFromString(
        R"({"identity": {"counter_start": 0, "library_id_space": 0}})"));
    BOOST_CHECK_EQUAL(config.counterStart, 1u);
    BOOST_CHECK_EQUAL(config.libraryIdSpace, IdentityConfig::DEFAULT_LIBRARY_ID_SPACE);
}

BOOST_AUTO_TEST_CASE(TestMissingCategoryFails) {
    IdentityConfig config;
    BOOST_CHECK(!config.loadFromString(R"({"graphics": {"vsync": true}})"));
    BOOST_CHECK(!config.loadFromString(R"({"identity": 3})"));
}

BOOST_AUTO_TEST_CASE(TestMalformedJsonFails) {
    IdentityConfig config;
    config.counterStart = 9;
    BOOST_CHECK(!config.loadFromString(R"({"identity": {"counter_start": 4,}})"));
    BOOST_CHECK_EQUAL(config.counterStart, 9u);
}

BOOST_AUTO_TEST_SUITE_END()

// ===================================================================
// File round trip
// ===================================================================

BOOST_FIXTURE_TEST_SUITE(IdentityConfigFileTests, ConfigFileFixture)

BOOST_AUTO_TEST_CASE(TestMissingFileFails) {
    IdentityConfig config;
    BOOST_CHECK(!config.loadFromFile(path.string()));
    BOOST_CHECK_EQUAL(config.counterStart, 1u);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    write(R"({"identity": {"sweep_on_load": false}})");
    IdentityConfig config;
    BOOST_CHECK(config.loadFromFile(path.string()));
    BOOST_CHECK(!config.sweepOnLoad);
}

BOOST_AUTO_TEST_CASE(TestSaveThenLoad) {
    IdentityConfig saved;
    saved.counterStart = 42;
    saved.libraryIdSpace = 1000;
    saved.sweepOnLoad = false;
    saved.sweepOrder = SweepOrder::NameDescending;
    BOOST_REQUIRE(saved.saveToFile(path.string()));

    IdentityConfig loaded;
    BOOST_REQUIRE(loaded.loadFromFile(path.string()));
    BOOST_CHECK_EQUAL(loaded.counterStart, 42u);
    BOOST_CHECK_EQUAL(loaded.libraryIdSpace, 1000u);
    BOOST_CHECK(!loaded.sweepOnLoad);
    BOOST_CHECK(loaded.sweepOrder == SweepOrder::NameDescending);
}

BOOST_AUTO_TEST_CASE(TestShippedConfigLoads) {
    // Tests run from the source directory
    IdentityConfig config;
    BOOST_CHECK(config.loadFromFile("res/tether.json"));
}

BOOST_AUTO_TEST_SUITE_END()
