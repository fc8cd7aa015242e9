// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Main test entry point for the stvfuzz test suite
 *
 * This file initializes the Boost Unit Test Framework for all stvfuzz tests.
 * Following Bitcoin Core's testing approach.
 */

#define BOOST_TEST_MODULE stvfuzz Test Suite
#include <boost/test/included/unit_test.hpp>

#include <util/logging.h>

#include <iostream>

/**
 * Global test suite setup
 */
struct StvfuzzTestSetup {
    StvfuzzTestSetup() {
        std::cout << "stvfuzz Test Suite Starting..." << std::endl;
        std::cout << "Using Boost.Test version "
                  << BOOST_VERSION / 100000 << "."
                  << BOOST_VERSION / 100 % 1000 << "."
                  << BOOST_VERSION % 100 << std::endl;

        // Keep test output readable; errors still reach stderr
        CLoggingConfig::GetInstance().SetLogLevel(LogLevel::LVL_ERROR);
    }

    ~StvfuzzTestSetup() {
        std::cout << "stvfuzz Test Suite Complete" << std::endl;
    }
};

BOOST_GLOBAL_FIXTURE(StvfuzzTestSetup);

/**
 * Basic sanity check test
 */
BOOST_AUTO_TEST_SUITE(sanity_tests)

BOOST_AUTO_TEST_CASE(basic_sanity) {
    BOOST_CHECK_EQUAL(1 + 1, 2);
    BOOST_CHECK(true);
}

BOOST_AUTO_TEST_SUITE_END()
