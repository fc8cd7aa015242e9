// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Configuration Tests
 *
 * Tests for the config file parser, environment overrides and validators
 */

#include <boost/test/unit_test.hpp>

#include <test/util/setup_common.h>
#include <util/config.h>
#include <util/config_validator.h>

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(parse_config_file) {
    CTempDir dir;
    WriteTestFile(dir.Path() / "stvfuzz.conf",
                  "# stvfuzz test config\n"
                  "[fuzzer]\n"
                  "scheduler = random   # trailing comment\n"
                  "Energy=25\n"
                  "harness=\"./target --fast\"\n"
                  "; semicolon comment\n"
                  "not a setting\n"
                  "runs_dir=first\n"
                  "runs_dir=second\n");

    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(dir.Str("stvfuzz.conf")));
    BOOST_CHECK(parser.IsLoaded());
    BOOST_CHECK_EQUAL(parser.GetConfigFilePath(), dir.Str("stvfuzz.conf"));

    BOOST_CHECK_EQUAL(parser.GetString("scheduler"), "random");
    BOOST_CHECK_EQUAL(parser.GetString("energy"), "25");
    BOOST_CHECK_EQUAL(parser.GetString("harness"), "./target --fast");
    BOOST_CHECK_EQUAL(parser.GetString("runs_dir"), "second");
    BOOST_CHECK(!parser.IsSet("fuzzer"));
    BOOST_CHECK(!parser.IsSet("not a setting"));
}

BOOST_AUTO_TEST_CASE(missing_file_uses_defaults) {
    CTempDir dir;
    CConfigParser parser;
    BOOST_CHECK(parser.LoadConfigFile(dir.Str("absent.conf")));
    BOOST_CHECK(!parser.IsSet("scheduler"));
    BOOST_CHECK_EQUAL(parser.GetString("scheduler", "fast"), "fast");
}

BOOST_AUTO_TEST_CASE(reload_clears_settings) {
    CTempDir dir;
    WriteTestFile(dir.Path() / "a.conf", "energy=5\n");
    WriteTestFile(dir.Path() / "b.conf", "strategy=stacked\n");

    CConfigParser parser;
    parser.LoadConfigFile(dir.Str("a.conf"));
    BOOST_CHECK(parser.IsSet("energy"));
    parser.LoadConfigFile(dir.Str("b.conf"));
    BOOST_CHECK(!parser.IsSet("energy"));
    BOOST_CHECK_EQUAL(parser.GetString("strategy"), "stacked");
}

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    CTempDir dir;
    WriteTestFile(dir.Path() / "env.conf", "max_energy=50\nstrategy=single\n");

    CConfigParser parser;
    parser.LoadConfigFile(dir.Str("env.conf"));
    BOOST_CHECK_EQUAL(parser.GetString("max_energy"), "50");

    CScopedEnv env("STVFUZZ_MAX_ENERGY", "75");
    BOOST_CHECK_EQUAL(parser.GetString("max_energy"), "75");
    BOOST_CHECK(parser.IsSet("max_energy"));

    CScopedEnv env_only("STVFUZZ_RUNS_DIR", "elsewhere");
    BOOST_CHECK(parser.IsSet("runs_dir"));
    BOOST_CHECK_EQUAL(parser.GetString("strategy"), "single");
}

BOOST_AUTO_TEST_CASE(validate_numbers) {
    BOOST_CHECK(CConfigValidator::ValidateInteger("5", "energy", 1).valid);
    BOOST_CHECK(!CConfigValidator::ValidateInteger("0", "energy", 1).valid);
    BOOST_CHECK(!CConfigValidator::ValidateInteger("abc", "energy", 1).valid);
    BOOST_CHECK(!CConfigValidator::ValidateInteger(" 5", "energy", 1).valid);
    BOOST_CHECK(!CConfigValidator::ValidateInteger("99999999999999999999", "energy", 1).valid);

    BOOST_CHECK(CConfigValidator::ValidateLimit("-1", "time_limit").valid);
    BOOST_CHECK(CConfigValidator::ValidateLimit("0", "time_limit").valid);
    BOOST_CHECK(!CConfigValidator::ValidateLimit("-2", "time_limit").valid);
    BOOST_CHECK(CConfigValidator::ValidateLimit("9223372036854775807", "time_limit").valid);
    BOOST_CHECK(CConfigValidator::ValidateLimit("1000", "exec_timeout_ms", 1000).valid);
    BOOST_CHECK(CConfigValidator::ValidateLimit("-1", "exec_timeout_ms", 1000).valid);
    BOOST_CHECK(!CConfigValidator::ValidateLimit("1001", "exec_timeout_ms", 1000).valid);

    BOOST_CHECK(CConfigValidator::ValidatePositiveNumber("0.25", "energy_c").valid);
    BOOST_CHECK(!CConfigValidator::ValidatePositiveNumber("0", "energy_c").valid);
    BOOST_CHECK(!CConfigValidator::ValidatePositiveNumber("-1.5", "energy_c").valid);
    BOOST_CHECK(!CConfigValidator::ValidatePositiveNumber("inf", "energy_c").valid);
    BOOST_CHECK(!CConfigValidator::ValidatePositiveNumber("", "energy_c").valid);

    ConfigValidationResult result = CConfigValidator::ValidateInteger("0", "max_energy", 1);
    BOOST_CHECK_EQUAL(result.field_name, "max_energy");
    BOOST_CHECK(!result.suggestions.empty());
}

BOOST_AUTO_TEST_CASE(validate_choices_and_paths) {
    BOOST_CHECK(CConfigValidator::ValidateChoice("fast", "scheduler", {"random", "fast"}).valid);
    BOOST_CHECK(!CConfigValidator::ValidateChoice("afl", "scheduler", {"random", "fast"}).valid);
    BOOST_CHECK(CConfigValidator::ValidateBool("Yes", "printtoconsole").valid);
    BOOST_CHECK(!CConfigValidator::ValidateBool("maybe", "printtoconsole").valid);

    CTempDir dir;
    WriteTestFile(dir.Path() / "file", "x");
    BOOST_CHECK(CConfigValidator::ValidateDirectory(dir.Str(), "seed_dir").valid);
    BOOST_CHECK(!CConfigValidator::ValidateDirectory(dir.Str("file"), "seed_dir").valid);
    BOOST_CHECK(!CConfigValidator::ValidateDirectory("", "seed_dir").valid);

    BOOST_CHECK(CConfigValidator::ValidateOutputDir(dir.Str("not_yet"), "runs_dir").valid);
    BOOST_CHECK(!CConfigValidator::ValidateOutputDir(dir.Str("file"), "runs_dir").valid);
    BOOST_CHECK(!CConfigValidator::ValidateOutputDir("", "runs_dir").valid);
}

BOOST_AUTO_TEST_SUITE_END()
