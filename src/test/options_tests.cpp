// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Option Tests
 *
 * Tests for command-line parsing and the option priority chain
 * (command line > environment > config file > default)
 */

#include <boost/test/unit_test.hpp>

#include <fuzzer/errors.h>
#include <fuzzer/options.h>
#include <test/util/setup_common.h>
#include <util/config.h>
#include <util/logging.h>

#include <algorithm>

static bool Parse(FuzzerOptions& options, std::vector<std::string> args) {
    args.insert(args.begin(), "stvfuzz");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return options.ParseArgs(static_cast<int>(argv.size()), argv.data());
}

static bool HasFailure(const std::vector<ConfigValidationResult>& failures, const std::string& field) {
    return std::any_of(failures.begin(), failures.end(),
                       [&field](const ConfigValidationResult& r) { return r.field_name == field; });
}

BOOST_AUTO_TEST_SUITE(options_tests)

BOOST_AUTO_TEST_CASE(defaults) {
    FuzzerOptions options;
    BOOST_CHECK_EQUAL(options.project_dir, ".");
    BOOST_CHECK_EQUAL(options.runs_dir, "runs");
    BOOST_CHECK_EQUAL(options.max_iterations, 1000);
    BOOST_CHECK_EQUAL(options.time_limit, 60);
    BOOST_CHECK_EQUAL(options.scheduler, "fast");
    BOOST_CHECK_EQUAL(options.strategy, "single");
    BOOST_CHECK_EQUAL(options.energy, 10);
    BOOST_CHECK_EQUAL(options.max_energy, 100);
    BOOST_CHECK_EQUAL(options.GetConfigFile(), "stvfuzz.conf");
}

BOOST_AUTO_TEST_CASE(positional_arguments) {
    FuzzerOptions options;
    BOOST_REQUIRE(Parse(options, {"proj", "./target --flag", "seeds"}));
    options.Apply(CConfigParser());

    BOOST_CHECK_EQUAL(options.project_dir, "proj");
    BOOST_CHECK_EQUAL(options.harness, "./target --flag");
    BOOST_CHECK_EQUAL(options.seed_dir, "seeds");

    std::vector<std::string> command = options.HarnessCommand();
    BOOST_REQUIRE_EQUAL(command.size(), 2U);
    BOOST_CHECK_EQUAL(command[0], "./target");
    BOOST_CHECK_EQUAL(command[1], "--flag");
}

BOOST_AUTO_TEST_CASE(parse_rejects_bad_arguments) {
    FuzzerOptions a, b, c, d, e;
    BOOST_CHECK(!Parse(a, {"--bogus=1"}));
    BOOST_CHECK(!Parse(b, {"-x"}));
    BOOST_CHECK(!Parse(c, {"p", "h", "s", "extra"}));
    BOOST_CHECK(!Parse(d, {"--energy"}));
    BOOST_CHECK(!Parse(e, {"--help"}));
}

BOOST_AUTO_TEST_CASE(hyphenated_options) {
    FuzzerOptions options;
    BOOST_REQUIRE(Parse(options, {"--max-iterations=5", "--time_limit=-1", "--scheduler=random",
                                  "--energy-c=2.5", "--printtoconsole", "--conf=custom.conf"}));
    options.Apply(CConfigParser());

    BOOST_CHECK_EQUAL(options.max_iterations, 5);
    BOOST_CHECK_EQUAL(options.time_limit, -1);
    BOOST_CHECK_EQUAL(options.scheduler, "random");
    BOOST_CHECK_CLOSE(options.energy_c, 2.5, 1e-9);
    BOOST_CHECK(options.printtoconsole);
    BOOST_CHECK_EQUAL(options.GetConfigFile(), "custom.conf");
}

BOOST_AUTO_TEST_CASE(priority_chain) {
    CTempDir dir;
    WriteTestFile(dir.Path() / "stvfuzz.conf",
                  "energy=3\n"
                  "max_energy=50\n"
                  "strategy=stacked\n"
                  "report_interval=7\n");

    CConfigParser parser;
    parser.LoadConfigFile(dir.Str("stvfuzz.conf"));

    CScopedEnv energyEnv("STVFUZZ_ENERGY", "7");
    CScopedEnv maxEnv("STVFUZZ_MAX_ENERGY", "60");

    FuzzerOptions options;
    BOOST_REQUIRE(Parse(options, {"--energy=9"}));
    options.Apply(parser);

    BOOST_CHECK_EQUAL(options.energy, 9);            // command line
    BOOST_CHECK_EQUAL(options.max_energy, 60);       // environment
    BOOST_CHECK_EQUAL(options.strategy, "stacked");  // config file
    BOOST_CHECK_EQUAL(options.report_interval, 7);   // config file
    BOOST_CHECK_EQUAL(options.time_limit, 60);       // default
}

BOOST_AUTO_TEST_CASE(invalid_values_are_rejected) {
    const std::vector<std::pair<std::string, std::string>> cases{
        {"--max-iterations=-5", "max_iterations"},
        {"--time-limit=soon", "time_limit"},
        {"--scheduler=afl", "scheduler"},
        {"--energy=0", "energy"},
        {"--energy-c=0", "energy_c"},
        {"--max-energy=-1", "max_energy"},
        {"--strategy=havoc", "strategy"},
        {"--exec-timeout-ms=-3", "exec_timeout_ms"},
        {"--exec-timeout-ms=9223372036854775807", "exec_timeout_ms"},
        {"--rng-seed=-1", "rng_seed"},
        {"--loglevel=verbose", "loglevel"},
        {"--printtoconsole=maybe", "printtoconsole"},
        {"--logcategories=exec,network", "logcategories"},
        {"--logcategories= , ", "logcategories"},
    };

    for (const auto& c : cases) {
        FuzzerOptions options;
        BOOST_REQUIRE(Parse(options, {c.first}));
        try {
            options.Apply(CConfigParser());
            BOOST_ERROR("expected ConfigurationError for " + c.first);
        } catch (const ConfigurationError& e) {
            BOOST_CHECK_EQUAL(e.GetOption(), c.second);
        }
    }
}

BOOST_AUTO_TEST_CASE(loglevel_is_case_insensitive) {
    FuzzerOptions options;
    BOOST_REQUIRE(Parse(options, {"--loglevel=DEBUG"}));
    options.Apply(CConfigParser());
    BOOST_CHECK_EQUAL(options.loglevel, "debug");
}

BOOST_AUTO_TEST_CASE(log_category_mask) {
    FuzzerOptions options;
    BOOST_CHECK_EQUAL(options.LogCategoryMask(), static_cast<uint32_t>(LogCategory::ALL));

    BOOST_REQUIRE(Parse(options, {"--logcategories=Exec, engine"}));
    options.Apply(CConfigParser());
    BOOST_CHECK_EQUAL(options.LogCategoryMask(),
                      static_cast<uint32_t>(LogCategory::EXEC) | static_cast<uint32_t>(LogCategory::ENGINE));
}

BOOST_AUTO_TEST_CASE(validate_new_run) {
    CTempDir dir;

    FuzzerOptions missing;
    missing.project_dir = dir.Str();
    std::vector<ConfigValidationResult> failures = missing.Validate();
    BOOST_CHECK(HasFailure(failures, "harness"));
    BOOST_CHECK(HasFailure(failures, "seed_dir"));

    FuzzerOptions complete;
    complete.project_dir = dir.Str();
    complete.harness = "./target";
    complete.seed_dir = dir.Str();
    complete.runs_dir = dir.Str("runs");
    BOOST_CHECK(complete.Validate().empty());

    complete.project_dir = dir.Str("nope");
    BOOST_CHECK(HasFailure(complete.Validate(), "project_dir"));
}

BOOST_AUTO_TEST_CASE(validate_resume) {
    CTempDir dir;

    FuzzerOptions options;
    options.project_dir = dir.Str();
    options.harness = "./target";
    options.resume = dir.Str("missing_run");
    BOOST_CHECK(HasFailure(options.Validate(), "resume"));
    BOOST_CHECK(!HasFailure(options.Validate(), "seed_dir"));

    std::filesystem::create_directories(dir.Path() / "run");
    options.resume = dir.Str("run");
    BOOST_CHECK(options.Validate().empty());
}

BOOST_AUTO_TEST_SUITE_END()
