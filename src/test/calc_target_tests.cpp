// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * End-to-end Tests
 *
 * Runs the bundled calculator target through the real executor, coverage
 * provider and results database
 */

#include <boost/test/unit_test.hpp>

#include <db/fuzz_db.h>
#include <exec/line_record_provider.h>
#include <exec/subprocess_executor.h>
#include <fuzzer/crash.h>
#include <fuzzer/engine.h>
#include <test/util/setup_common.h>
#include <util/random.h>

static const std::string CALC_SOURCE_KEY = "src/targets/calc_target.cpp";

struct CalcTargetSetup {
    CTempDir dir{"stvfuzz_calc_test"};
    CSubprocessExecutor executor{{STVFUZZ_CALC_TARGET}, STVFUZZ_SOURCE_DIR, dir.Str(), 10000};
    CLineRecordProvider provider{STVFUZZ_SOURCE_DIR};
};

BOOST_FIXTURE_TEST_SUITE(calc_target_tests, CalcTargetSetup)

BOOST_AUTO_TEST_CASE(evaluates_and_reports_coverage) {
    CExecutionResult result = executor.Execute("max(7,10/2)");
    BOOST_CHECK_EQUAL(result.stdout_data, "7\n");
    BOOST_CHECK(!HasCrashSentinel(result.stderr_data));

    CCoverageSignal signal = provider.Observe(result.coverage_artifact);
    BOOST_REQUIRE_EQUAL(signal.lines.count(CALC_SOURCE_KEY), 1U);
    BOOST_CHECK(!signal.lines[CALC_SOURCE_KEY].empty());
    BOOST_CHECK(!signal.branches[CALC_SOURCE_KEY].empty());
    BOOST_CHECK(!std::filesystem::exists(result.coverage_artifact));

    // Entry and exit arcs
    bool entry = false, exit = false;
    for (const BranchArc& arc : signal.branches[CALC_SOURCE_KEY]) {
        if (arc.first == -1) entry = true;
        if (arc.second == -1) exit = true;
    }
    BOOST_CHECK(entry);
    BOOST_CHECK(exit);
}

BOOST_AUTO_TEST_CASE(different_inputs_cover_differently) {
    CCoverageFeedback feedback;
    BOOST_CHECK(feedback.Evaluate(provider.Observe(executor.Execute("1+2").coverage_artifact), "").add_to_corpus);
    BOOST_CHECK(!feedback.Evaluate(provider.Observe(executor.Execute("3+4").coverage_artifact), "").add_to_corpus);
    BOOST_CHECK(feedback.Evaluate(provider.Observe(executor.Execute("17%5").coverage_artifact), "").add_to_corpus);
}

BOOST_AUTO_TEST_CASE(errors_are_crash_reports) {
    CExecutionResult division = executor.Execute("1/0");
    BOOST_REQUIRE(HasCrashSentinel(division.stderr_data));
    CCrashInfo info = ParseCrash(division.stderr_data);
    BOOST_CHECK_EQUAL(info.exception_type, "ZeroDivisionError");
    BOOST_CHECK_EQUAL(info.exception_message, "integer division by zero");
    BOOST_CHECK(info.file.find("calc_target.cpp") != std::string::npos);
    BOOST_CHECK(info.line > 0);

    CExecutionResult index = executor.Execute("max(1,2");
    BOOST_CHECK_EQUAL(ParseCrash(index.stderr_data).exception_type, "IndexError");

    CExecutionResult nested = executor.Execute("(((((((1)))))))");
    BOOST_CHECK_EQUAL(ParseCrash(nested.stderr_data).exception_type, "RecursionError");

    // Same error site, same dedup key
    CCrashInfo again = ParseCrash(executor.Execute("5/(2-2)").stderr_data);
    BOOST_CHECK(CCrashKey(info) == CCrashKey(again));
}

BOOST_AUTO_TEST_CASE(fuzzing_run_persists_results) {
    const std::string db_path = dir.Str("results.db");
    RunSummary summary;

    {
        CFuzzDB db;
        db.Open(db_path);

        CInsecureRand rng(1);
        CCorpusManager corpus(std::string(STVFUZZ_SOURCE_DIR) + "/contrib/corpus/calc", db);
        CRandomScheduler scheduler(rng, 5);
        CMutator mutator(rng);
        CCoverageFeedback feedback;

        CEngineSettings settings;
        settings.max_iterations = 200;
        settings.time_limit = -1;
        settings.report_interval = 0;

        CFuzzingEngine engine(corpus, scheduler, mutator, executor, provider, feedback, db, settings);
        summary = engine.Run();
        BOOST_CHECK(!db.IsOpen());
    }

    BOOST_CHECK_EQUAL(summary.iterations, 200U);
    BOOST_CHECK(summary.corpus_size >= 4U);

    CFuzzDB db;
    db.Open(db_path, false);
    SeedList seeds = db.LoadSeeds();
    BOOST_CHECK_EQUAL(seeds.size(), summary.corpus_size);

    uint64_t picked = 0, fuzzed = 0;
    for (const SeedRef& seed : seeds) {
        picked += seed->metadata.nTimesPicked;
        fuzzed += seed->metadata.nTimesFuzzed;
    }
    BOOST_CHECK_EQUAL(fuzzed, 200U);
    BOOST_CHECK_EQUAL(picked, 40U);

    std::vector<CCrashRecord> crashes = db.LoadCrashes();
    BOOST_CHECK_EQUAL(crashes.size(), summary.unique_crashes);
    uint64_t hits = 0;
    for (const CCrashRecord& record : crashes) {
        hits += record.nCount;
    }
    BOOST_CHECK_EQUAL(hits, summary.unique_crashes + summary.duplicate_crashes);
}

BOOST_AUTO_TEST_SUITE_END()
