// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <db/fuzz_db.h>
#include <exec/line_record_provider.h>
#include <exec/subprocess_executor.h>
#include <fuzzer/corpus.h>
#include <fuzzer/engine.h>
#include <fuzzer/errors.h>
#include <fuzzer/feedback.h>
#include <fuzzer/mutator.h>
#include <fuzzer/options.h>
#include <fuzzer/scheduler.h>
#include <util/config.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/random.h>
#include <util/system.h>
#include <util/time.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/** Set by SIGINT/SIGTERM, polled by the engine before each seed pick */
static std::atomic<bool> g_interrupted{false};

static_assert(std::atomic<bool>::is_always_lock_free, "interrupt flag must be signal safe");

extern "C" void SignalHandler(int) {
    g_interrupted = true;
}

static ErrorMessage ToErrorMessage(const FuzzerError& e) {
    if (const auto* config = dynamic_cast<const ConfigurationError*>(&e)) {
        return CErrorFormatter::ConfigError(config->GetOption(), e.what());
    }
    if (dynamic_cast<const CorpusEmptyError*>(&e) != nullptr) {
        return CErrorFormatter::CorpusError(e.what());
    }
    if (const auto* persistence = dynamic_cast<const PersistenceError*>(&e)) {
        return CErrorFormatter::DatabaseError(persistence->GetOperation(), e.what());
    }
    if (dynamic_cast<const ExecutionError*>(&e) != nullptr) {
        return CErrorFormatter::ExecutionError(e.what());
    }
    return CErrorFormatter::InternalError(e.what());
}

static void ReportError(const ErrorMessage& error) {
    std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
    LogPrintf(ALL, ERROR, "%s", CErrorFormatter::FormatForLog(error).c_str());
}

/** Make a relative harness path absolute, since the harness runs in project_dir. */
static std::vector<std::string> ResolveHarness(std::vector<std::string> command) {
    if (!command.empty() && command[0].find('/') != std::string::npos) {
        fs::path exe(command[0]);
        if (exe.is_relative()) {
            command[0] = fs::absolute(exe).lexically_normal().string();
        }
    }
    return command;
}

static void InstallSignalHandlers() {
    if (std::signal(SIGINT, SignalHandler) == SIG_ERR) {
        std::cerr << "WARNING: Failed to install SIGINT handler" << std::endl;
        LogPrintf(ALL, WARN, "Failed to install SIGINT handler");
    }
    if (std::signal(SIGTERM, SignalHandler) == SIG_ERR) {
        std::cerr << "WARNING: Failed to install SIGTERM handler" << std::endl;
        LogPrintf(ALL, WARN, "Failed to install SIGTERM handler");
    }
}

int main(int argc, char* argv[]) {
    FuzzerOptions options;
    if (!options.ParseArgs(argc, argv)) {
        options.PrintUsage(argv[0]);
        return 1;
    }

    // Priority: Command-line > Environment > Config file > Default
    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(options.GetConfigFile())) {
        std::cerr << "ERROR: Failed to load configuration file: " << options.GetConfigFile() << std::endl;
        return 1;
    }

    try {
        options.Apply(config_parser);
    } catch (const ConfigurationError& e) {
        ReportError(ToErrorMessage(e));
        return 1;
    }

    std::vector<ConfigValidationResult> failures = options.Validate();
    if (!failures.empty()) {
        for (const auto& failure : failures) {
            ErrorMessage error = CErrorFormatter::ConfigError(failure.field_name, failure.error_message);
            if (!failure.suggestions.empty()) {
                error.recovery_steps = failure.suggestions;
            }
            ReportError(error);
        }
        return 1;
    }

    LogLevel level = LogLevel::LVL_INFO;
    ParseLogLevel(options.loglevel, level);
    CLoggingConfig::GetInstance().SetLogLevel(level);
    CLoggingConfig::GetInstance().SetConsoleLogging(options.printtoconsole);
    CLoggingConfig::GetInstance().DisableCategory(LogCategory::ALL);
    CLoggingConfig::GetInstance().EnableCategory(static_cast<LogCategory>(options.LogCategoryMask()));

    std::string run_dir = options.resume.empty()
        ? (fs::path(options.runs_dir) / FormatRunId(GetTime())).string()
        : options.resume;
    if (!EnsureDirExists(run_dir)) {
        std::cerr << "ERROR: Cannot create run directory: " << run_dir << std::endl;
        return 1;
    }

    CLoggingConfig::GetInstance().SetLogFile((fs::path(run_dir) / "fuzz.log").string());
    if (!CLogger::GetInstance().Initialize()) {
        std::cerr << "WARNING: Cannot open log file in " << run_dir << ", logging to console only" << std::endl;
    }

    InstallSignalHandlers();

    int exit_code = 0;
    try {
        CInsecureRand rng(options.rng_seed);
        std::vector<std::string> harness = ResolveHarness(options.HarnessCommand());

        LogPrintEngine(INFO, "stvfuzz run %s", run_dir.c_str());
        LogPrintEngine(INFO, "  project:   %s", options.project_dir.c_str());
        LogPrintEngine(INFO, "  harness:   %s", options.harness.c_str());
        LogPrintEngine(INFO, "  seeds:     %s", options.seed_dir.c_str());
        LogPrintEngine(INFO, "  stop:      max_iterations=%lld time_limit=%llds",
                       static_cast<long long>(options.max_iterations), static_cast<long long>(options.time_limit));
        LogPrintEngine(INFO, "  scheduler: %s  strategy: %s  rng_seed: %llu",
                       options.scheduler.c_str(), options.strategy.c_str(),
                       static_cast<unsigned long long>(rng.GetSeed()));

        CFuzzDB db;
        db.Open((fs::path(run_dir) / "results.db").string());

        std::unique_ptr<CScheduler> scheduler = MakeScheduler(options.scheduler, rng, options.energy,
                                                              options.energy_c, options.max_energy);
        CMutator mutator(rng, MakeMutationStrategy(options.strategy));
        CCorpusManager corpus(options.seed_dir, db);
        CSubprocessExecutor executor(harness, options.project_dir, run_dir, options.exec_timeout_ms);
        CLineRecordProvider provider(options.project_dir);
        CCoverageFeedback feedback;

        CEngineSettings settings;
        settings.max_iterations = options.max_iterations;
        settings.time_limit = options.time_limit;
        settings.report_interval = options.report_interval;
        settings.interrupt_flag = &g_interrupted;

        CFuzzingEngine engine(corpus, *scheduler, mutator, executor, provider, feedback, db, settings);
        RunSummary summary = engine.Run();

        std::cout << std::endl;
        std::cout << "Run complete (" << summary.stop_reason << ")" << std::endl;
        std::cout << "  Iterations:     " << summary.iterations << std::endl;
        std::cout << "  Corpus size:    " << summary.corpus_size << std::endl;
        std::cout << "  Unique crashes: " << summary.unique_crashes << std::endl;
        std::cout << "  Elapsed:        " << CRunReporter::FormatElapsed(summary.elapsed_seconds) << std::endl;
        std::cout << "  Results:        " << (fs::path(run_dir) / "results.db").string() << std::endl;
    } catch (const FuzzerError& e) {
        ReportError(ToErrorMessage(e));
        exit_code = 1;
    } catch (const std::exception& e) {
        ReportError(CErrorFormatter::InternalError(e.what()));
        exit_code = 1;
    }

    CLogger::GetInstance().Shutdown();
    return exit_code;
}
