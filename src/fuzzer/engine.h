// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_ENGINE_H
#define STVFUZZ_FUZZER_ENGINE_H

#include <db/fuzz_store.h>
#include <exec/coverage_provider.h>
#include <exec/executor.h>
#include <fuzzer/corpus.h>
#include <fuzzer/feedback.h>
#include <fuzzer/mutator.h>
#include <fuzzer/reporter.h>
#include <fuzzer/scheduler.h>

#include <atomic>
#include <cstdint>
#include <string>

/** Stop conditions and reporting of one run */
struct CEngineSettings {
    int64_t max_iterations{1000};   // -1 = disabled
    int64_t time_limit{60};         // seconds, -1 = disabled
    int64_t report_interval{100};
    /** Set asynchronously (e.g. by a signal handler) to stop the run */
    const std::atomic<bool>* interrupt_flag{nullptr};
};

/**
 * The fuzzing loop
 *
 * Every collaborator is injected and must outlive the engine. Stop
 * conditions are checked only before picking the next seed, so one seed's
 * energy is always spent completely.
 *
 * However Run() ends (stop condition, interruption or a fatal error), the
 * whole corpus is flushed to the store and the store is closed before it
 * returns or rethrows.
 */
class CFuzzingEngine {
public:
    CFuzzingEngine(CCorpusManager& corpus, CScheduler& scheduler, const CMutator& mutator,
                   CTargetExecutor& executor, CCoverageProvider& provider, CCoverageFeedback& feedback,
                   CFuzzStore& store, const CEngineSettings& settings);

    /**
     * @throws CorpusEmptyError, PersistenceError, ExecutionError, EmptyPoolError
     */
    RunSummary Run();

    /** Ask the loop to stop before its next seed pick. */
    void RequestStop() { m_stopRequested = true; }

private:
    CCorpusManager& m_corpus;
    CScheduler& m_scheduler;
    const CMutator& m_mutator;
    CTargetExecutor& m_executor;
    CCoverageProvider& m_provider;
    CCoverageFeedback& m_feedback;
    CFuzzStore& m_store;
    CEngineSettings m_settings;
    CRunReporter m_reporter;
    std::atomic<bool> m_stopRequested{false};

    bool IsInterrupted() const;

    /** @return empty string to keep going */
    std::string CheckStop(uint64_t iterations, double start_time) const;

    /** One mutate/execute/evaluate round on `seed`. */
    void FuzzOnce(const SeedRef& seed, RunSummary& summary);

    void FlushAndClose(bool failing);
};

#endif // STVFUZZ_FUZZER_ENGINE_H
