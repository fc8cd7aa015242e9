// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/engine.h>
#include <fuzzer/errors.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

CFuzzingEngine::CFuzzingEngine(CCorpusManager& corpus, CScheduler& scheduler, const CMutator& mutator,
                               CTargetExecutor& executor, CCoverageProvider& provider, CCoverageFeedback& feedback,
                               CFuzzStore& store, const CEngineSettings& settings)
    : m_corpus(corpus), m_scheduler(scheduler), m_mutator(mutator), m_executor(executor),
      m_provider(provider), m_feedback(feedback), m_store(store), m_settings(settings),
      m_reporter(settings.report_interval) {}

bool CFuzzingEngine::IsInterrupted() const {
    if (m_stopRequested.load()) {
        return true;
    }
    return m_settings.interrupt_flag != nullptr && m_settings.interrupt_flag->load();
}

std::string CFuzzingEngine::CheckStop(uint64_t iterations, double start_time) const {
    if (IsInterrupted()) {
        return "interrupted by user";
    }
    if (m_settings.max_iterations != -1 &&
        iterations >= static_cast<uint64_t>(m_settings.max_iterations)) {
        return strprintf("reached max iterations (%lld)", static_cast<long long>(m_settings.max_iterations));
    }
    if (m_settings.time_limit != -1 &&
        GetSteadySeconds() - start_time >= static_cast<double>(m_settings.time_limit)) {
        return strprintf("reached time limit (%llds)", static_cast<long long>(m_settings.time_limit));
    }
    return "";
}

void CFuzzingEngine::FuzzOnce(const SeedRef& seed, RunSummary& summary) {
    std::string mutated = m_mutator.Mutate(seed->data);

    CExecutionResult exec = m_executor.Execute(mutated);
    m_corpus.RecordFuzzed(seed);

    CCoverageSignal signal = m_provider.Observe(exec.coverage_artifact);
    FeedbackResult result = m_feedback.Evaluate(signal, exec.stderr_data);

    if (result.is_crash) {
        if (m_store.RecordCrash(mutated, exec.stderr_data)) {
            ++summary.unique_crashes;
            m_reporter.NewCrash(summary.iterations, summary.unique_crashes);
        } else {
            ++summary.duplicate_crashes;
            m_reporter.DuplicateCrash(summary.iterations);
        }
    }

    if (result.add_to_corpus) {
        m_corpus.Add(mutated);
        m_reporter.NewCoverage(summary.iterations, m_corpus.Size(),
                               m_feedback.GetSeenLineCount(), m_feedback.GetSeenBranchCount());
    }

    ++summary.iterations;
    m_reporter.Tick(summary.iterations, m_corpus.Size(), summary.unique_crashes);
}

void CFuzzingEngine::FlushAndClose(bool failing) {
    try {
        m_store.FlushCorpus(m_corpus.Seeds());
    } catch (const std::exception& e) {
        LogPrintEngine(ERROR, "Failed to flush corpus: %s", e.what());
        m_store.Close();
        if (!failing) {
            throw;
        }
        return;
    }
    m_store.Close();
}

RunSummary CFuzzingEngine::Run() {
    RunSummary summary;

    try {
        m_corpus.Load();
    } catch (const std::exception&) {
        // Nothing was loaded, so there is nothing to flush
        m_store.Close();
        throw;
    }

    const double start_time = GetSteadySeconds();
    m_reporter.Start(m_corpus.Size());

    try {
        while (true) {
            summary.stop_reason = CheckStop(summary.iterations, start_time);
            if (!summary.stop_reason.empty()) {
                m_reporter.Stopped(summary.stop_reason);
                break;
            }

            SeedRef seed = m_scheduler.Next(m_corpus.Seeds());
            m_corpus.RecordPicked(seed);
            int64_t energy = m_scheduler.Energy(seed);

            for (int64_t round = 0; round < energy; ++round) {
                FuzzOnce(seed, summary);
            }
        }
    } catch (const std::exception& e) {
        LogPrintEngine(ERROR, "Fuzzing stopped by error after %llu iterations: %s",
                       static_cast<unsigned long long>(summary.iterations), e.what());
        FlushAndClose(true);
        throw;
    }

    FlushAndClose(false);

    summary.corpus_size = m_corpus.Size();
    summary.elapsed_seconds = GetSteadySeconds() - start_time;
    m_reporter.Summary(summary);
    return summary;
}
