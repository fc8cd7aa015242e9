// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_REPORTER_H
#define STVFUZZ_FUZZER_REPORTER_H

#include <cstdint>
#include <string>

/** Result of one CFuzzingEngine::Run() */
struct RunSummary {
    uint64_t iterations{0};
    uint64_t unique_crashes{0};
    uint64_t duplicate_crashes{0};
    size_t corpus_size{0};
    double elapsed_seconds{0.0};
    std::string stop_reason;
};

/**
 * Reports run progress through the ENGINE log category: events as they
 * happen, a progress line every `report_interval` executions and a final
 * summary.
 */
class CRunReporter {
public:
    /** @param report_interval executions between progress lines, 0 = never */
    explicit CRunReporter(int64_t report_interval = 100);

    void Start(size_t corpus_size);
    void Tick(uint64_t iteration, size_t corpus_size, uint64_t unique_crashes);

    void NewCoverage(uint64_t iteration, size_t corpus_size, size_t seen_lines, size_t seen_branches);
    void NewCrash(uint64_t iteration, uint64_t unique_crashes);
    void DuplicateCrash(uint64_t iteration);
    void Stopped(const std::string& reason);

    void Summary(const RunSummary& summary);

    /** Seconds since Start() as H:MM:SS */
    static std::string FormatElapsed(double seconds);

private:
    int64_t m_reportInterval;
    double m_startTime{0.0};
};

#endif // STVFUZZ_FUZZER_REPORTER_H
