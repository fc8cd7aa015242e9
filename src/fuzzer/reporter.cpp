// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/reporter.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

CRunReporter::CRunReporter(int64_t report_interval)
    : m_reportInterval(report_interval) {}

std::string CRunReporter::FormatElapsed(double seconds) {
    int64_t total = seconds > 0.0 ? static_cast<int64_t>(seconds) : 0;
    return strprintf("%lld:%02lld:%02lld", static_cast<long long>(total / 3600),
                     static_cast<long long>((total / 60) % 60), static_cast<long long>(total % 60));
}

void CRunReporter::Start(size_t corpus_size) {
    m_startTime = GetSteadySeconds();
    LogPrintEngine(INFO, "Fuzzing started with %zu seeds", corpus_size);
}

void CRunReporter::Tick(uint64_t iteration, size_t corpus_size, uint64_t unique_crashes) {
    if (m_reportInterval <= 0 || iteration % static_cast<uint64_t>(m_reportInterval) != 0) {
        return;
    }
    double elapsed = GetSteadySeconds() - m_startTime;
    double rate = elapsed > 0.0 ? static_cast<double>(iteration) / elapsed : 0.0;
    LogPrintEngine(INFO, "iter=%llu corpus=%zu crashes=%llu elapsed=%s exec/s=%.1f",
                   static_cast<unsigned long long>(iteration), corpus_size,
                   static_cast<unsigned long long>(unique_crashes), FormatElapsed(elapsed).c_str(), rate);
}

void CRunReporter::NewCoverage(uint64_t iteration, size_t corpus_size, size_t seen_lines, size_t seen_branches) {
    LogPrintEngine(INFO, "[iter %llu] New coverage - corpus size: %zu (lines=%zu branches=%zu)",
                   static_cast<unsigned long long>(iteration), corpus_size, seen_lines, seen_branches);
}

void CRunReporter::NewCrash(uint64_t iteration, uint64_t unique_crashes) {
    LogPrintEngine(WARN, "[iter %llu] New unique crash! Total unique: %llu",
                   static_cast<unsigned long long>(iteration), static_cast<unsigned long long>(unique_crashes));
}

void CRunReporter::DuplicateCrash(uint64_t iteration) {
    LogPrintEngine(DEBUG, "[iter %llu] Duplicate crash (not recorded again)",
                   static_cast<unsigned long long>(iteration));
}

void CRunReporter::Stopped(const std::string& reason) {
    LogPrintEngine(INFO, "Stopped: %s", reason.c_str());
}

void CRunReporter::Summary(const RunSummary& summary) {
    LogPrintEngine(INFO, "Run complete: iterations=%llu corpus=%zu unique_crashes=%llu duplicate_crashes=%llu elapsed=%s",
                   static_cast<unsigned long long>(summary.iterations), summary.corpus_size,
                   static_cast<unsigned long long>(summary.unique_crashes),
                   static_cast<unsigned long long>(summary.duplicate_crashes),
                   FormatElapsed(summary.elapsed_seconds).c_str());
}
