// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/feedback.h>
#include <fuzzer/crash.h>
#include <util/logging.h>

bool CCoverageFeedback::IsNovel(const CCoverageSignal& signal) const {
    for (const auto& file : signal.lines) {
        for (int64_t line : file.second) {
            if (m_seenLines.count({file.first, line}) == 0) {
                return true;
            }
        }
    }
    for (const auto& file : signal.branches) {
        for (const BranchArc& arc : file.second) {
            if (m_seenBranches.count({file.first, arc}) == 0) {
                return true;
            }
        }
    }
    return false;
}

void CCoverageFeedback::Merge(const CCoverageSignal& signal) {
    for (const auto& file : signal.lines) {
        for (int64_t line : file.second) {
            m_seenLines.emplace(file.first, line);
        }
    }
    for (const auto& file : signal.branches) {
        for (const BranchArc& arc : file.second) {
            m_seenBranches.emplace(file.first, arc);
        }
    }
}

FeedbackResult CCoverageFeedback::Evaluate(const CCoverageSignal& signal, const std::string& stderr_text) {
    FeedbackResult result;
    result.is_crash = HasCrashSentinel(stderr_text);

    if (IsNovel(signal)) {
        size_t lines_before = m_seenLines.size();
        size_t branches_before = m_seenBranches.size();
        Merge(signal);
        result.add_to_corpus = true;
        LogPrintFeedback(DEBUG, "New coverage: +%zu lines, +%zu branches",
                         m_seenLines.size() - lines_before, m_seenBranches.size() - branches_before);
    }
    return result;
}
