// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_FEEDBACK_H
#define STVFUZZ_FUZZER_FEEDBACK_H

#include <fuzzer/coverage.h>

#include <set>
#include <string>
#include <utility>

/** Outcome of evaluating one execution. Crash and novelty are independent. */
struct FeedbackResult {
    bool add_to_corpus{false};
    bool is_crash{false};
};

/**
 * Coverage feedback evaluator
 *
 * Owns the global seen-coverage state. The seen sets only grow.
 */
class CCoverageFeedback {
public:
    /**
     * Decide whether an execution is a crash and whether it reached any line
     * or branch not seen before. Novel signals are merged into the seen state.
     */
    FeedbackResult Evaluate(const CCoverageSignal& signal, const std::string& stderr_text);

    size_t GetSeenLineCount() const { return m_seenLines.size(); }
    size_t GetSeenBranchCount() const { return m_seenBranches.size(); }

private:
    std::set<std::pair<std::string, int64_t>> m_seenLines;
    std::set<std::pair<std::string, BranchArc>> m_seenBranches;

    bool IsNovel(const CCoverageSignal& signal) const;
    void Merge(const CCoverageSignal& signal);
};

#endif // STVFUZZ_FUZZER_FEEDBACK_H
