// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_COVERAGE_H
#define STVFUZZ_FUZZER_COVERAGE_H

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>

/** (from-line, to-line); negative lines are entry/exit arcs */
using BranchArc = std::pair<int64_t, int64_t>;

/**
 * Lines and branches exercised by one target execution, keyed by file path
 * relative to the project root.
 */
struct CCoverageSignal {
    std::map<std::string, std::set<int64_t>> lines;
    std::map<std::string, std::set<BranchArc>> branches;

    size_t TotalLines() const {
        size_t n = 0;
        for (const auto& entry : lines) n += entry.second.size();
        return n;
    }

    size_t TotalBranches() const {
        size_t n = 0;
        for (const auto& entry : branches) n += entry.second.size();
        return n;
    }

    bool IsEmpty() const { return TotalLines() == 0 && TotalBranches() == 0; }
};

#endif // STVFUZZ_FUZZER_COVERAGE_H
