// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_EXEC_COVERAGE_PROVIDER_H
#define STVFUZZ_EXEC_COVERAGE_PROVIDER_H

#include <fuzzer/coverage.h>

#include <string>

/**
 * Coverage provider interface
 *
 * Turns the instrumentation artifact of one execution into a coverage signal
 * restricted to files under the project root. The artifact is consumed: it
 * is released after a successful read.
 */
class CCoverageProvider {
public:
    virtual ~CCoverageProvider() = default;

    virtual CCoverageSignal Observe(const std::string& artifact) = 0;
};

#endif // STVFUZZ_EXEC_COVERAGE_PROVIDER_H
