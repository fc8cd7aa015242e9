// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_EXEC_EXECUTOR_H
#define STVFUZZ_EXEC_EXECUTOR_H

#include <string>

/** Output of one target run. */
struct CExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
    /** Where the target wrote its coverage records (may not exist) */
    std::string coverage_artifact;
    /** Raw waitpid() status, -1 if unknown */
    int exit_status{-1};
    bool timed_out{false};
};

/**
 * Target execution interface
 *
 * Runs the target once with `input` on stdin. A crash of the target is
 * reported through the crash sentinel in stderr_data, never by throwing.
 */
class CTargetExecutor {
public:
    virtual ~CTargetExecutor() = default;

    /** @throws ExecutionError if the target cannot be started at all */
    virtual CExecutionResult Execute(const std::string& input) = 0;
};

#endif // STVFUZZ_EXEC_EXECUTOR_H
