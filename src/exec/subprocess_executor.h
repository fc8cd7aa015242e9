// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_EXEC_SUBPROCESS_EXECUTOR_H
#define STVFUZZ_EXEC_SUBPROCESS_EXECUTOR_H

#include <exec/executor.h>

#include <cstdint>
#include <string>
#include <vector>

/** Longest per-execution timeout accepted (one day) */
static const int64_t MAX_EXEC_TIMEOUT_MS = 24LL * 60 * 60 * 1000;

/** Environment variable naming the coverage record file of one execution */
static const char* const COVERAGE_FILE_ENV = "STVFUZZ_COVERAGE_FILE";

/**
 * Runs the harness as a child process per input.
 *
 * The child is started with posix_spawn() in the project root, reads the
 * input from a stdin pipe and gets a fresh coverage artifact path through
 * STVFUZZ_COVERAGE_FILE. All three pipes are serviced with poll(), so a
 * harness writing large outputs cannot deadlock against a blocked write.
 */
class CSubprocessExecutor : public CTargetExecutor {
public:
    /**
     * @param command      argv of the harness; command[0] is the executable
     * @param working_dir  Directory the harness runs in (project root)
     * @param artifact_dir Directory for coverage artifacts
     * @param timeout_ms   Wall-clock limit per execution, -1 for none
     * @throws ConfigurationError if command is empty or timeout_ms is outside
     *         [-1, MAX_EXEC_TIMEOUT_MS]
     */
    CSubprocessExecutor(std::vector<std::string> command, std::string working_dir,
                        std::string artifact_dir, int64_t timeout_ms = -1);

    CExecutionResult Execute(const std::string& input) override;

    uint64_t GetExecutionCount() const { return m_nExecutions; }

private:
    std::vector<std::string> m_command;
    std::string m_workingDir;
    std::string m_artifactDir;
    int64_t m_timeoutMs;
    uint64_t m_nExecutions{0};

    std::string NextArtifactPath();
    std::vector<std::string> BuildEnvironment(const std::string& artifact) const;
};

#endif // STVFUZZ_EXEC_SUBPROCESS_EXECUTOR_H
