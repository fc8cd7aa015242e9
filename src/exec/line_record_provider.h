// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_EXEC_LINE_RECORD_PROVIDER_H
#define STVFUZZ_EXEC_LINE_RECORD_PROVIDER_H

/**
 * Coverage record files
 *
 * One record per line, fields separated by a single TAB:
 *
 *   L <path> <line>
 *   B <path> <from> <to>
 *
 * Empty lines and lines starting with '#' are ignored. Relative paths are
 * resolved against the project root.
 */

#include <exec/coverage_provider.h>

#include <cstdint>
#include <map>
#include <string>

/** One parsed record. `to` is unused for line records. */
struct CCoverageRecord {
    char kind{0};  // 'L' or 'B'
    std::string path;
    int64_t from{0};
    int64_t to{0};
};

/**
 * Parse a single record line (without the trailing newline).
 * @return false for comments, empty lines and malformed records
 */
bool ParseCoverageRecord(const std::string& line, CCoverageRecord& record);

class CLineRecordProvider : public CCoverageProvider {
public:
    explicit CLineRecordProvider(const std::string& project_root);

    /**
     * Read and delete `artifact`. A missing artifact yields an empty signal.
     * Records for files outside the project root are dropped.
     */
    CCoverageSignal Observe(const std::string& artifact) override;

    const std::string& GetProjectRoot() const { return m_root; }

private:
    std::string m_root;
    /** Record path -> key relative to the root ("" if outside) */
    std::map<std::string, std::string> m_pathCache;

    const std::string& RelativeKey(const std::string& path);
};

#endif // STVFUZZ_EXEC_LINE_RECORD_PROVIDER_H
