// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_DB_FUZZ_STORE_H
#define STVFUZZ_DB_FUZZ_STORE_H

/**
 * Persistent results store
 *
 * Holds the full corpus (for resuming a run) and every deduplicated crash.
 * Implementations must:
 * - commit each write before the call returns,
 * - replace the stored corpus atomically in FlushCorpus(),
 * - keep at most one crash row per (exception_type, file, line).
 *
 * Any storage failure is reported as PersistenceError.
 */

#include <fuzzer/crash.h>
#include <fuzzer/seed.h>

#include <string>
#include <vector>

class CFuzzStore {
public:
    virtual ~CFuzzStore() = default;

    /** Append one seed to the stored corpus. */
    virtual void SaveSeed(const CSeedInput& seed) = 0;

    /** Replace the whole stored corpus with `seeds`, in order. */
    virtual void FlushCorpus(const SeedList& seeds) = 0;

    /** All stored seeds in insertion order. */
    virtual SeedList LoadSeeds() = 0;

    /** All crash records, most frequent first. */
    virtual std::vector<CCrashRecord> LoadCrashes() = 0;

    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    /**
     * Parse a crash report and record it under its dedup key.
     *
     * @param data Input that triggered the crash
     * @param stderr_text Raw target stderr (starting with the crash sentinel)
     * @return true for a new unique crash, false for a repeat of a known key
     */
    bool RecordCrash(const std::string& data, const std::string& stderr_text);

protected:
    /**
     * Insert a new record with count 1, or bump count and last_seen_at of the
     * existing record with the same key.
     *
     * @return true if a new record was inserted
     */
    virtual bool UpsertCrash(const CCrashInfo& info, const std::string& data, const std::string& now) = 0;
};

#endif // STVFUZZ_DB_FUZZ_STORE_H
