// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_CORPUS_H
#define STVFUZZ_FUZZER_CORPUS_H

#include <db/fuzz_store.h>
#include <fuzzer/seed.h>

#include <string>

/**
 * Seed pool
 *
 * Owns every seed of the run and its usage counters. Seeds are never removed
 * and never deduplicated by content. Each new seed is written to the store as
 * soon as it is added, so a crash of the fuzzer itself loses at most the
 * counter updates since the last flush.
 */
class CCorpusManager {
public:
    /**
     * @param seed_dir Directory with the initial seed files (used only when
     *                 the store holds no corpus yet)
     * @param store    Results store, must outlive the manager
     */
    CCorpusManager(std::string seed_dir, CFuzzStore& store);

    /**
     * Restore the pool from the store, or bootstrap it from the seed
     * directory on a first run.
     *
     * @throws CorpusEmptyError if no seed could be loaded
     * @throws PersistenceError on store failure
     */
    void Load();

    /** Snapshot of the pool; stays valid while seeds are added later. */
    SeedList Seeds() const { return m_seeds; }

    /** Create a seed with zeroed counters, persist it and append it. */
    SeedRef Add(const std::string& data);

    void RecordPicked(const SeedRef& seed);
    void RecordFuzzed(const SeedRef& seed);

    size_t Size() const { return m_seeds.size(); }

private:
    std::string m_seedDir;
    CFuzzStore& m_store;
    SeedList m_seeds;

    /** Read regular files of the seed directory in file name order. */
    bool ReadSeedDir(std::vector<std::string>& contents) const;
};

#endif // STVFUZZ_FUZZER_CORPUS_H
