// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_DB_FUZZ_DB_H
#define STVFUZZ_DB_FUZZ_DB_H

/**
 * LevelDB results store (results.db inside a run directory)
 *
 * Key formats:
 *   'c' + 8-byte big-endian id  -> corpus row
 *   'x' + 8-byte big-endian id  -> crash row
 *   'k' + serialized crash key  -> 8-byte big-endian crash id
 *
 * Big-endian ids make LevelDB's key order equal to insertion order.
 * Every write is synced; multi-key updates go through one WriteBatch.
 */

#include <db/fuzz_store.h>
#include <leveldb/db.h>

#include <memory>
#include <mutex>
#include <string>

class CFuzzDB : public CFuzzStore {
private:
    /** LevelDB database handle */
    std::unique_ptr<leveldb::DB> m_db;

    /** Mutex for thread safety */
    mutable std::mutex m_mutex;

    /** Database path */
    std::string m_path;

    /** Next ids to assign (one past the highest stored id) */
    uint64_t m_nextSeedId{1};
    uint64_t m_nextCrashId{1};

    static constexpr char SEED_PREFIX = 'c';
    static constexpr char CRASH_PREFIX = 'x';
    static constexpr char CRASH_KEY_PREFIX = 'k';

    static std::string MakeIdKey(char prefix, uint64_t id);
    static uint64_t ParseIdKey(const leveldb::Slice& key);
    static std::string MakeCrashIndexKey(const CCrashKey& key);

    static std::string SerializeSeed(const CSeedInput& seed);
    static SeedRef DeserializeSeed(const std::string& value);
    static std::string SerializeCrash(const CCrashRecord& record);
    static CCrashRecord DeserializeCrash(const std::string& value);

    /** One past the highest id stored under `prefix` */
    uint64_t FindNextId(char prefix) const;

    void RequireOpen(const std::string& operation) const;

protected:
    bool UpsertCrash(const CCrashInfo& info, const std::string& data, const std::string& now) override;

public:
    CFuzzDB();
    ~CFuzzDB() override;

    // Prevent copying
    CFuzzDB(const CFuzzDB&) = delete;
    CFuzzDB& operator=(const CFuzzDB&) = delete;

    /**
     * Open the results database
     *
     * @param path Directory path for database files
     * @param create_if_missing false to only open an existing store (read-only tools)
     * @throws PersistenceError if the database cannot be opened
     */
    void Open(const std::string& path, bool create_if_missing = true);

    void Close() override;
    bool IsOpen() const override;

    void SaveSeed(const CSeedInput& seed) override;
    void FlushCorpus(const SeedList& seeds) override;
    SeedList LoadSeeds() override;
    std::vector<CCrashRecord> LoadCrashes() override;

    const std::string& GetPath() const { return m_path; }
};

#endif // STVFUZZ_DB_FUZZ_DB_H
