// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_TEST_UTIL_SETUP_COMMON_H
#define STVFUZZ_TEST_UTIL_SETUP_COMMON_H

#include <db/fuzz_store.h>
#include <fuzzer/errors.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

/**
 * Unique scratch directory, removed with its contents on destruction
 */
class CTempDir {
public:
    explicit CTempDir(const std::string& tag = "stvfuzz_test") {
        static std::atomic<unsigned> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 (tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~CTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    CTempDir(const CTempDir&) = delete;
    CTempDir& operator=(const CTempDir&) = delete;

    const std::filesystem::path& Path() const { return m_path; }
    std::string Str(const std::string& child = "") const {
        return child.empty() ? m_path.string() : (m_path / child).string();
    }

private:
    std::filesystem::path m_path;
};

inline void WriteTestFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << contents;
}

/**
 * Sets an environment variable for the lifetime of the object
 */
class CScopedEnv {
public:
    CScopedEnv(const std::string& name, const std::string& value) : m_name(name) {
        ::setenv(m_name.c_str(), value.c_str(), 1);
    }
    ~CScopedEnv() { ::unsetenv(m_name.c_str()); }

    CScopedEnv(const CScopedEnv&) = delete;
    CScopedEnv& operator=(const CScopedEnv&) = delete;

private:
    std::string m_name;
};

/**
 * In-memory results store with failure injection
 */
class CMemoryStore : public CFuzzStore {
public:
    SeedList stored;                       // copies, as a real store would hold
    std::map<CCrashKey, CCrashRecord> crashes;
    bool open{true};
    int nFlushCalls{0};
    int nSaveCalls{0};

    /** Throw PersistenceError from SaveSeed once this many saves succeeded (-1 = never) */
    int failSaveAfter{-1};
    bool failFlush{false};

    void SaveSeed(const CSeedInput& seed) override {
        if (!open) throw PersistenceError("save seed", "store is closed");
        if (failSaveAfter >= 0 && nSaveCalls >= failSaveAfter) {
            throw PersistenceError("save seed", "injected write failure");
        }
        ++nSaveCalls;
        stored.push_back(std::make_shared<CSeedInput>(seed));
    }

    void FlushCorpus(const SeedList& seeds) override {
        ++nFlushCalls;
        if (!open) throw PersistenceError("flush corpus", "store is closed");
        if (failFlush) throw PersistenceError("flush corpus", "injected write failure");
        stored.clear();
        for (const auto& seed : seeds) {
            stored.push_back(std::make_shared<CSeedInput>(*seed));
        }
    }

    SeedList LoadSeeds() override {
        SeedList result;
        for (const auto& seed : stored) {
            result.push_back(std::make_shared<CSeedInput>(*seed));
        }
        return result;
    }

    std::vector<CCrashRecord> LoadCrashes() override {
        std::vector<CCrashRecord> result;
        for (const auto& entry : crashes) {
            result.push_back(entry.second);
        }
        return result;
    }

    void Close() override { open = false; }
    bool IsOpen() const override { return open; }

protected:
    bool UpsertCrash(const CCrashInfo& info, const std::string& data, const std::string& now) override {
        CCrashKey key(info);
        auto it = crashes.find(key);
        if (it != crashes.end()) {
            ++it->second.nCount;
            it->second.last_seen_at = now;
            return false;
        }
        CCrashRecord record;
        record.nId = crashes.size() + 1;
        record.info = info;
        record.data = data;
        record.first_seen_at = record.last_seen_at = now;
        crashes.emplace(key, record);
        return true;
    }
};

#endif // STVFUZZ_TEST_UTIL_SETUP_COMMON_H
