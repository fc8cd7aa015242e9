// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <db/fuzz_db.h>
#include <db/db_errors.h>
#include <fuzzer/errors.h>
#include <util/logging.h>
#include <util/serialize.h>

#include <leveldb/write_batch.h>

#include <algorithm>
#include <stdexcept>

// Row layout version, first byte of every serialized row
static const uint8_t ROW_VERSION = 1;

static leveldb::WriteOptions SyncWriteOptions() {
    leveldb::WriteOptions writeOpts;
    writeOpts.sync = true;  // Ensure durability before returning
    return writeOpts;
}

CFuzzDB::CFuzzDB() : m_db(nullptr) {}

CFuzzDB::~CFuzzDB() {
    Close();
}

std::string CFuzzDB::MakeIdKey(char prefix, uint64_t id) {
    std::string key(1, prefix);
    for (int shift = 56; shift >= 0; shift -= 8) {
        key.push_back(static_cast<char>((id >> shift) & 0xff));
    }
    return key;
}

uint64_t CFuzzDB::ParseIdKey(const leveldb::Slice& key) {
    if (key.size() != 9) {
        return 0;
    }
    uint64_t id = 0;
    for (size_t i = 1; i < 9; ++i) {
        id = (id << 8) | static_cast<uint8_t>(key[i]);
    }
    return id;
}

std::string CFuzzDB::MakeCrashIndexKey(const CCrashKey& key) {
    CDataStream stream;
    stream.WriteString(key.exception_type);
    stream.WriteString(key.file);
    stream.WriteInt64(key.line);
    return std::string(1, CRASH_KEY_PREFIX) + stream.str();
}

std::string CFuzzDB::SerializeSeed(const CSeedInput& seed) {
    CDataStream stream;
    stream.WriteUint8(ROW_VERSION);
    stream.WriteString(seed.data);
    stream.WriteUint64(seed.metadata.nTimesPicked);
    stream.WriteUint64(seed.metadata.nTimesFuzzed);
    stream.WriteString(seed.created_at);
    return stream.str();
}

SeedRef CFuzzDB::DeserializeSeed(const std::string& value) {
    CDataStream stream(value);
    if (stream.ReadUint8() != ROW_VERSION) {
        throw std::runtime_error("unsupported corpus row version");
    }
    auto seed = std::make_shared<CSeedInput>();
    seed->data = stream.ReadString();
    seed->metadata.nTimesPicked = stream.ReadUint64();
    seed->metadata.nTimesFuzzed = stream.ReadUint64();
    seed->created_at = stream.ReadString();
    return seed;
}

std::string CFuzzDB::SerializeCrash(const CCrashRecord& record) {
    CDataStream stream;
    stream.WriteUint8(ROW_VERSION);
    stream.WriteString(record.info.exception_type);
    stream.WriteString(record.info.exception_message);
    stream.WriteString(record.info.file);
    stream.WriteInt64(record.info.line);
    stream.WriteString(record.info.traceback);
    stream.WriteString(record.data);
    stream.WriteUint64(record.nCount);
    stream.WriteString(record.first_seen_at);
    stream.WriteString(record.last_seen_at);
    return stream.str();
}

CCrashRecord CFuzzDB::DeserializeCrash(const std::string& value) {
    CDataStream stream(value);
    if (stream.ReadUint8() != ROW_VERSION) {
        throw std::runtime_error("unsupported crash row version");
    }
    CCrashRecord record;
    record.info.exception_type = stream.ReadString();
    record.info.exception_message = stream.ReadString();
    record.info.file = stream.ReadString();
    record.info.line = stream.ReadInt64();
    record.info.traceback = stream.ReadString();
    record.data = stream.ReadString();
    record.nCount = stream.ReadUint64();
    record.first_seen_at = stream.ReadString();
    record.last_seen_at = stream.ReadString();
    return record;
}

void CFuzzDB::RequireOpen(const std::string& operation) const {
    if (!m_db) {
        throw PersistenceError(operation, "results database is not open");
    }
}

uint64_t CFuzzDB::FindNextId(char prefix) const {
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));

    // Position on the first key past the prefix range, then step back
    it->Seek(std::string(1, static_cast<char>(prefix + 1)));
    if (it->Valid()) {
        it->Prev();
    } else {
        it->SeekToLast();
    }

    uint64_t next = 1;
    if (it->Valid() && !it->key().empty() && it->key()[0] == prefix) {
        next = ParseIdKey(it->key()) + 1;
    }
    ThrowIfDBError(it->status(), "open");
    return next;
}

void CFuzzDB::Open(const std::string& path, bool create_if_missing) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        return;  // Already open
    }

    m_path = path;

    leveldb::Options options;
    options.create_if_missing = create_if_missing;
    options.write_buffer_size = 4 * 1024 * 1024;  // 4MB write buffer
    options.max_open_files = 100;

    leveldb::DB* db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &db);
    ThrowIfDBError(status, "open");

    m_db.reset(db);
    m_nextSeedId = FindNextId(SEED_PREFIX);
    m_nextCrashId = FindNextId(CRASH_PREFIX);

    LogPrintStore(INFO, "Results database opened: %s", path.c_str());
}

void CFuzzDB::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        m_db.reset();
        LogPrintStore(INFO, "Results database closed: %s", m_path.c_str());
    }
}

bool CFuzzDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

void CFuzzDB::SaveSeed(const CSeedInput& seed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    RequireOpen("save_seed");

    std::string key = MakeIdKey(SEED_PREFIX, m_nextSeedId);
    leveldb::Status status = m_db->Put(SyncWriteOptions(), key, SerializeSeed(seed));
    ThrowIfDBError(status, "save_seed");

    m_nextSeedId++;
}

void CFuzzDB::FlushCorpus(const SeedList& seeds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    RequireOpen("flush_corpus");

    // Delete every stored row and rewrite the snapshot in one batch
    leveldb::WriteBatch batch;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(std::string(1, SEED_PREFIX));
         it->Valid() && !it->key().empty() && it->key()[0] == SEED_PREFIX;
         it->Next()) {
        batch.Delete(it->key());
    }
    ThrowIfDBError(it->status(), "flush_corpus");
    it.reset();

    uint64_t id = 1;
    for (const SeedRef& seed : seeds) {
        batch.Put(MakeIdKey(SEED_PREFIX, id++), SerializeSeed(*seed));
    }

    leveldb::Status status = m_db->Write(SyncWriteOptions(), &batch);
    ThrowIfDBError(status, "flush_corpus");

    m_nextSeedId = id;
    LogPrintStore(DEBUG, "Flushed %zu seeds", seeds.size());
}

SeedList CFuzzDB::LoadSeeds() {
    std::lock_guard<std::mutex> lock(m_mutex);
    RequireOpen("load_seeds");

    SeedList seeds;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(std::string(1, SEED_PREFIX));
         it->Valid() && !it->key().empty() && it->key()[0] == SEED_PREFIX;
         it->Next()) {
        try {
            seeds.push_back(DeserializeSeed(it->value().ToString()));
        } catch (const std::runtime_error& e) {
            throw PersistenceError("load_seeds", "corrupted corpus row " +
                                   std::to_string(ParseIdKey(it->key())) + ": " + e.what());
        }
    }
    ThrowIfDBError(it->status(), "load_seeds");

    return seeds;
}

std::vector<CCrashRecord> CFuzzDB::LoadCrashes() {
    std::lock_guard<std::mutex> lock(m_mutex);
    RequireOpen("load_crashes");

    std::vector<CCrashRecord> crashes;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(std::string(1, CRASH_PREFIX));
         it->Valid() && !it->key().empty() && it->key()[0] == CRASH_PREFIX;
         it->Next()) {
        try {
            CCrashRecord record = DeserializeCrash(it->value().ToString());
            record.nId = ParseIdKey(it->key());
            crashes.push_back(std::move(record));
        } catch (const std::runtime_error& e) {
            throw PersistenceError("load_crashes", "corrupted crash row " +
                                   std::to_string(ParseIdKey(it->key())) + ": " + e.what());
        }
    }
    ThrowIfDBError(it->status(), "load_crashes");

    std::stable_sort(crashes.begin(), crashes.end(),
                     [](const CCrashRecord& a, const CCrashRecord& b) { return a.nCount > b.nCount; });
    return crashes;
}

bool CFuzzDB::UpsertCrash(const CCrashInfo& info, const std::string& data, const std::string& now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    RequireOpen("record_crash");

    std::string indexKey = MakeCrashIndexKey(CCrashKey(info));
    std::string idValue;
    leveldb::Status status = m_db->Get(leveldb::ReadOptions(), indexKey, &idValue);

    if (status.ok()) {
        // Known key: bump count and last_seen_at, keep everything else
        std::string rowKey = std::string(1, CRASH_PREFIX) + idValue;
        std::string rowValue;
        ThrowIfDBError(m_db->Get(leveldb::ReadOptions(), rowKey, &rowValue), "record_crash");

        CCrashRecord record;
        try {
            record = DeserializeCrash(rowValue);
        } catch (const std::runtime_error& e) {
            throw PersistenceError("record_crash", std::string("corrupted crash row: ") + e.what());
        }
        record.nCount++;
        record.last_seen_at = now;

        ThrowIfDBError(m_db->Put(SyncWriteOptions(), rowKey, SerializeCrash(record)), "record_crash");
        return false;
    }

    if (!status.IsNotFound()) {
        ThrowIfDBError(status, "record_crash");
    }

    CCrashRecord record;
    record.info = info;
    record.data = data;
    record.nCount = 1;
    record.first_seen_at = now;
    record.last_seen_at = now;

    std::string rowKey = MakeIdKey(CRASH_PREFIX, m_nextCrashId);

    leveldb::WriteBatch batch;
    batch.Put(rowKey, SerializeCrash(record));
    batch.Put(indexKey, rowKey.substr(1));
    ThrowIfDBError(m_db->Write(SyncWriteOptions(), &batch), "record_crash");

    m_nextCrashId++;
    return true;
}
