// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/corpus.h>
#include <fuzzer/errors.h>
#include <util/logging.h>
#include <util/system.h>
#include <util/time.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

CCorpusManager::CCorpusManager(std::string seed_dir, CFuzzStore& store)
    : m_seedDir(std::move(seed_dir)), m_store(store) {}

bool CCorpusManager::ReadSeedDir(std::vector<std::string>& contents) const {
    std::error_code ec;
    if (!fs::is_directory(m_seedDir, ec)) {
        return false;
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(m_seedDir, ec);
    if (ec) {
        return false;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return false;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    for (const fs::path& file : files) {
        std::string data;
        if (!ReadFileBytes(file.string(), data)) {
            LogPrintCorpus(WARN, "Skipping unreadable seed file %s", file.string().c_str());
            continue;
        }
        contents.push_back(std::move(data));
    }
    return true;
}

void CCorpusManager::Load() {
    m_seeds = m_store.LoadSeeds();
    if (!m_seeds.empty()) {
        LogPrintCorpus(INFO, "Restored %zu seeds from store", m_seeds.size());
        return;
    }

    std::vector<std::string> contents;
    if (!ReadSeedDir(contents)) {
        throw CorpusEmptyError("seed directory '" + m_seedDir + "' does not exist or cannot be read");
    }

    for (std::string& data : contents) {
        Add(data);
    }

    if (m_seeds.empty()) {
        throw CorpusEmptyError("no seeds found in '" + m_seedDir + "'");
    }
    LogPrintCorpus(INFO, "Loaded %zu initial seeds from %s", m_seeds.size(), m_seedDir.c_str());
}

SeedRef CCorpusManager::Add(const std::string& data) {
    auto seed = std::make_shared<CSeedInput>(data, FormatISO8601DateTime(GetTime()));
    m_store.SaveSeed(*seed);
    m_seeds.push_back(seed);
    LogPrintCorpus(DEBUG, "Added seed #%zu (%zu bytes)", m_seeds.size(), data.size());
    return seed;
}

void CCorpusManager::RecordPicked(const SeedRef& seed) {
    ++seed->metadata.nTimesPicked;
}

void CCorpusManager::RecordFuzzed(const SeedRef& seed) {
    ++seed->metadata.nTimesFuzzed;
}
