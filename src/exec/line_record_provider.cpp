// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <exec/line_record_provider.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/system.h>

#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

static std::vector<std::string> SplitTabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            return fields;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
}

bool ParseCoverageRecord(const std::string& line, CCoverageRecord& record) {
    if (line.empty() || line[0] == '#') {
        return false;
    }

    std::vector<std::string> fields = SplitTabs(line);
    if (fields[0] == "L" && fields.size() == 3) {
        record.kind = 'L';
        record.to = 0;
        if (!ParseInt64(fields[2], record.from)) {
            return false;
        }
    } else if (fields[0] == "B" && fields.size() == 4) {
        record.kind = 'B';
        if (!ParseInt64(fields[2], record.from) || !ParseInt64(fields[3], record.to)) {
            return false;
        }
    } else {
        return false;
    }

    if (fields[1].empty()) {
        return false;
    }
    record.path = fields[1];
    return true;
}

static fs::path NormalizePath(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return canonical;
}

CLineRecordProvider::CLineRecordProvider(const std::string& project_root)
    : m_root(NormalizePath(fs::absolute(project_root)).string()) {}

const std::string& CLineRecordProvider::RelativeKey(const std::string& path) {
    auto it = m_pathCache.find(path);
    if (it != m_pathCache.end()) {
        return it->second;
    }

    fs::path p(path);
    if (p.is_relative()) {
        p = fs::path(m_root) / p;
    }
    fs::path rel = NormalizePath(p).lexically_relative(m_root);

    std::string key;
    if (!rel.empty() && *rel.begin() != ".." && rel != ".") {
        key = rel.generic_string();
    }
    return m_pathCache.emplace(path, key).first->second;
}

CCoverageSignal CLineRecordProvider::Observe(const std::string& artifact) {
    CCoverageSignal signal;

    std::error_code ec;
    if (!fs::exists(artifact, ec)) {
        LogPrintExec(DEBUG, "No coverage artifact at %s", artifact.c_str());
        return signal;
    }

    std::string contents;
    if (!ReadFileBytes(artifact, contents)) {
        LogPrintExec(WARN, "Cannot read coverage artifact %s", artifact.c_str());
        return signal;
    }

    std::istringstream stream(contents);
    std::string line;
    size_t skipped = 0;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        CCoverageRecord record;
        if (!ParseCoverageRecord(line, record)) {
            if (!line.empty() && line[0] != '#') {
                ++skipped;
            }
            continue;
        }

        const std::string& key = RelativeKey(record.path);
        if (key.empty()) {
            continue;
        }
        if (record.kind == 'L') {
            signal.lines[key].insert(record.from);
        } else {
            signal.branches[key].insert(BranchArc(record.from, record.to));
        }
    }

    if (skipped > 0) {
        LogPrintExec(DEBUG, "Skipped %zu malformed coverage records in %s", skipped, artifact.c_str());
    }

    fs::remove(artifact, ec);
    if (ec) {
        LogPrintExec(WARN, "Cannot remove coverage artifact %s: %s", artifact.c_str(), ec.message().c_str());
    }
    return signal;
}
