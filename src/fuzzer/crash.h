// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_CRASH_H
#define STVFUZZ_FUZZER_CRASH_H

#include <cstdint>
#include <string>
#include <tuple>

/** Marker a target writes to stderr before the traceback of a caught exception. */
static const char* const CRASH_SENTINEL = "ERR:";

/** File/line placeholders when no traceback frame can be found. */
static const char* const CRASH_UNKNOWN_FILE = "unknown";
static const int64_t CRASH_UNKNOWN_LINE = -1;

/**
 * Structured fields extracted from a target's crash output
 */
struct CCrashInfo {
    std::string exception_type;
    std::string exception_message;
    std::string file{CRASH_UNKNOWN_FILE};
    int64_t line{CRASH_UNKNOWN_LINE};
    std::string traceback;
};

/**
 * Deduplication key: (exception_type, file, line)
 */
struct CCrashKey {
    std::string exception_type;
    std::string file;
    int64_t line{CRASH_UNKNOWN_LINE};

    CCrashKey() = default;
    explicit CCrashKey(const CCrashInfo& info)
        : exception_type(info.exception_type), file(info.file), line(info.line) {}

    bool operator<(const CCrashKey& other) const {
        return std::tie(exception_type, file, line) <
               std::tie(other.exception_type, other.file, other.line);
    }
    bool operator==(const CCrashKey& other) const {
        return exception_type == other.exception_type && file == other.file && line == other.line;
    }
};

/**
 * A persisted, deduplicated crash
 */
struct CCrashRecord {
    uint64_t nId{0};
    CCrashInfo info;
    std::string data;          // Input that first triggered the crash
    uint64_t nCount{1};
    std::string first_seen_at;
    std::string last_seen_at;
};

/** True if the stderr text carries the crash sentinel anywhere. */
bool HasCrashSentinel(const std::string& stderr_text);

/**
 * Parse a crash report written by a target.
 *
 * A leading sentinel is stripped and the trimmed remainder is the
 * traceback; output before a later sentinel stays in the traceback. The last line gives "Type: message"; the deepest
 * 'File "<path>", line <n>' frame gives file and line. Never throws:
 * unparseable input yields file "unknown" and line -1.
 */
CCrashInfo ParseCrash(const std::string& stderr_text);

#endif // STVFUZZ_FUZZER_CRASH_H
