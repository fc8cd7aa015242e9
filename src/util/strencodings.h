// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_UTIL_STRENCODINGS_H
#define STVFUZZ_UTIL_STRENCODINGS_H

#include <string>
#include <cstdarg>
#include <cstdio>
#include <cstdint>

inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/**
 * Remove leading and trailing whitespace (space, \t, \n, \r, \v, \f)
 */
std::string TrimString(const std::string& str);

/**
 * Parse a base-10 signed integer. The whole string must be consumed;
 * surrounding whitespace, empty input and overflow are rejected.
 */
bool ParseInt64(const std::string& str, int64_t& out);

/**
 * Render bytes for a terminal: printable ASCII as is, \n \t \r as escapes,
 * anything else as \xNN. A backslash is doubled.
 */
std::string EscapeBytes(const std::string& data);

#endif // STVFUZZ_UTIL_STRENCODINGS_H
