// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <util/strencodings.h>

#include <cerrno>
#include <cstdlib>

static const char* const WHITESPACE = " \t\n\r\x0b\x0c";

std::string TrimString(const std::string& str) {
    size_t start = str.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(start, end - start + 1);
}

bool ParseInt64(const std::string& str, int64_t& out) {
    if (str.empty() || str.find_first_of(WHITESPACE) != std::string::npos) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str.c_str(), &end, 10);
    if (errno == ERANGE || end != str.c_str() + str.size()) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

std::string EscapeBytes(const std::string& data) {
    std::string result;
    result.reserve(data.size());

    for (unsigned char c : data) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            case '\\': result += "\\\\"; break;
            default:
                if (c >= 0x20 && c < 0x7f) {
                    result.push_back(static_cast<char>(c));
                } else {
                    result += strprintf("\\x%02x", c);
                }
        }
    }
    return result;
}
