// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/crash.h>
#include <util/strencodings.h>

#include <cctype>
#include <vector>

static std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

/**
 * Match one traceback frame: optional leading whitespace, then
 * File "<path>", line <n>. The path runs to the last '", line ' that is
 * followed by a digit, so quotes inside the path are kept.
 */
static bool ParseFrameLine(const std::string& line, std::string& file, int64_t& line_number) {
    static const std::string FRAME_PREFIX = "File \"";
    static const std::string LINE_MARKER = "\", line ";

    size_t begin = line.find_first_not_of(" \t\n\r\f\v");
    if (begin == std::string::npos || line.compare(begin, FRAME_PREFIX.size(), FRAME_PREFIX) != 0) {
        return false;
    }
    const size_t path_begin = begin + FRAME_PREFIX.size();

    size_t marker = line.rfind(LINE_MARKER);
    while (marker != std::string::npos && marker > path_begin) {
        size_t digits_begin = marker + LINE_MARKER.size();
        size_t digits_end = digits_begin;
        while (digits_end < line.size() && std::isdigit(static_cast<unsigned char>(line[digits_end]))) {
            ++digits_end;
        }
        if (digits_end > digits_begin) {
            int64_t value = 0;
            if (!ParseInt64(line.substr(digits_begin, digits_end - digits_begin), value)) {
                return false;  // Unrepresentable line number
            }
            file = line.substr(path_begin, marker - path_begin);
            line_number = value;
            return true;
        }
        marker = line.rfind(LINE_MARKER, marker - 1);
    }
    return false;
}

bool HasCrashSentinel(const std::string& stderr_text) {
    return stderr_text.find(CRASH_SENTINEL) != std::string::npos;
}

CCrashInfo ParseCrash(const std::string& stderr_text) {
    CCrashInfo info;

    std::string text = TrimString(stderr_text);
    if (text.compare(0, std::char_traits<char>::length(CRASH_SENTINEL), CRASH_SENTINEL) == 0) {
        text = text.substr(std::char_traits<char>::length(CRASH_SENTINEL));
    }
    text = TrimString(text);
    info.traceback = text;

    if (text.empty()) {
        return info;
    }

    std::vector<std::string> lines = SplitLines(text);

    // "ExceptionType: message" or just "ExceptionType"
    std::string last_line = TrimString(lines.back());
    size_t colon = last_line.find(':');
    if (colon != std::string::npos) {
        info.exception_type = TrimString(last_line.substr(0, colon));
        info.exception_message = TrimString(last_line.substr(colon + 1));
    } else {
        info.exception_type = last_line;
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string file;
        int64_t line_number = 0;
        if (ParseFrameLine(*it, file, line_number)) {
            info.file = file;
            info.line = line_number;
            break;
        }
    }

    return info;
}
