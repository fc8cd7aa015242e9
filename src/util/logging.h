// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_UTIL_LOGGING_H
#define STVFUZZ_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Bitcoin Core-style logging system
 *
 * Features:
 * - Log categories (CORPUS, SCHED, CRASH, etc.)
 * - Log levels (ERROR, WARN, INFO, DEBUG)
 * - Thread-safe logging
 * - File and console output
 * - Log rotation
 */

/**
 * Log categories
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    CORPUS = (1 << 0),        // Seed pool load/add
    MUTATE = (1 << 1),        // Mutation operations and strategies
    SCHED = (1 << 2),         // Seed selection and energy
    FEEDBACK = (1 << 3),      // Coverage novelty decisions
    CRASH = (1 << 4),         // Crash parsing and dedup
    STORE = (1 << 5),         // Persistent store
    EXEC = (1 << 6),          // Target execution and coverage extraction
    ENGINE = (1 << 7),        // Fuzzing loop
    ALL = 0xFFFFFFFF          // All categories
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with Windows ERROR macro
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/**
 * Parse a level name ("error", "warn", "info", "debug")
 * @return true if the name was recognised
 */
bool ParseLogLevel(const std::string& name, LogLevel& level);

/**
 * Parse a category name ("corpus", "exec", ..., "all")
 * @return true if the name was recognised
 */
bool ParseLogCategory(const std::string& name, LogCategory& category);

/**
 * Logging configuration
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    // Enable/disable categories
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    // Set log level
    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    // Log rotation
    size_t GetMaxLogSize() const;
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig();
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    size_t m_maxLogSize{10 * 1024 * 1024};  // 10 MB default
    size_t m_maxLogFiles{10};
    mutable std::mutex m_configMutex;
};

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    // Open the configured log file (if any). Safe to call more than once.
    bool Initialize();

    // Shutdown logging system
    void Shutdown();

    // Log a message
    void Log(LogCategory category, LogLevel level, const std::string& message);

    // Convenience methods (Bitcoin Core style)
    void LogPrint(LogCategory category, LogLevel level, const std::string& str);
    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

private:
    CLogger();
    ~CLogger();

    // Rotate log file if needed
    void RotateLogIfNeeded();

    // Write to file
    void WriteToFile(const std::string& message);

    // Write to console
    void WriteToConsole(LogLevel level, const std::string& message);

    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
    size_t m_currentLogSize{0};
};

// Convenience macros (Bitcoin Core style)
// Note: Using LVL_ prefix internally to avoid Windows ERROR macro conflict
#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

// Category-specific macros (with format string)
#define LogPrintCorpus(level, format, ...) LogPrintf(CORPUS, level, format, ##__VA_ARGS__)
#define LogPrintMutate(level, format, ...) LogPrintf(MUTATE, level, format, ##__VA_ARGS__)
#define LogPrintSched(level, format, ...) LogPrintf(SCHED, level, format, ##__VA_ARGS__)
#define LogPrintFeedback(level, format, ...) LogPrintf(FEEDBACK, level, format, ##__VA_ARGS__)
#define LogPrintCrash(level, format, ...) LogPrintf(CRASH, level, format, ##__VA_ARGS__)
#define LogPrintStore(level, format, ...) LogPrintf(STORE, level, format, ##__VA_ARGS__)
#define LogPrintExec(level, format, ...) LogPrintf(EXEC, level, format, ##__VA_ARGS__)
#define LogPrintEngine(level, format, ...) LogPrintf(ENGINE, level, format, ##__VA_ARGS__)

#endif // STVFUZZ_UTIL_LOGGING_H
