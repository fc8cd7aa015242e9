// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * User-Friendly Error Formatting
 *
 * Provides structured, user-friendly error messages with recovery guidance
 */

#ifndef STVFUZZ_UTIL_ERROR_FORMAT_H
#define STVFUZZ_UTIL_ERROR_FORMAT_H

#include <string>
#include <vector>

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,      // Informational message
    WARNING,   // Warning - operation may have issues
    ERROR,     // Error - operation failed but recoverable
    CRITICAL   // Critical - run aborted
};

/**
 * Structured error message with context and recovery guidance
 */
struct ErrorMessage {
    ErrorSeverity severity;
    std::string title;
    std::string description;
    std::string cause;
    std::vector<std::string> recovery_steps;
    std::string error_code;  // For technical reference

    ErrorMessage(ErrorSeverity sev, const std::string& t, const std::string& desc)
        : severity(sev), title(t), description(desc) {}
};

/**
 * Format error message for user display
 */
class CErrorFormatter {
public:
    /**
     * Format error for console output (user-friendly)
     */
    static std::string FormatForUser(const ErrorMessage& error);

    /**
     * Format error for log output (technical)
     */
    static std::string FormatForLog(const ErrorMessage& error);

    /**
     * Create database error message
     */
    static ErrorMessage DatabaseError(const std::string& operation, const std::string& details);

    /**
     * Create configuration error message
     */
    static ErrorMessage ConfigError(const std::string& option, const std::string& details);

    /**
     * Create seed corpus error message
     */
    static ErrorMessage CorpusError(const std::string& details);

    /**
     * Create target execution error message
     */
    static ErrorMessage ExecutionError(const std::string& details);

    /**
     * Create internal invariant error message
     */
    static ErrorMessage InternalError(const std::string& details);
};

#endif // STVFUZZ_UTIL_ERROR_FORMAT_H
