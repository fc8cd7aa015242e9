// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <util/error_format.h>
#include <sstream>

std::string CErrorFormatter::FormatForUser(const ErrorMessage& error) {
    std::ostringstream oss;

    // Color coding based on severity
    const char* color = "";
    const char* symbol = "";
    switch (error.severity) {
        case ErrorSeverity::INFO:
            color = "\033[0;36m";  // Cyan
            symbol = "ℹ";
            break;
        case ErrorSeverity::WARNING:
            color = "\033[0;33m";  // Yellow
            symbol = "⚠";
            break;
        case ErrorSeverity::ERROR:
            color = "\033[0;31m";  // Red
            symbol = "✗";
            break;
        case ErrorSeverity::CRITICAL:
            color = "\033[1;31m";  // Bold Red
            symbol = "✗";
            break;
    }
    const char* reset = "\033[0m";

    oss << color << symbol << " " << error.title << reset << std::endl;
    oss << "  " << error.description << std::endl;

    if (!error.cause.empty()) {
        oss << std::endl << "  Cause: " << error.cause << std::endl;
    }

    if (!error.recovery_steps.empty()) {
        oss << std::endl << "  To resolve:" << std::endl;
        for (size_t i = 0; i < error.recovery_steps.size(); ++i) {
            oss << "    " << (i + 1) << ". " << error.recovery_steps[i] << std::endl;
        }
    }

    if (!error.error_code.empty()) {
        oss << std::endl << "  Error code: " << error.error_code << std::endl;
    }

    return oss.str();
}

std::string CErrorFormatter::FormatForLog(const ErrorMessage& error) {
    std::ostringstream oss;

    const char* severity_str = "";
    switch (error.severity) {
        case ErrorSeverity::INFO: severity_str = "INFO"; break;
        case ErrorSeverity::WARNING: severity_str = "WARNING"; break;
        case ErrorSeverity::ERROR: severity_str = "ERROR"; break;
        case ErrorSeverity::CRITICAL: severity_str = "CRITICAL"; break;
    }

    oss << "[" << severity_str << "] " << error.title;
    if (!error.error_code.empty()) {
        oss << " (code: " << error.error_code << ")";
    }
    oss << ": " << error.description;

    if (!error.cause.empty()) {
        oss << " Cause: " << error.cause;
    }

    return oss.str();
}

ErrorMessage CErrorFormatter::DatabaseError(const std::string& operation, const std::string& details) {
    ErrorMessage error(ErrorSeverity::CRITICAL,
                      "Results Store Failure",
                      "Failed to " + operation + ": " + details);
    error.cause = "Database I/O error or corruption";
    error.recovery_steps = {
        "Check disk space and permissions of the runs directory",
        "Verify results.db is not opened by another stvfuzz process",
        "Start a fresh run instead of resuming if the store is corrupted"
    };
    error.error_code = "DB_" + operation;
    return error;
}

ErrorMessage CErrorFormatter::ConfigError(const std::string& option, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Configuration Error",
                      "Invalid configuration for '" + option + "': " + details);
    error.cause = "Invalid or malformed configuration value";
    error.recovery_steps = {
        "Check stvfuzz.conf for syntax errors",
        "Check STVFUZZ_* environment variables",
        "See stvfuzz.conf.example for valid options",
        "Run with --help to see command-line options"
    };
    error.error_code = "CONFIG_" + option;
    return error;
}

ErrorMessage CErrorFormatter::CorpusError(const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Empty Seed Corpus",
                      details);
    error.cause = "No stored seeds and no seed files to bootstrap from";
    error.recovery_steps = {
        "Point seed_dir at a directory containing at least one seed file",
        "Check that the seed files are regular files and readable"
    };
    error.error_code = "CORPUS_EMPTY";
    return error;
}

ErrorMessage CErrorFormatter::ExecutionError(const std::string& details) {
    ErrorMessage error(ErrorSeverity::CRITICAL,
                      "Target Execution Failed",
                      details);
    error.cause = "The harness could not be started";
    error.recovery_steps = {
        "Check that the harness command names an existing executable",
        "Check that project_dir is an existing directory",
        "Run the harness by hand with a seed on stdin"
    };
    error.error_code = "EXEC_SPAWN";
    return error;
}

ErrorMessage CErrorFormatter::InternalError(const std::string& details) {
    ErrorMessage error(ErrorSeverity::CRITICAL,
                      "Internal Error",
                      details);
    error.cause = "An internal invariant was violated";
    error.recovery_steps = {
        "Re-run with --loglevel=debug and report the log"
    };
    error.error_code = "INTERNAL";
    return error;
}
