// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_DB_DB_ERRORS_H
#define STVFUZZ_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Database error classification and handling
 *
 * Classifies LevelDB statuses so store failures can be reported with a
 * readable cause before the run is aborted.
 */

/**
 * Database error types
 */
enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected
    IO_ERROR,              // I/O error (disk full, permission denied, etc.)
    NOT_FOUND,             // Key not found (normal for some operations)
    INVALID_ARGUMENT,      // Invalid argument passed to DB operation
    NOT_SUPPORTED,         // Operation not supported
    UNKNOWN                // Unknown error type
};

/**
 * Classify LevelDB status into error type
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Get human-readable error message
 *
 * @param status LevelDB status
 * @param error_type Classified error type
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

/**
 * Throw PersistenceError for a non-ok status
 *
 * @param status LevelDB status (ignored if ok)
 * @param operation Short name of the failing operation, e.g. "flush_corpus"
 */
void ThrowIfDBError(const leveldb::Status& status, const std::string& operation);

#endif // STVFUZZ_DB_DB_ERRORS_H
