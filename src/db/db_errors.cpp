// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <db/db_errors.h>
#include <fuzzer/errors.h>
#include <util/logging.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }

    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }

    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }

    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }

    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }

    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }

    return DBErrorType::UNKNOWN;
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    std::string message;

    switch (error_type) {
        case DBErrorType::OK:
            message = "Success";
            break;

        case DBErrorType::CORRUPTION:
            message = "Database corruption detected: " + status.ToString();
            message += " (start a fresh run directory)";
            break;

        case DBErrorType::IO_ERROR:
            message = "I/O error: " + status.ToString();
            message += " (check disk space and permissions)";
            break;

        case DBErrorType::NOT_FOUND:
            message = "Key not found: " + status.ToString();
            break;

        case DBErrorType::INVALID_ARGUMENT:
            message = "Invalid argument: " + status.ToString();
            break;

        case DBErrorType::NOT_SUPPORTED:
            message = "Operation not supported: " + status.ToString();
            break;

        case DBErrorType::UNKNOWN:
            message = "Unknown database error: " + status.ToString();
            break;
    }

    return message;
}

void ThrowIfDBError(const leveldb::Status& status, const std::string& operation) {
    if (status.ok()) {
        return;
    }

    std::string message = GetDBErrorMessage(status, ClassifyDBError(status));
    LogPrintStore(ERROR, "%s failed: %s", operation.c_str(), message.c_str());
    throw PersistenceError(operation, message);
}
