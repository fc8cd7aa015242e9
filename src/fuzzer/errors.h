// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_ERRORS_H
#define STVFUZZ_FUZZER_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Fatal fuzzer errors. Each one ends the run; the engine still flushes the
 * corpus before the exception leaves CFuzzingEngine::Run().
 */
class FuzzerError : public std::runtime_error {
public:
    explicit FuzzerError(const std::string& what) : std::runtime_error(what) {}
};

/** Unknown scheduler/strategy name or invalid option value. */
class ConfigurationError : public FuzzerError {
public:
    ConfigurationError(const std::string& option, const std::string& what)
        : FuzzerError(what), m_option(option) {}

    const std::string& GetOption() const { return m_option; }

private:
    std::string m_option;
};

/** No seeds after loading the store and bootstrapping from the seed directory. */
class CorpusEmptyError : public FuzzerError {
public:
    explicit CorpusEmptyError(const std::string& what) : FuzzerError(what) {}
};

/** Scheduler called with zero seeds. */
class EmptyPoolError : public FuzzerError {
public:
    explicit EmptyPoolError(const std::string& what) : FuzzerError(what) {}
};

/** Any read or write failure of the results store. */
class PersistenceError : public FuzzerError {
public:
    PersistenceError(const std::string& operation, const std::string& what)
        : FuzzerError(operation + ": " + what), m_operation(operation) {}

    const std::string& GetOperation() const { return m_operation; }

private:
    std::string m_operation;
};

/** The harness process could not be started. */
class ExecutionError : public FuzzerError {
public:
    explicit ExecutionError(const std::string& what) : FuzzerError(what) {}
};

#endif // STVFUZZ_FUZZER_ERRORS_H
