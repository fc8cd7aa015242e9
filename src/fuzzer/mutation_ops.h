// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_MUTATION_OPS_H
#define STVFUZZ_FUZZER_MUTATION_OPS_H

#include <util/random.h>

#include <memory>
#include <string>
#include <vector>

/**
 * Characters a mutation may introduce: digits, ASCII letters, ASCII
 * punctuation and " \t\n\r\x0b\x0c" (100 characters).
 */
const std::string& PrintableChars();

/**
 * A primitive, stateless input transformation.
 *
 * Mutate() must not modify anything but its return value; randomness comes
 * only from the supplied source.
 */
class CMutationOperation {
public:
    virtual ~CMutationOperation() = default;

    virtual std::string Mutate(const std::string& data, CInsecureRand& rng) const = 0;

    /** Stable name for logs */
    virtual const char* GetName() const = 0;
};

using MutationOpRef = std::shared_ptr<const CMutationOperation>;

/** Replace one random unit with a random printable character. Empty input is returned unchanged. */
class CRandomizeChar : public CMutationOperation {
public:
    std::string Mutate(const std::string& data, CInsecureRand& rng) const override;
    const char* GetName() const override { return "randomize_char"; }
};

/** Remove one random unit. Empty input is returned unchanged. */
class CDeleteChar : public CMutationOperation {
public:
    std::string Mutate(const std::string& data, CInsecureRand& rng) const override;
    const char* GetName() const override { return "delete_char"; }
};

/** Insert a random printable character at a random point in [0, size]. */
class CInsertRandomChar : public CMutationOperation {
public:
    std::string Mutate(const std::string& data, CInsecureRand& rng) const override;
    const char* GetName() const override { return "insert_random_char"; }
};

/** Duplicate one random unit in place. Empty input is returned unchanged. */
class CDuplicateChar : public CMutationOperation {
public:
    std::string Mutate(const std::string& data, CInsecureRand& rng) const override;
    const char* GetName() const override { return "duplicate_char"; }
};

/** The four built-in operations, in a fixed order. */
std::vector<MutationOpRef> AllMutationOperations();

#endif // STVFUZZ_FUZZER_MUTATION_OPS_H
