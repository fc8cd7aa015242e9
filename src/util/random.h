// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_UTIL_RANDOM_H
#define STVFUZZ_UTIL_RANDOM_H

#include <cstdint>
#include <random>

/**
 * Non-cryptographic random source for mutation and scheduling.
 *
 * A zero seed draws the initial state from std::random_device; any other
 * seed makes the run reproducible.
 */
class CInsecureRand {
public:
    explicit CInsecureRand(uint64_t seed = 0);

    /** Uniform integer in [0, range). range must be > 0. */
    uint64_t randrange(uint64_t range);

    /** The seed actually used (after random_device substitution). */
    uint64_t GetSeed() const { return m_seed; }

private:
    uint64_t m_seed;
    std::mt19937_64 m_rng;
};

#endif // STVFUZZ_UTIL_RANDOM_H
