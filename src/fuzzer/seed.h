// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_SEED_H
#define STVFUZZ_FUZZER_SEED_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/** Per-seed usage counters. Only ever incremented. */
struct CSeedMetadata {
    uint64_t nTimesPicked{0};
    uint64_t nTimesFuzzed{0};
};

/**
 * A stored input used as a mutation starting point.
 *
 * Seeds are shared by pointer between the corpus pool, its snapshots and the
 * scheduler, so counter updates made through the corpus manager are visible
 * everywhere.
 */
struct CSeedInput {
    std::string data;
    CSeedMetadata metadata;
    std::string created_at;  // ISO-8601 UTC, set when the seed is first created

    CSeedInput() = default;
    CSeedInput(std::string dataIn, std::string createdAt)
        : data(std::move(dataIn)), created_at(std::move(createdAt)) {}
};

using SeedRef = std::shared_ptr<CSeedInput>;
using SeedList = std::vector<SeedRef>;

#endif // STVFUZZ_FUZZER_SEED_H
