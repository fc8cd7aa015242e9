// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Fuzz target: mutation operations
 *
 * Every operation changes the length by at most one unit and only ever
 * introduces printable characters.
 */

#include <test/fuzz/fuzz.h>
#include <test/fuzz/util.h>

#include <fuzzer/mutation_ops.h>
#include <fuzzer/mutation_strategy.h>
#include <fuzzer/mutator.h>
#include <util/random.h>

#include <cassert>
#include <memory>
#include <string>

static size_t CountOutsideCharset(const std::string& data) {
    size_t count = 0;
    for (char c : data) {
        if (PrintableChars().find(c) == std::string::npos) {
            ++count;
        }
    }
    return count;
}

FUZZ_TARGET(mutation)
{
    InitializeFuzzEnvironment();
    FuzzedDataProvider fuzzed_data(data, size);

    CInsecureRand rng(fuzzed_data.ConsumeIntegralInRange<uint64_t>(1, UINT64_MAX));
    bool stacked = fuzzed_data.ConsumeBool();
    std::string input = fuzzed_data.ConsumeRemainingAsString();
    const size_t foreign = CountOutsideCharset(input);

    for (const MutationOpRef& op : AllMutationOperations()) {
        std::string out = op->Mutate(input, rng);
        assert(out.size() + 1 >= input.size());
        assert(out.size() <= input.size() + 1);
        // Duplicating a foreign character is the only way to add one
        assert(CountOutsideCharset(out) <= foreign + 1);
    }

    CMutator mutator(rng, MakeMutationStrategy(stacked ? "stacked" : "single"));
    std::string out = mutator.Mutate(input);
    const size_t max_ops = stacked ? CStackedStrategy::DEFAULT_MAX_OPS : 1;
    assert(out.size() <= input.size() + max_ops);
    assert(out.size() + max_ops >= input.size());
}
