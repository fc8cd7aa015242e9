// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_MUTATOR_H
#define STVFUZZ_FUZZER_MUTATOR_H

#include <fuzzer/mutation_strategy.h>
#include <util/random.h>

#include <memory>
#include <string>

/**
 * Applies the strategy's operations left to right, each one consuming the
 * previous one's output.
 */
class CMutator {
public:
    /** A null strategy means CRandomSingleStrategy over all operations. */
    explicit CMutator(CInsecureRand& rng, std::unique_ptr<CMutationStrategy> strategy = nullptr);

    std::string Mutate(const std::string& data) const;

    const CMutationStrategy& GetStrategy() const { return *m_strategy; }

private:
    CInsecureRand& m_rng;
    std::unique_ptr<CMutationStrategy> m_strategy;
};

#endif // STVFUZZ_FUZZER_MUTATOR_H
