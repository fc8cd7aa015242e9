// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_MUTATION_STRATEGY_H
#define STVFUZZ_FUZZER_MUTATION_STRATEGY_H

#include <fuzzer/mutation_ops.h>
#include <util/random.h>

#include <memory>
#include <string>
#include <vector>

/**
 * Decides which operations make up one mutation round.
 */
class CMutationStrategy {
public:
    virtual ~CMutationStrategy() = default;

    /** Operations to apply, in order. */
    virtual std::vector<MutationOpRef> Select(CInsecureRand& rng) const = 0;

    virtual const char* GetName() const = 0;
};

/**
 * Exactly one operation per round, drawn uniformly from the configured set.
 */
class CRandomSingleStrategy : public CMutationStrategy {
public:
    /** @throws ConfigurationError if `ops` is empty */
    explicit CRandomSingleStrategy(std::vector<MutationOpRef> ops = AllMutationOperations());

    std::vector<MutationOpRef> Select(CInsecureRand& rng) const override;
    const char* GetName() const override { return "single"; }

private:
    std::vector<MutationOpRef> m_ops;
};

/**
 * Between min_ops and max_ops operations per round, each drawn uniformly
 * with replacement (havoc-style stacking).
 */
class CStackedStrategy : public CMutationStrategy {
public:
    static constexpr size_t DEFAULT_MIN_OPS = 2;
    static constexpr size_t DEFAULT_MAX_OPS = 5;

    /** @throws ConfigurationError if `ops` is empty or the bounds are invalid */
    CStackedStrategy(std::vector<MutationOpRef> ops = AllMutationOperations(),
                     size_t min_ops = DEFAULT_MIN_OPS, size_t max_ops = DEFAULT_MAX_OPS);

    std::vector<MutationOpRef> Select(CInsecureRand& rng) const override;
    const char* GetName() const override { return "stacked"; }

private:
    std::vector<MutationOpRef> m_ops;
    size_t m_minOps;
    size_t m_maxOps;
};

/**
 * Build a strategy by name ("single" | "stacked").
 * @throws ConfigurationError for any other name
 */
std::unique_ptr<CMutationStrategy> MakeMutationStrategy(const std::string& name);

#endif // STVFUZZ_FUZZER_MUTATION_STRATEGY_H
