// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_SCHEDULER_H
#define STVFUZZ_FUZZER_SCHEDULER_H

#include <fuzzer/seed.h>
#include <util/random.h>

#include <cstdint>
#include <memory>
#include <string>

/** Default energy of CRandomScheduler */
static const int64_t DEFAULT_RANDOM_ENERGY = 10;
/** Default power schedule constant of CFastScheduler */
static const double DEFAULT_ENERGY_C = 1.0;
/** Default energy cap of CFastScheduler */
static const int64_t DEFAULT_MAX_ENERGY = 100;

/**
 * Seed selection and energy assignment
 */
class CScheduler {
public:
    virtual ~CScheduler() = default;

    /**
     * Choose the next seed to fuzz.
     * @throws EmptyPoolError if `seeds` is empty
     */
    virtual SeedRef Next(const SeedList& seeds) = 0;

    /**
     * Number of mutation rounds to spend on `seed`, always >= 1.
     * @throws EmptyPoolError if `seed` is null
     */
    virtual int64_t Energy(const SeedRef& seed) const = 0;

    virtual const char* GetName() const = 0;

protected:
    /** Uniform pick shared by both schedulers. */
    static SeedRef PickUniform(const SeedList& seeds, CInsecureRand& rng);
};

/**
 * Uniform selection with a fixed energy.
 */
class CRandomScheduler : public CScheduler {
public:
    /** @throws ConfigurationError if energy < 1 */
    explicit CRandomScheduler(CInsecureRand& rng, int64_t energy = DEFAULT_RANDOM_ENERGY);

    SeedRef Next(const SeedList& seeds) override;
    int64_t Energy(const SeedRef& seed) const override;
    const char* GetName() const override { return "random"; }

private:
    CInsecureRand& m_rng;
    int64_t m_energy;
};

/**
 * Uniform selection with an exponential power schedule:
 *
 *   energy = max(1, min(floor(c * 2^times_picked / (times_fuzzed + 1)), max_energy))
 *
 * Seeds that are picked often but rarely fuzzed get more energy.
 */
class CFastScheduler : public CScheduler {
public:
    /** @throws ConfigurationError if c <= 0 or max_energy < 1 */
    CFastScheduler(CInsecureRand& rng, double c = DEFAULT_ENERGY_C, int64_t max_energy = DEFAULT_MAX_ENERGY);

    SeedRef Next(const SeedList& seeds) override;
    int64_t Energy(const SeedRef& seed) const override;
    const char* GetName() const override { return "fast"; }

private:
    CInsecureRand& m_rng;
    double m_c;
    int64_t m_maxEnergy;
};

/**
 * Build a scheduler by name ("random" | "fast").
 *
 * @param energy     Fixed energy for "random"
 * @param c          Power schedule constant for "fast"
 * @param max_energy Energy cap for "fast"
 * @throws ConfigurationError for an unknown name or invalid parameters
 */
std::unique_ptr<CScheduler> MakeScheduler(const std::string& name, CInsecureRand& rng,
                                          int64_t energy, double c, int64_t max_energy);

#endif // STVFUZZ_FUZZER_SCHEDULER_H
