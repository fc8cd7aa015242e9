// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/scheduler.h>
#include <fuzzer/errors.h>
#include <util/logging.h>

#include <cmath>

SeedRef CScheduler::PickUniform(const SeedList& seeds, CInsecureRand& rng) {
    if (seeds.empty()) {
        throw EmptyPoolError("cannot schedule from an empty seed pool");
    }
    return seeds[rng.randrange(seeds.size())];
}

CRandomScheduler::CRandomScheduler(CInsecureRand& rng, int64_t energy)
    : m_rng(rng), m_energy(energy) {
    if (m_energy < 1) {
        throw ConfigurationError("energy", "energy must be at least 1");
    }
}

SeedRef CRandomScheduler::Next(const SeedList& seeds) {
    return PickUniform(seeds, m_rng);
}

int64_t CRandomScheduler::Energy(const SeedRef& seed) const {
    if (!seed) {
        throw EmptyPoolError("no seed to assign energy to");
    }
    return m_energy;
}

CFastScheduler::CFastScheduler(CInsecureRand& rng, double c, int64_t max_energy)
    : m_rng(rng), m_c(c), m_maxEnergy(max_energy) {
    if (!(m_c > 0.0) || !std::isfinite(m_c)) {
        throw ConfigurationError("energy_c", "energy_c must be a positive number");
    }
    if (m_maxEnergy < 1) {
        throw ConfigurationError("max_energy", "max_energy must be at least 1");
    }
}

SeedRef CFastScheduler::Next(const SeedList& seeds) {
    return PickUniform(seeds, m_rng);
}

int64_t CFastScheduler::Energy(const SeedRef& seed) const {
    if (!seed) {
        throw EmptyPoolError("no seed to assign energy to");
    }

    // ldexp saturates to +inf for large exponents, which the cap absorbs
    const int exponent = seed->metadata.nTimesPicked > 4096
        ? 4096 : static_cast<int>(seed->metadata.nTimesPicked);
    double raw = std::ldexp(m_c, exponent) / (static_cast<double>(seed->metadata.nTimesFuzzed) + 1.0);

    int64_t energy;
    if (!(raw < static_cast<double>(m_maxEnergy))) {
        energy = m_maxEnergy;
    } else {
        energy = static_cast<int64_t>(std::floor(raw));
    }
    if (energy < 1) {
        energy = 1;
    }

    LogPrintSched(DEBUG, "energy=%lld (picked=%llu fuzzed=%llu)",
                  static_cast<long long>(energy),
                  static_cast<unsigned long long>(seed->metadata.nTimesPicked),
                  static_cast<unsigned long long>(seed->metadata.nTimesFuzzed));
    return energy;
}

std::unique_ptr<CScheduler> MakeScheduler(const std::string& name, CInsecureRand& rng,
                                          int64_t energy, double c, int64_t max_energy) {
    if (name == "random") {
        return std::make_unique<CRandomScheduler>(rng, energy);
    }
    if (name == "fast") {
        return std::make_unique<CFastScheduler>(rng, c, max_energy);
    }
    throw ConfigurationError("scheduler", "unknown scheduler '" + name + "' (expected random or fast)");
}
