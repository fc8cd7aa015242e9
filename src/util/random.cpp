// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <util/random.h>

static uint64_t ResolveSeed(uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    uint64_t resolved = (static_cast<uint64_t>(rd()) << 32) | rd();
    return resolved != 0 ? resolved : 1;
}

CInsecureRand::CInsecureRand(uint64_t seed)
    : m_seed(ResolveSeed(seed)), m_rng(m_seed) {
}

uint64_t CInsecureRand::randrange(uint64_t range) {
    std::uniform_int_distribution<uint64_t> dist(0, range - 1);
    return dist(m_rng);
}
