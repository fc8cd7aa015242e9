// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/mutation_strategy.h>
#include <fuzzer/errors.h>

CRandomSingleStrategy::CRandomSingleStrategy(std::vector<MutationOpRef> ops)
    : m_ops(std::move(ops)) {
    if (m_ops.empty()) {
        throw ConfigurationError("strategy", "mutation strategy needs at least one operation");
    }
}

std::vector<MutationOpRef> CRandomSingleStrategy::Select(CInsecureRand& rng) const {
    return {m_ops[rng.randrange(m_ops.size())]};
}

CStackedStrategy::CStackedStrategy(std::vector<MutationOpRef> ops, size_t min_ops, size_t max_ops)
    : m_ops(std::move(ops)), m_minOps(min_ops), m_maxOps(max_ops) {
    if (m_ops.empty()) {
        throw ConfigurationError("strategy", "mutation strategy needs at least one operation");
    }
    if (m_minOps < 1 || m_minOps > m_maxOps) {
        throw ConfigurationError("strategy", "stacked strategy needs 1 <= min_ops <= max_ops");
    }
}

std::vector<MutationOpRef> CStackedStrategy::Select(CInsecureRand& rng) const {
    size_t count = m_minOps + rng.randrange(m_maxOps - m_minOps + 1);

    std::vector<MutationOpRef> selected;
    selected.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        selected.push_back(m_ops[rng.randrange(m_ops.size())]);
    }
    return selected;
}

std::unique_ptr<CMutationStrategy> MakeMutationStrategy(const std::string& name) {
    if (name == "single") {
        return std::make_unique<CRandomSingleStrategy>();
    }
    if (name == "stacked") {
        return std::make_unique<CStackedStrategy>();
    }
    throw ConfigurationError("strategy", "unknown mutation strategy '" + name + "' (expected single or stacked)");
}
