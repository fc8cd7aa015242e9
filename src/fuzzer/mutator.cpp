// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/mutator.h>
#include <util/logging.h>

CMutator::CMutator(CInsecureRand& rng, std::unique_ptr<CMutationStrategy> strategy)
    : m_rng(rng), m_strategy(std::move(strategy)) {
    if (!m_strategy) {
        m_strategy = std::make_unique<CRandomSingleStrategy>();
    }
}

std::string CMutator::Mutate(const std::string& data) const {
    std::string result = data;
    for (const MutationOpRef& op : m_strategy->Select(m_rng)) {
        result = op->Mutate(result, m_rng);
        LogPrintMutate(DEBUG, "%s -> %zu bytes", op->GetName(), result.size());
    }
    return result;
}
