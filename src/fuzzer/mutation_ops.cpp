// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/mutation_ops.h>

const std::string& PrintableChars() {
    static const std::string chars =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~"
        " \t\n\r\x0b\x0c";
    return chars;
}

static char RandomPrintable(CInsecureRand& rng) {
    const std::string& chars = PrintableChars();
    return chars[rng.randrange(chars.size())];
}

std::string CRandomizeChar::Mutate(const std::string& data, CInsecureRand& rng) const {
    if (data.empty()) {
        return data;
    }
    std::string result = data;
    size_t idx = rng.randrange(result.size());
    result[idx] = RandomPrintable(rng);
    return result;
}

std::string CDeleteChar::Mutate(const std::string& data, CInsecureRand& rng) const {
    if (data.empty()) {
        return data;
    }
    std::string result = data;
    result.erase(rng.randrange(result.size()), 1);
    return result;
}

std::string CInsertRandomChar::Mutate(const std::string& data, CInsecureRand& rng) const {
    std::string result = data;
    size_t idx = rng.randrange(result.size() + 1);
    result.insert(result.begin() + idx, RandomPrintable(rng));
    return result;
}

std::string CDuplicateChar::Mutate(const std::string& data, CInsecureRand& rng) const {
    if (data.empty()) {
        return data;
    }
    std::string result = data;
    size_t idx = rng.randrange(result.size());
    result.insert(result.begin() + idx, result[idx]);
    return result;
}

std::vector<MutationOpRef> AllMutationOperations() {
    return {
        std::make_shared<CRandomizeChar>(),
        std::make_shared<CDeleteChar>(),
        std::make_shared<CInsertRandomChar>(),
        std::make_shared<CDuplicateChar>(),
    };
}
