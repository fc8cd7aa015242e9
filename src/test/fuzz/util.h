// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_TEST_FUZZ_UTIL_H
#define STVFUZZ_TEST_FUZZ_UTIL_H

#include <algorithm>
#include <cstdint>
#include <string>

/**
 * Fuzz Testing Utilities
 *
 * Splits one libFuzzer input into the structured values a harness needs.
 * Running out of bytes is not an error: integers become 0 and strings
 * become empty.
 */
class FuzzedDataProvider {
private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;

public:
    FuzzedDataProvider(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0) {}

    size_t remaining_bytes() const {
        return size_ > offset_ ? size_ - offset_ : 0;
    }

    uint8_t ConsumeUint8() {
        if (remaining_bytes() < 1) return 0;
        return data_[offset_++];
    }

    uint64_t ConsumeUint64() {
        uint64_t result = 0;
        for (int i = 0; i < 8 && remaining_bytes() > 0; ++i) {
            result = (result << 8) | ConsumeUint8();
        }
        return result;
    }

    bool ConsumeBool() {
        return ConsumeUint8() & 1;
    }

    /**
     * Consume integer in range [min, max]
     */
    template<typename T>
    T ConsumeIntegralInRange(T min, T max) {
        if (min >= max) return min;
        uint64_t range = static_cast<uint64_t>(max) - static_cast<uint64_t>(min);
        uint64_t value = ConsumeUint64();
        if (range != UINT64_MAX) {
            value %= range + 1;
        }
        return static_cast<T>(static_cast<uint64_t>(min) + value);
    }

    std::string ConsumeString(size_t max_length) {
        size_t length = std::min(max_length, remaining_bytes());
        std::string result(reinterpret_cast<const char*>(data_ + offset_), length);
        offset_ += length;
        return result;
    }

    /**
     * Length byte first, then up to that many bytes (capped at max_length)
     */
    std::string ConsumeRandomLengthString(size_t max_length = 1000) {
        if (remaining_bytes() == 0) return "";
        uint8_t length_byte = ConsumeUint8();
        size_t length = length_byte % (std::min(max_length, remaining_bytes()) + 1);
        return ConsumeString(length);
    }

    std::string ConsumeRemainingAsString() {
        return ConsumeString(remaining_bytes());
    }
};

#endif // STVFUZZ_TEST_FUZZ_UTIL_H
