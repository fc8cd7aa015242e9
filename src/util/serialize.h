// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_UTIL_SERIALIZE_H
#define STVFUZZ_UTIL_SERIALIZE_H

#include <vector>
#include <string>
#include <cstring>
#include <cstdint>
#include <stdexcept>

/**
 * CDataStream - Binary serialization buffer for store rows
 *
 * Little-endian fixed-width integers and CompactSize-prefixed strings.
 * Reads past the end throw std::runtime_error.
 */
class CDataStream {
private:
    std::vector<uint8_t> data;
    size_t read_pos;

public:
    CDataStream() : read_pos(0) {}

    explicit CDataStream(const std::string& bytes)
        : data(bytes.begin(), bytes.end()), read_pos(0) {}

    size_t remaining() const {
        return read_pos < data.size() ? data.size() - read_pos : 0;
    }

    std::string str() const { return std::string(data.begin(), data.end()); }

    // --- Write Operations ---

    void write(const uint8_t* src, size_t len) {
        data.insert(data.end(), src, src + len);
    }

    void WriteUint8(uint8_t value) {
        data.push_back(value);
    }

    void WriteUint16(uint16_t value) {
        uint8_t buf[2];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        write(buf, 2);
    }

    void WriteUint32(uint32_t value) {
        uint8_t buf[4];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        buf[2] = (value >> 16) & 0xff;
        buf[3] = (value >> 24) & 0xff;
        write(buf, 4);
    }

    void WriteUint64(uint64_t value) {
        uint8_t buf[8];
        for (int i = 0; i < 8; i++) {
            buf[i] = (value >> (i * 8)) & 0xff;
        }
        write(buf, 8);
    }

    void WriteInt64(int64_t value) {
        WriteUint64(static_cast<uint64_t>(value));
    }

    void WriteCompactSize(uint64_t value) {
        if (value < 253) {
            WriteUint8(static_cast<uint8_t>(value));
        } else if (value <= 0xFFFF) {
            WriteUint8(253);
            WriteUint16(static_cast<uint16_t>(value));
        } else if (value <= 0xFFFFFFFF) {
            WriteUint8(254);
            WriteUint32(static_cast<uint32_t>(value));
        } else {
            WriteUint8(255);
            WriteUint64(value);
        }
    }

    void WriteString(const std::string& str) {
        WriteCompactSize(str.size());
        write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }

    // --- Read Operations ---

    void read(uint8_t* dst, size_t len) {
        if (len > remaining()) {
            throw std::runtime_error("CDataStream: read past end");
        }
        if (len > 0) {
            memcpy(dst, &data[read_pos], len);
        }
        read_pos += len;
    }

    uint8_t ReadUint8() {
        if (read_pos >= data.size()) {
            throw std::runtime_error("CDataStream: read past end");
        }
        return data[read_pos++];
    }

    uint16_t ReadUint16() {
        uint8_t buf[2];
        read(buf, 2);
        return static_cast<uint16_t>(buf[0]) |
               (static_cast<uint16_t>(buf[1]) << 8);
    }

    uint32_t ReadUint32() {
        uint8_t buf[4];
        read(buf, 4);
        return static_cast<uint32_t>(buf[0]) |
               (static_cast<uint32_t>(buf[1]) << 8) |
               (static_cast<uint32_t>(buf[2]) << 16) |
               (static_cast<uint32_t>(buf[3]) << 24);
    }

    uint64_t ReadUint64() {
        uint8_t buf[8];
        read(buf, 8);
        uint64_t result = 0;
        for (int i = 0; i < 8; i++) {
            result |= static_cast<uint64_t>(buf[i]) << (i * 8);
        }
        return result;
    }

    int64_t ReadInt64() {
        return static_cast<int64_t>(ReadUint64());
    }

    uint64_t ReadCompactSize() {
        uint8_t first = ReadUint8();
        if (first < 253) {
            return first;
        } else if (first == 253) {
            return ReadUint16();
        } else if (first == 254) {
            return ReadUint32();
        } else {
            return ReadUint64();
        }
    }

    std::string ReadString() {
        uint64_t len = ReadCompactSize();
        if (len > remaining()) {
            throw std::runtime_error("CDataStream: string length exceeds buffer");
        }
        std::string result(reinterpret_cast<const char*>(data.data() + read_pos),
                           static_cast<size_t>(len));
        read_pos += static_cast<size_t>(len);
        return result;
    }
};

#endif // STVFUZZ_UTIL_SERIALIZE_H
