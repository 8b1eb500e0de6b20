#pragma once

#include "address.hpp"
#include "types.hpp"

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

namespace settlemill {

// Little-endian writer for records and instruction payloads
class ByteWriter {
public:
    void u8(uint8_t value) { m_bytes.push_back(value); }
    void u16(uint16_t value);
    void u32(uint32_t value);
    void u64(uint64_t value);
    void address(const Address& value);
    void raw(const uint8_t* data, size_t size);

    template <size_t N>
    void array(const std::array<uint8_t, N>& values)
    {
        raw(values.data(), N);
    }

    template <size_t N>
    void array(const std::array<uint64_t, N>& values)
    {
        for (auto value : values) {
            u64(value);
        }
    }

    [[nodiscard]] const Bytes& bytes() const { return m_bytes; }
    Bytes take() { return std::move(m_bytes); }

private:
    Bytes m_bytes;
};

// Little-endian reader; running past the end throws InvalidInstructionData
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : m_data(data), m_size(size), m_offset(0) {}
    explicit ByteReader(const Bytes& bytes) : ByteReader(bytes.data(), bytes.size()) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    uint64_t u64();
    Address address();
    void raw(uint8_t* out, size_t size);

    template <size_t N>
    void array(std::array<uint8_t, N>& values)
    {
        raw(values.data(), N);
    }

    template <size_t N>
    void array(std::array<uint64_t, N>& values)
    {
        for (auto& value : values) {
            value = u64();
        }
    }

    [[nodiscard]] size_t remaining() const { return m_size - m_offset; }
    [[nodiscard]] bool atEnd() const { return m_offset == m_size; }

private:
    void need(size_t size) const;

    const uint8_t* m_data;
    size_t m_size;
    size_t m_offset;
};

using Discriminator = std::array<uint8_t, 8>;

// 8-byte tag derived from a name such as "account:Order" or "global:take_order"
Discriminator makeDiscriminator(std::string_view name);

} // namespace settlemill
