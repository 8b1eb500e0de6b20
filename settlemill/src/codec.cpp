#include "codec.hpp"
#include "errors.hpp"

#include <cstring>

namespace settlemill {

void ByteWriter::u16(uint16_t value)
{
    for (int shift = 0; shift < 16; shift += 8) {
        m_bytes.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::u32(uint32_t value)
{
    for (int shift = 0; shift < 32; shift += 8) {
        m_bytes.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::u64(uint64_t value)
{
    for (int shift = 0; shift < 64; shift += 8) {
        m_bytes.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::address(const Address& value) { raw(value.bytes.data(), value.bytes.size()); }

void ByteWriter::raw(const uint8_t* data, size_t size) { m_bytes.insert(m_bytes.end(), data, data + size); }

void ByteReader::need(size_t size) const
{
    if (m_size - m_offset < size) {
        throw SettlementError(ErrorCode::InvalidInstructionData, "unexpected end of data");
    }
}

uint8_t ByteReader::u8()
{
    need(1);
    return m_data[m_offset++];
}

uint16_t ByteReader::u16()
{
    need(2);
    uint16_t value = 0;
    for (int i = 0; i < 2; ++i) {
        value |= static_cast<uint16_t>(m_data[m_offset++]) << (8 * i);
    }
    return value;
}

uint32_t ByteReader::u32()
{
    need(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(m_data[m_offset++]) << (8 * i);
    }
    return value;
}

uint64_t ByteReader::u64()
{
    need(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(m_data[m_offset++]) << (8 * i);
    }
    return value;
}

Address ByteReader::address()
{
    Address value;
    raw(value.bytes.data(), value.bytes.size());
    return value;
}

void ByteReader::raw(uint8_t* out, size_t size)
{
    need(size);
    std::memcpy(out, m_data + m_offset, size);
    m_offset += size;
}

Discriminator makeDiscriminator(std::string_view name)
{
    Discriminator discriminator{};
    auto digest = Address::fromLabel(name);
    std::memcpy(discriminator.data(), digest.bytes.data(), discriminator.size());
    return discriminator;
}

} // namespace settlemill
