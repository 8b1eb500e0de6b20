#include "address.hpp"

#include <cstring>

namespace settlemill {

namespace {

constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

uint64_t fnv1a(uint64_t hash, const uint8_t* data, size_t size)
{
    for (size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= kFnvPrime;
    }
    return hash;
}

// splitmix64 finalizer
uint64_t mix(uint64_t value)
{
    value += 0x9e3779b97f4a7c15ULL;
    value = (value ^ (value >> 30)) * 0xbf58476d1ce4e5b9ULL;
    value = (value ^ (value >> 27)) * 0x94d049bb133111ebULL;
    return value ^ (value >> 31);
}

// Four independent 64-bit lanes over the same preimage fill the 32 bytes
Address digest(const Bytes& preimage)
{
    Address address;
    for (uint64_t lane = 0; lane < 4; ++lane) {
        uint64_t hash = fnv1a(kFnvOffset ^ mix(lane), preimage.data(), preimage.size());
        hash = mix(hash);
        std::memcpy(address.bytes.data() + lane * 8, &hash, sizeof(hash));
    }
    return address;
}

void append(Bytes& out, std::string_view text)
{
    // Little-endian u32 length prefix keeps tag and seed bytes apart
    auto size = static_cast<uint32_t>(text.size());
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>(size >> shift));
    }
    out.insert(out.end(), text.begin(), text.end());
}

void append(Bytes& out, const Address& address) { out.insert(out.end(), address.bytes.begin(), address.bytes.end()); }

} // namespace

bool Address::isZero() const
{
    for (auto byte : bytes) {
        if (byte != 0) {
            return false;
        }
    }
    return true;
}

std::string Address::toHex() const
{
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

std::string Address::shortHex() const { return toHex().substr(0, 8); }

Address Address::fromLabel(std::string_view label)
{
    Bytes preimage;
    append(preimage, "label");
    append(preimage, label);
    return digest(preimage);
}

size_t AddressHash::operator()(const Address& address) const
{
    uint64_t value = 0;
    std::memcpy(&value, address.bytes.data(), sizeof(value));
    return static_cast<size_t>(value);
}

Address deriveAddress(std::string_view tag, const std::vector<Address>& seeds, const Address& programId)
{
    Bytes preimage;
    append(preimage, tag);
    for (const auto& seed : seeds) {
        append(preimage, seed);
    }
    append(preimage, programId);
    append(preimage, "derived");
    return digest(preimage);
}

} // namespace settlemill
