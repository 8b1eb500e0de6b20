#pragma once

#include "types.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace settlemill {

// 32-byte account address
struct Address {
    std::array<uint8_t, 32> bytes{};

    [[nodiscard]] bool isZero() const;

    // Full lowercase hex
    [[nodiscard]] std::string toHex() const;

    // First 8 hex digits, for log lines
    [[nodiscard]] std::string shortHex() const;

    // Deterministic key for a human-readable name ("alice", "usdc")
    static Address fromLabel(std::string_view label);

    bool operator==(const Address& other) const { return bytes == other.bytes; }
    bool operator!=(const Address& other) const { return bytes != other.bytes; }
    bool operator<(const Address& other) const { return bytes < other.bytes; }
};

struct AddressHash {
    size_t operator()(const Address& address) const;
};

// Program-derived address: no private key exists for the result, only the
// owning program can authorize for it
Address deriveAddress(std::string_view tag, const std::vector<Address>& seeds, const Address& programId);

} // namespace settlemill
