#pragma once

#include "address.hpp"
#include "order.hpp"
#include "types.hpp"

#include <array>
#include <string>
#include <vector>

namespace settlemill {

// Host/maker split of a tip; host share rounds up
TipSplit splitTip(const GlobalConfig& config, Amount tipAmount);

// Check the custodial authority's observed balance after a tip was moved in:
// the delta since the last snapshot must cover the tip and the balance must
// cover every accounted tip. Refreshes the snapshot on success.
void reconcileAuthorityBalance(GlobalConfig& config, Amount authorityBalance, Amount tipAmount);

// Zeroes the accrued host tip and returns the amount to pay out
Amount withdrawHostTip(GlobalConfig& config, Amount authorityBalance);

void initializeGlobalConfig(GlobalConfig& config, const Address& admin, const Address& pdaAuthority,
                            Amount authorityBalance);

using UpdateGlobalConfigValue = std::array<uint8_t, kUpdateGlobalConfigValueSize>;

// Applies one configuration change; returns the log lines describing it
std::vector<std::string> updateGlobalConfig(GlobalConfig& config, UpdateGlobalConfigMode mode,
                                            const UpdateGlobalConfigValue& value, Timestamp now);

// Promotes the staged admin; the caller has verified its signature
void promoteCachedAdmin(GlobalConfig& config);

} // namespace settlemill
