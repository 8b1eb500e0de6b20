#pragma once

#include "types.hpp"

#include <string>

namespace settlemill {

// Deployment parameters applied right after initialize_global_config
struct DeploymentConfig {
    std::string admin = "admin"; // Label of the admin key
    Bps hostFeeBps = 0;
    uint64_t orderCloseDelaySeconds = 0;
    Amount txnFeeCost = 0;
    Amount ataCreationCost = 0;
    Amount rentLamportsPerByte = 6960;
    Amount adminFunding = 10'000'000'000;

    bool emergencyMode = false;
    bool flashTakeOrderBlocked = false;
    bool newOrdersBlocked = false;
    bool orderTakingBlocked = false;

    static DeploymentConfig loadFromFile(const std::string& path);
    static DeploymentConfig parse(const std::string& json);
};

// Reads a whole file; throws std::runtime_error when it cannot be opened
std::string readFile(const std::string& path);

} // namespace settlemill
