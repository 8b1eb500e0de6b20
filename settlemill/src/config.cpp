#include "config.hpp"
#include "jsonutils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace settlemill {

using namespace json;

std::string readFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

DeploymentConfig DeploymentConfig::loadFromFile(const std::string& path) { return parse(readFile(path)); }

DeploymentConfig DeploymentConfig::parse(const std::string& json)
{
    DeploymentConfig config;
    config.admin = extractString(json, "admin", config.admin);
    if (config.admin.empty()) {
        throw std::runtime_error("Deployment admin label must not be empty");
    }

    uint64_t hostFeeBps = extractUint(json, "host_fee_bps", config.hostFeeBps);
    if (hostFeeBps > kMaxBps) {
        throw std::runtime_error("host_fee_bps must be at most " + std::to_string(kMaxBps));
    }
    config.hostFeeBps = static_cast<Bps>(hostFeeBps);

    config.orderCloseDelaySeconds = extractUint(json, "order_close_delay_seconds", config.orderCloseDelaySeconds);
    config.txnFeeCost = extractUint(json, "txn_fee_cost", config.txnFeeCost);
    config.ataCreationCost = extractUint(json, "ata_creation_cost", config.ataCreationCost);
    config.rentLamportsPerByte = extractUint(json, "rent_lamports_per_byte", config.rentLamportsPerByte);
    config.adminFunding = extractUint(json, "admin_funding", config.adminFunding);

    config.emergencyMode = extractBool(json, "emergency_mode", config.emergencyMode);
    config.flashTakeOrderBlocked = extractBool(json, "flash_take_order_blocked", config.flashTakeOrderBlocked);
    config.newOrdersBlocked = extractBool(json, "new_orders_blocked", config.newOrdersBlocked);
    config.orderTakingBlocked = extractBool(json, "order_taking_blocked", config.orderTakingBlocked);
    return config;
}

} // namespace settlemill
