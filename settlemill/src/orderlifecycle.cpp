#include "orderlifecycle.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "fraction.hpp"

namespace settlemill {

void createOrder(Order& order, const Address& globalConfig, const Address& maker, const OrderTerms& terms,
                 Timestamp now)
{
    require(terms.inputMint != terms.outputMint, ErrorCode::OrderSameMint);
    require(terms.orderType == static_cast<uint8_t>(OrderType::Vanilla), ErrorCode::OrderTypeInvalid);
    require(terms.inputAmount > 0, ErrorCode::OrderInputAmountInvalid);
    require(terms.outputAmount > 0, ErrorCode::OrderOutputAmountInvalid);
    require(now >= 0, ErrorCode::IntegerOverflow);

    order.globalConfig = globalConfig;
    order.maker = maker;
    order.inputMint = terms.inputMint;
    order.inputMintProgramId = terms.inputMintProgramId;
    order.outputMint = terms.outputMint;
    order.outputMintProgramId = terms.outputMintProgramId;
    order.initialInputAmount = terms.inputAmount;
    order.remainingInputAmount = terms.inputAmount;
    order.expectedOutputAmount = terms.outputAmount;
    order.filledOutputAmount = 0;
    order.tipAmount = 0;
    order.numberOfFills = 0;
    order.orderType = terms.orderType;
    order.status = static_cast<uint8_t>(OrderStatus::Active);
    order.flashIxLock = 0;
    order.permissionless = 0;
    order.counterparty = Address{};
    order.lastUpdatedTimestamp = static_cast<uint64_t>(now);
}

std::vector<std::string> updateOrder(Order& order, UpdateOrderMode mode, const Bytes& value)
{
    std::vector<std::string> logs;

    switch (mode) {
    case UpdateOrderMode::Permissionless: {
        require(value.size() == 1, ErrorCode::InvalidParameterType);
        logs.emplace_back("update_order mode=UpdatePermissionless");
        logs.push_back("new=" + std::to_string(value[0]) + " prev=" + std::to_string(order.permissionless));
        order.permissionless = value[0];
        break;
    }
    case UpdateOrderMode::Counterparty: {
        require(value.size() == 32, ErrorCode::InvalidParameterType);
        ByteReader reader(value);
        Address counterparty = reader.address();
        logs.emplace_back("update_order mode=UpdateCounterparty");
        logs.push_back("new=" + counterparty.toHex() + " prev=" + order.counterparty.toHex());
        order.counterparty = counterparty;
        break;
    }
    default:
        throw SettlementError(ErrorCode::InvalidParameterType, "unknown update_order mode");
    }

    return logs;
}

void closeOrder(Order& order, GlobalConfig& config, Timestamp now)
{
    OrderStatus status = order.orderStatus();
    require(status == OrderStatus::Active || status == OrderStatus::Filled, ErrorCode::OrderCanNotBeCanceled);

    require(now >= 0, ErrorCode::IntegerOverflow);
    Amount closableAt = checkedAdd(order.lastUpdatedTimestamp, config.orderCloseDelaySeconds);
    require(static_cast<uint64_t>(now) >= closableAt, ErrorCode::NotEnoughTimePassedSinceLastUpdate);

    require(!order.isLocked(), ErrorCode::OrderWithinFlashOperation);

    order.status = static_cast<uint8_t>(OrderStatus::Cancelled);
    config.totalTipAmount = checkedSub(config.totalTipAmount, order.tipAmount);
}

bool isCounterpartyMatching(const Order& order, const Address& taker)
{
    return order.counterparty.isZero() || order.counterparty == taker;
}

} // namespace settlemill
