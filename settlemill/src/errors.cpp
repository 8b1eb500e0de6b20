#include "errors.hpp"

namespace settlemill {

namespace {

struct ErrorEntry {
    ErrorCode code;
    const char* name;
    const char* message;
};

constexpr ErrorEntry kErrors[] = {
    {ErrorCode::OrderCanNotBeCanceled, "OrderCanNotBeCanceled", "Order can't be canceled"},
    {ErrorCode::OrderNotActive, "OrderNotActive", "Order not active"},
    {ErrorCode::OrderInputAmountInvalid, "OrderInputAmountInvalid", "Order input amount invalid"},
    {ErrorCode::OrderOutputAmountInvalid, "OrderOutputAmountInvalid", "Order output amount invalid"},
    {ErrorCode::OrderInputAmountTooLarge, "OrderInputAmountTooLarge", "Order input amount larger than the remaining"},
    {ErrorCode::OrderSameMint, "OrderSameMint", "Order input and output mints are the same"},
    {ErrorCode::OrderTypeInvalid, "OrderTypeInvalid", "The order type is invalid"},
    {ErrorCode::OrderWithinFlashOperation, "OrderWithinFlashOperation",
     "Order within flash operation - all other actions are blocked"},
    {ErrorCode::OrderNotWithinFlashOperation, "OrderNotWithinFlashOperation", "Order is not within flash operation"},
    {ErrorCode::NotEnoughTimePassedSinceLastUpdate, "NotEnoughTimePassedSinceLastUpdate",
     "Order can not be closed - Not enough time passed since last update"},
    {ErrorCode::MathOverflow, "MathOverflow", "Mathematical operation with overflow"},
    {ErrorCode::IntegerOverflow, "IntegerOverflow", "Conversion between integers failed"},
    {ErrorCode::CPINotAllowed, "CPINotAllowed", "CPI not allowed"},
    {ErrorCode::FlashTxWithUnexpectedIxs, "FlashTxWithUnexpectedIxs",
     "Some unexpected instructions are present in the tx. Either before or after the flash ixs, or some ix target "
     "the same program between"},
    {ErrorCode::FlashIxsNotEnded, "FlashIxsNotEnded", "Flash ixs initiated without the closing ix in the transaction"},
    {ErrorCode::FlashIxsNotStarted, "FlashIxsNotStarted", "Flash ixs ended without the starting ix in the transaction"},
    {ErrorCode::FlashIxsAccountMismatch, "FlashIxsAccountMismatch", "Some accounts differ between the two flash ixs"},
    {ErrorCode::FlashIxsArgsMismatch, "FlashIxsArgsMismatch", "Some args differ between the two flash ixs"},
    {ErrorCode::InvalidAdminAuthority, "InvalidAdminAuthority", "Invalid admin authority"},
    {ErrorCode::InvalidPdaAuthority, "InvalidPdaAuthority", "Invalid pda authority"},
    {ErrorCode::InvalidOrderOwner, "InvalidOrderOwner", "Order owner account is not the order owner"},
    {ErrorCode::PermissionRequiredPermissionlessNotEnabled, "PermissionRequiredPermissionlessNotEnabled",
     "Permissionless order taking not enabled, please provide permission account"},
    {ErrorCode::PermissionDoesNotMatchOrder, "PermissionDoesNotMatchOrder",
     "Permission address does not match order address"},
    {ErrorCode::PermissionNotGranted, "PermissionNotGranted", "Permission router rejected the fill"},
    {ErrorCode::CounterpartyDisallowed, "CounterpartyDisallowed", "Taker is not the order counterparty"},
    {ErrorCode::MissingSigner, "MissingSigner", "Required signature is missing"},
    {ErrorCode::EmergencyModeEnabled, "EmergencyModeEnabled", "Emergency mode is enabled"},
    {ErrorCode::FlashTakeOrderBlocked, "FlashTakeOrderBlocked", "Flash take_order is blocked"},
    {ErrorCode::CreatingNewOrdersBlocked, "CreatingNewOrdersBlocked", "Creating new orders is blocked"},
    {ErrorCode::OrderTakingBlocked, "OrderTakingBlocked", "Orders taking is blocked"},
    {ErrorCode::InvalidConfigOption, "InvalidConfigOption", "Invalid config option"},
    {ErrorCode::InvalidFlag, "InvalidFlag", "Invalid boolean flag, valid values are 0 and 1"},
    {ErrorCode::InvalidHostFee, "InvalidHostFee", "Host fee bps must be between 0 and 10000"},
    {ErrorCode::InvalidParameterType, "InvalidParameterType", "Invalid parameter type"},
    {ErrorCode::InvalidTipBalance, "InvalidTipBalance", "Tip balance less than accounted tip"},
    {ErrorCode::InvalidTipTransferAmount, "InvalidTipTransferAmount", "Tip transfer amount is less than expected"},
    {ErrorCode::InvalidHostTipBalance, "InvalidHostTipBalance", "Host tip amount is less than accounted for"},
    {ErrorCode::InvalidAccount, "InvalidAccount", "Account is not valid for this instruction"},
    {ErrorCode::AccountAlreadyInUse, "AccountAlreadyInUse", "Account already in use"},
    {ErrorCode::InvalidTokenMint, "InvalidTokenMint", "Token account has incorrect mint"},
    {ErrorCode::InvalidTokenAuthority, "InvalidTokenAuthority", "Token account has incorrect authority"},
    {ErrorCode::MakerOutputAtaRequired, "MakerOutputAtaRequired", "Maker output token account required"},
    {ErrorCode::InsufficientLamports, "InsufficientLamports", "Insufficient lamports"},
    {ErrorCode::InsufficientTokenBalance, "InsufficientTokenBalance", "Insufficient token balance"},
    {ErrorCode::UnknownProgram, "UnknownProgram", "Instruction targets an unknown program"},
    {ErrorCode::InvalidInstructionData, "InvalidInstructionData", "Invalid instruction data"},
    {ErrorCode::SwapBalanceAssertionFailed, "SwapBalanceAssertionFailed",
     "User swap balances changed outside the asserted bounds"},
};

const ErrorEntry& entryFor(ErrorCode code)
{
    for (const auto& entry : kErrors) {
        if (entry.code == code) {
            return entry;
        }
    }
    throw std::logic_error("Unregistered error code: " + std::to_string(static_cast<int>(code)));
}

} // namespace

const char* errorName(ErrorCode code) { return entryFor(code).name; }

const char* errorMessage(ErrorCode code) { return entryFor(code).message; }

ErrorCode errorFromName(const std::string& name)
{
    for (const auto& entry : kErrors) {
        if (name == entry.name) {
            return entry.code;
        }
    }
    throw std::invalid_argument("Unknown error name: " + name);
}

SettlementError::SettlementError(ErrorCode code)
    : std::runtime_error(std::string(errorName(code)) + ": " + errorMessage(code)), m_code(code)
{
}

SettlementError::SettlementError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(errorName(code)) + ": " + errorMessage(code) + " (" + detail + ")"), m_code(code)
{
}

} // namespace settlemill
