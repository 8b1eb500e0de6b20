#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace settlemill {

enum class ErrorCode : uint16_t {
    // Order state
    OrderCanNotBeCanceled,
    OrderNotActive,
    OrderInputAmountInvalid,
    OrderOutputAmountInvalid,
    OrderInputAmountTooLarge,
    OrderSameMint,
    OrderTypeInvalid,
    OrderWithinFlashOperation,
    OrderNotWithinFlashOperation,
    NotEnoughTimePassedSinceLastUpdate,

    // Arithmetic
    MathOverflow,
    IntegerOverflow,

    // Flash protocol
    CPINotAllowed,
    FlashTxWithUnexpectedIxs,
    FlashIxsNotEnded,
    FlashIxsNotStarted,
    FlashIxsAccountMismatch,
    FlashIxsArgsMismatch,

    // Authorization
    InvalidAdminAuthority,
    InvalidPdaAuthority,
    InvalidOrderOwner,
    PermissionRequiredPermissionlessNotEnabled,
    PermissionDoesNotMatchOrder,
    PermissionNotGranted,
    CounterpartyDisallowed,
    MissingSigner,

    // Kill-switches
    EmergencyModeEnabled,
    FlashTakeOrderBlocked,
    CreatingNewOrdersBlocked,
    OrderTakingBlocked,

    // Configuration values
    InvalidConfigOption,
    InvalidFlag,
    InvalidHostFee,
    InvalidParameterType,

    // Tip accounting
    InvalidTipBalance,
    InvalidTipTransferAmount,
    InvalidHostTipBalance,

    // Accounts and assets
    InvalidAccount,
    AccountAlreadyInUse,
    InvalidTokenMint,
    InvalidTokenAuthority,
    MakerOutputAtaRequired,
    InsufficientLamports,
    InsufficientTokenBalance,
    UnknownProgram,
    InvalidInstructionData,

    // Balance bracketing
    SwapBalanceAssertionFailed
};

// Stable identifier, e.g. "OrderNotActive"
const char* errorName(ErrorCode code);

// Human-readable description
const char* errorMessage(ErrorCode code);

// Parse a name produced by errorName; throws std::invalid_argument if unknown
ErrorCode errorFromName(const std::string& name);

class SettlementError : public std::runtime_error {
public:
    explicit SettlementError(ErrorCode code);
    SettlementError(ErrorCode code, const std::string& detail);

    [[nodiscard]] ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

inline void require(bool condition, ErrorCode code)
{
    if (!condition) {
        throw SettlementError(code);
    }
}

} // namespace settlemill
