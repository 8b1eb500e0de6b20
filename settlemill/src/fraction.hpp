#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <limits>

namespace settlemill {

// Checked u64 arithmetic; every balance update goes through these
inline Amount checkedAdd(Amount lhs, Amount rhs)
{
    Amount result = 0;
    if (__builtin_add_overflow(lhs, rhs, &result)) {
        throw SettlementError(ErrorCode::MathOverflow);
    }
    return result;
}

inline Amount checkedSub(Amount lhs, Amount rhs)
{
    Amount result = 0;
    if (__builtin_sub_overflow(lhs, rhs, &result)) {
        throw SettlementError(ErrorCode::MathOverflow);
    }
    return result;
}

// ceil(value * numerator / denominator), computed in 128 bits and narrowed
// with an explicit range check
inline Amount mulDivCeil(Amount value, Amount numerator, Amount denominator)
{
    if (denominator == 0) {
        throw SettlementError(ErrorCode::MathOverflow, "division by zero");
    }

    using Wide = unsigned __int128;
    Wide product = static_cast<Wide>(value) * static_cast<Wide>(numerator);
    Wide quotient = product / denominator;
    if (product % denominator != 0) {
        quotient += 1;
    }

    if (quotient > static_cast<Wide>(std::numeric_limits<Amount>::max())) {
        throw SettlementError(ErrorCode::MathOverflow);
    }
    return static_cast<Amount>(quotient);
}

// Share of amount at the given basis points, rounded up
inline Amount bpsOfCeil(Amount amount, Bps bps) { return mulDivCeil(amount, bps, kMaxBps); }

} // namespace settlemill
