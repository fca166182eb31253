#pragma once

#include "errors.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <limits>

namespace pm {

// Overflow-checked u64 arithmetic for balances and pool totals. Every helper
// throws ProgramError(MathOverflow) instead of wrapping or truncating.

inline std::uint64_t checkedAdd(std::uint64_t a, std::uint64_t b) {
    if (a > std::numeric_limits<std::uint64_t>::max() - b) {
        throw ProgramError(ErrorCode::MathOverflow, "u64 addition overflow");
    }
    return a + b;
}

inline std::uint64_t checkedSub(std::uint64_t a, std::uint64_t b) {
    if (b > a) {
        throw ProgramError(ErrorCode::MathOverflow, "u64 subtraction underflow");
    }
    return a - b;
}

inline std::uint64_t checkedMul(std::uint64_t a, std::uint64_t b) {
    namespace mp = boost::multiprecision;
    mp::uint128_t wide = mp::uint128_t(a) * b;
    if (wide > std::numeric_limits<std::uint64_t>::max()) {
        throw ProgramError(ErrorCode::MathOverflow, "u64 multiplication overflow");
    }
    return static_cast<std::uint64_t>(wide);
}

// Truncates toward zero.
inline std::uint64_t checkedDiv(std::uint64_t a, std::uint64_t b) {
    if (b == 0) {
        throw ProgramError(ErrorCode::MathOverflow, "division by zero");
    }
    return a / b;
}

} // namespace pm
