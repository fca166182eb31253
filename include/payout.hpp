#pragma once

#include <cstdint>

namespace pm {

struct Market;

struct PayoutBreakdown {
    std::uint64_t winningPool = 0;
    std::uint64_t losingPool = 0;
    std::uint64_t totalPool = 0;
    std::uint64_t fee = 0;
    std::uint64_t netPool = 0;
    std::uint64_t payout = 0;
};

// Proportional share of the pool after the platform fee:
//   fee    = total * feeBasisPoints / 10000
//   payout = stake * (total - fee) / winningPool
// Both divisions truncate toward zero. Every step is checked in the u64 domain
// and throws ProgramError(MathOverflow) rather than wrapping; an empty winning
// pool is reported the same way.
PayoutBreakdown computePayout(std::uint64_t stake,
                              std::uint64_t totalYes,
                              std::uint64_t totalNo,
                              std::uint16_t feeBasisPoints,
                              bool yesWon);

// Payout for a winning bet against a resolved market.
PayoutBreakdown computePayout(const Market& market, std::uint64_t stake);

} // namespace pm
