#include "payout.hpp"

#include "checked_math.hpp"
#include "records.hpp"

namespace pm {

PayoutBreakdown computePayout(std::uint64_t stake,
                              std::uint64_t totalYes,
                              std::uint64_t totalNo,
                              std::uint16_t feeBasisPoints,
                              bool yesWon) {
    PayoutBreakdown out;
    out.winningPool = yesWon ? totalYes : totalNo;
    out.losingPool = yesWon ? totalNo : totalYes;
    out.totalPool = checkedAdd(out.winningPool, out.losingPool);

    if (out.winningPool == 0) {
        throw ProgramError(ErrorCode::MathOverflow, "winning pool is empty");
    }

    out.fee = checkedDiv(checkedMul(out.totalPool, feeBasisPoints), Market::kBasisPointsDenominator);
    out.netPool = checkedSub(out.totalPool, out.fee);
    out.payout = checkedDiv(checkedMul(stake, out.netPool), out.winningPool);
    return out;
}

PayoutBreakdown computePayout(const Market& market, std::uint64_t stake) {
    if (!market.resolved()) {
        throw ProgramError(ErrorCode::MarketNotResolved);
    }
    return computePayout(stake, market.totalYesAmount, market.totalNoAmount, market.feeBasisPoints, market.yesWon());
}

} // namespace pm
