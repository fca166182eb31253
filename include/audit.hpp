#pragma once

#include "ledger.hpp"
#include "records.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pm {

// Merkle-sum commitment over every bet placed into one market.
struct LiabilityProof {
    std::string merkleRoot;
    std::uint64_t totalLiability = 0;
    std::size_t betCount = 0;
};

struct MarketAudit {
    Market market;
    LiabilityProof liabilities;
    std::uint64_t escrowBalance = 0;
    std::uint64_t claimedStake = 0;
    std::uint64_t paidOut = 0;

    // Totals match the sum of bet amounts.
    bool totalsMatchBets() const;
    // Escrow holds at least what was deposited minus what was paid to winners.
    bool escrowCoversFlows() const;
    // Lamports in escrow beyond deposits not yet paid out, i.e. credited to
    // the address from outside the program.
    std::uint64_t surplus() const;
};

LiabilityProof snapshotLiabilities(const Ledger& ledger, const Pubkey& programId, const Pubkey& market);

// Reconstructs a market's accounting from ledger state. Throws
// ProgramError(AccountNotFound) when no market lives at the address.
MarketAudit auditMarket(const Ledger& ledger, const Pubkey& programId, const Pubkey& market);

} // namespace pm
