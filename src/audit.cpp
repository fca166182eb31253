#include "audit.hpp"

#include "checked_math.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "payout.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace pm {

namespace {

std::vector<Bet> collectBets(const Ledger& ledger, const Pubkey& programId, const Pubkey& market) {
    std::vector<Bet> out;
    for (const auto& entry : ledger.accountsOwnedBy(programId)) {
        const Account& account = entry.second;
        if (!isBetAccount(account.data)) {
            continue;
        }
        Bet bet = decodeBet(account.data);
        if (bet.market == market) {
            out.push_back(bet);
        }
    }
    return out;
}

LiabilityProof buildLiabilityTree(const std::vector<Bet>& bets) {
    struct Node {
        std::string hash;
        std::uint64_t sum = 0;
    };

    std::vector<Node> layer;
    layer.reserve(bets.size());
    for (const auto& bet : bets) {
        Node leaf;
        leaf.sum = bet.amount;
        std::ostringstream oss;
        oss << toHex(bet.bettor) << ":" << bet.amount << ":" << (bet.outcomeChosen ? "yes" : "no");
        leaf.hash = sha256Hex(oss.str());
        layer.push_back(std::move(leaf));
    }

    LiabilityProof proof;
    proof.betCount = bets.size();
    if (layer.empty()) {
        return proof;
    }

    auto combine = [](const Node& left, const Node& right, bool duplicate) {
        Node out;
        out.sum = duplicate ? left.sum : checkedAdd(left.sum, right.sum);
        std::ostringstream oss;
        oss << left.hash << "|" << right.hash << "|" << out.sum;
        out.hash = sha256Hex(oss.str());
        return out;
    };

    while (layer.size() > 1) {
        std::vector<Node> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            if (i + 1 < layer.size()) {
                next.push_back(combine(layer[i], layer[i + 1], false));
            } else {
                // Odd node is paired with itself but counted once.
                next.push_back(combine(layer[i], layer[i], true));
            }
        }
        layer = std::move(next);
    }

    proof.merkleRoot = layer.front().hash;
    proof.totalLiability = layer.front().sum;
    return proof;
}

} // namespace

bool MarketAudit::totalsMatchBets() const {
    return liabilities.totalLiability == checkedAdd(market.totalYesAmount, market.totalNoAmount);
}

bool MarketAudit::escrowCoversFlows() const {
    std::uint64_t deposited = checkedAdd(market.totalYesAmount, market.totalNoAmount);
    return paidOut <= deposited && escrowBalance >= deposited - paidOut;
}

std::uint64_t MarketAudit::surplus() const {
    if (!escrowCoversFlows()) {
        return 0;
    }
    return escrowBalance - (checkedAdd(market.totalYesAmount, market.totalNoAmount) - paidOut);
}

LiabilityProof snapshotLiabilities(const Ledger& ledger, const Pubkey& programId, const Pubkey& market) {
    return buildLiabilityTree(collectBets(ledger, programId, market));
}

MarketAudit auditMarket(const Ledger& ledger, const Pubkey& programId, const Pubkey& market) {
    auto account = ledger.getAccount(market);
    if (!account || account->owner != programId || !isMarketAccount(account->data)) {
        throw ProgramError(ErrorCode::AccountNotFound, shortKey(market));
    }

    MarketAudit audit;
    audit.market = decodeMarket(account->data);
    audit.escrowBalance = account->lamports;

    std::vector<Bet> bets = collectBets(ledger, programId, market);
    audit.liabilities = buildLiabilityTree(bets);
    for (const auto& bet : bets) {
        if (!bet.claimed) {
            continue;
        }
        audit.claimedStake = checkedAdd(audit.claimedStake, bet.amount);
        audit.paidOut = checkedAdd(audit.paidOut, computePayout(audit.market, bet.amount).payout);
    }
    return audit;
}

} // namespace pm
