#pragma once

#include "instruction.hpp"
#include "keys.hpp"
#include "ledger.hpp"
#include "program.hpp"
#include "records.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>

namespace pm {

// Builds, signs and submits instructions for one program on one ledger, and
// reads records back out of ledger state.
class MarketClient {
public:
    MarketClient(Ledger& ledger, PredictionMarketProgram& program);

    TransactionReceipt submit(const Instruction& ix, std::initializer_list<const Keypair*> signers);

    TransactionReceipt createMarket(const Keypair& creator,
                                    const std::string& question,
                                    std::int64_t endTime,
                                    std::optional<Pubkey> resolutionAuthority = std::nullopt);
    TransactionReceipt placeBet(const Keypair& bettor, const Pubkey& market, std::uint64_t amount, bool outcome);
    TransactionReceipt resolveMarket(const Keypair& authority, const Pubkey& market, bool outcome);
    TransactionReceipt claimWinnings(const Keypair& bettor, const Pubkey& market);

    Pubkey marketAddress(const Pubkey& creator, const std::string& question) const;
    Pubkey betAddress(const Pubkey& market, const Pubkey& bettor) const;

    std::optional<Market> fetchMarket(const Pubkey& address) const;
    std::optional<Bet> fetchBet(const Pubkey& address) const;

    // What a new winning stake on `outcome` would receive if the market
    // resolved that way with no further wagers.
    std::uint64_t quotePayout(const Pubkey& market, std::uint64_t stake, bool outcome) const;

private:
    Ledger& ledger_;
    PredictionMarketProgram& program_;
};

} // namespace pm
