#include "client.hpp"

#include "address.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "payout.hpp"

namespace pm {

MarketClient::MarketClient(Ledger& ledger, PredictionMarketProgram& program)
    : ledger_(ledger)
    , program_(program) {}

TransactionReceipt MarketClient::submit(const Instruction& ix, std::initializer_list<const Keypair*> signers) {
    Transaction tx(encodeInstruction(ix));
    for (const Keypair* signer : signers) {
        tx.sign(*signer);
    }
    return ledger_.process(tx, program_);
}

TransactionReceipt MarketClient::createMarket(const Keypair& creator,
                                              const std::string& question,
                                              std::int64_t endTime,
                                              std::optional<Pubkey> resolutionAuthority) {
    CreateMarketArgs args;
    args.creator = creator.pubkey();
    args.question = question;
    args.endTime = endTime;
    args.questionHash = hashQuestion(question);
    args.resolutionAuthority = resolutionAuthority;
    return submit(args, { &creator });
}

TransactionReceipt MarketClient::placeBet(const Keypair& bettor,
                                          const Pubkey& market,
                                          std::uint64_t amount,
                                          bool outcome) {
    return submit(PlaceBetArgs{ bettor.pubkey(), market, amount, outcome }, { &bettor });
}

TransactionReceipt MarketClient::resolveMarket(const Keypair& authority, const Pubkey& market, bool outcome) {
    return submit(ResolveMarketArgs{ authority.pubkey(), market, outcome }, { &authority });
}

TransactionReceipt MarketClient::claimWinnings(const Keypair& bettor, const Pubkey& market) {
    ClaimWinningsArgs args{ bettor.pubkey(), market, betAddress(market, bettor.pubkey()) };
    return submit(args, { &bettor });
}

Pubkey MarketClient::marketAddress(const Pubkey& creator, const std::string& question) const {
    return deriveMarketAddress(program_.programId(), creator, hashQuestion(question)).address;
}

Pubkey MarketClient::betAddress(const Pubkey& market, const Pubkey& bettor) const {
    return deriveBetAddress(program_.programId(), market, bettor).address;
}

std::optional<Market> MarketClient::fetchMarket(const Pubkey& address) const {
    auto account = ledger_.getAccount(address);
    if (!account || account->owner != program_.programId() || !isMarketAccount(account->data)) {
        return std::nullopt;
    }
    return decodeMarket(account->data);
}

std::optional<Bet> MarketClient::fetchBet(const Pubkey& address) const {
    auto account = ledger_.getAccount(address);
    if (!account || account->owner != program_.programId() || !isBetAccount(account->data)) {
        return std::nullopt;
    }
    return decodeBet(account->data);
}

std::uint64_t MarketClient::quotePayout(const Pubkey& market, std::uint64_t stake, bool outcome) const {
    auto record = fetchMarket(market);
    if (!record) {
        throw ProgramError(ErrorCode::AccountNotFound, shortKey(market));
    }
    std::uint64_t yes = record->totalYesAmount;
    std::uint64_t no = record->totalNoAmount;
    if (outcome) {
        yes = checkedAdd(yes, stake);
    } else {
        no = checkedAdd(no, stake);
    }
    return computePayout(stake, yes, no, record->feeBasisPoints, outcome).payout;
}

} // namespace pm
