#include "record_store.hpp"

#include "errors.hpp"

#include <utility>

namespace pm {

namespace {

const Account& requireOwned(const InvokeContext& ctx, const Pubkey& address) {
    const Account* account = ctx.find(address);
    if (account == nullptr) {
        throw ProgramError(ErrorCode::AccountNotFound, shortKey(address));
    }
    if (account->owner != ctx.programId()) {
        throw ProgramError(ErrorCode::InvalidAccountData, "account not owned by program");
    }
    return *account;
}

} // namespace

DerivedAddress MarketStore::addressFor(const Pubkey& creator, const Hash& questionHash) const {
    return deriveMarketAddress(ctx_.programId(), creator, questionHash);
}

Market MarketStore::load(const Pubkey& address) const {
    return decodeMarket(requireOwned(ctx_, address).data);
}

void MarketStore::create(const Pubkey& address, const Market& market) {
    Bytes encoded = encodeMarket(market);
    Account& account = ctx_.createProgramAccount(address, Market::space());
    account.data = std::move(encoded);
}

void MarketStore::save(const Pubkey& address, const Market& market) {
    ctx_.programAccount(address).data = encodeMarket(market);
}

DerivedAddress BetStore::addressFor(const Pubkey& market, const Pubkey& bettor) const {
    return deriveBetAddress(ctx_.programId(), market, bettor);
}

Bet BetStore::load(const Pubkey& address) const {
    return decodeBet(requireOwned(ctx_, address).data);
}

void BetStore::create(const Pubkey& address, const Bet& bet) {
    Bytes encoded = encodeBet(bet);
    Account& account = ctx_.createProgramAccount(address, Bet::space());
    account.data = std::move(encoded);
}

void BetStore::save(const Pubkey& address, const Bet& bet) {
    ctx_.programAccount(address).data = encodeBet(bet);
}

} // namespace pm
