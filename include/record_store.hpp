#pragma once

#include "address.hpp"
#include "ledger.hpp"
#include "records.hpp"

namespace pm {

// Markets live at ("market", creator, questionHash) derived addresses.
class MarketStore {
public:
    explicit MarketStore(InvokeContext& ctx) : ctx_(ctx) {}

    DerivedAddress addressFor(const Pubkey& creator, const Hash& questionHash) const;
    bool exists(const Pubkey& address) const { return ctx_.isAllocated(address); }

    Market load(const Pubkey& address) const;
    void create(const Pubkey& address, const Market& market);
    void save(const Pubkey& address, const Market& market);

private:
    InvokeContext& ctx_;
};

// Bets live at ("bet", market, bettor) derived addresses, so a bettor has at
// most one bet per market.
class BetStore {
public:
    explicit BetStore(InvokeContext& ctx) : ctx_(ctx) {}

    DerivedAddress addressFor(const Pubkey& market, const Pubkey& bettor) const;
    bool exists(const Pubkey& address) const { return ctx_.isAllocated(address); }

    Bet load(const Pubkey& address) const;
    void create(const Pubkey& address, const Bet& bet);
    void save(const Pubkey& address, const Bet& bet);

private:
    InvokeContext& ctx_;
};

} // namespace pm
