#pragma once

#include "ledger.hpp"

#include <cstdint>

namespace pm {

// The only path by which currency enters or leaves a market's pool. Pools are
// program-owned accounts; deposits need the payer's signature and withdrawals
// need the invoking program to own the pool.
class EscrowGateway {
public:
    explicit EscrowGateway(InvokeContext& ctx) : ctx_(ctx) {}

    void deposit(const Pubkey& payer, const Pubkey& pool, std::uint64_t amount);
    void withdraw(const Pubkey& pool, const Pubkey& payee, std::uint64_t amount);
    std::uint64_t poolBalance(const Pubkey& pool) const;

private:
    void requirePool(const Pubkey& pool) const;

    InvokeContext& ctx_;
};

} // namespace pm
