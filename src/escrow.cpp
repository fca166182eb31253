#include "escrow.hpp"

#include "errors.hpp"

namespace pm {

void EscrowGateway::requirePool(const Pubkey& pool) const {
    const Account* account = ctx_.find(pool);
    if (account == nullptr) {
        throw ProgramError(ErrorCode::AccountNotFound, shortKey(pool));
    }
    if (account->owner != ctx_.programId()) {
        throw ProgramError(ErrorCode::UnauthorizedEscrowAccess, shortKey(pool));
    }
}

void EscrowGateway::deposit(const Pubkey& payer, const Pubkey& pool, std::uint64_t amount) {
    requirePool(pool);
    ctx_.systemTransfer(payer, pool, amount);
}

void EscrowGateway::withdraw(const Pubkey& pool, const Pubkey& payee, std::uint64_t amount) {
    requirePool(pool);
    if (amount > ctx_.balance(pool)) {
        throw ProgramError(ErrorCode::InsufficientPoolBalance, shortKey(pool));
    }
    ctx_.debitProgramAccount(pool, payee, amount);
}

std::uint64_t EscrowGateway::poolBalance(const Pubkey& pool) const {
    requirePool(pool);
    return ctx_.balance(pool);
}

} // namespace pm
