#pragma once

#include "errors.hpp"
#include "transaction.hpp"
#include "transcript_log.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pm {

// Owner value for plain currency-holding accounts.
constexpr Pubkey kSystemOwner{};

struct Account {
    std::uint64_t lamports = 0;
    Pubkey owner = kSystemOwner;
    Bytes data;
};

using AccountMap = std::map<Pubkey, Account>;

class InvokeContext;

// A program receives a verified, signed instruction and mutates accounts
// through the context it is handed.
class Program {
public:
    virtual ~Program() = default;
    virtual const Pubkey& programId() const = 0;
    virtual void processInstruction(InvokeContext& ctx, const Bytes& instruction) = 0;
};

// Working view of the ledger for one transaction. All mutations land on a
// private copy of the account set that the ledger commits only on success.
class InvokeContext {
public:
    InvokeContext(AccountMap& accounts, std::int64_t now, const Pubkey& programId, std::set<Pubkey> signers);

    std::int64_t now() const { return now_; }
    const Pubkey& programId() const { return programId_; }

    bool isSigner(const Pubkey& key) const { return signers_.count(key) != 0; }
    void requireSigner(const Pubkey& key) const;

    const Account* find(const Pubkey& address) const;
    std::uint64_t balance(const Pubkey& address) const;

    // True once an address holds data or belongs to a program. Lamports alone
    // do not allocate an address.
    bool isAllocated(const Pubkey& address) const;
    // Allocates a zeroed account owned by the invoking program. Throws
    // AlreadyExists if the address is allocated.
    Account& createProgramAccount(const Pubkey& address, std::size_t space);
    // Mutable access to an account owned by the invoking program.
    Account& programAccount(const Pubkey& address);

    // Host transfer primitive: debits a system account whose owner signed.
    void systemTransfer(const Pubkey& from, const Pubkey& to, std::uint64_t amount);
    // Debits an account owned by the invoking program.
    void debitProgramAccount(const Pubkey& from, const Pubkey& to, std::uint64_t amount);

    void log(const std::string& line);
    const std::vector<std::string>& logs() const { return logs_; }

private:
    void credit(const Pubkey& to, std::uint64_t amount);

    AccountMap& accounts_;
    std::int64_t now_;
    Pubkey programId_;
    std::set<Pubkey> signers_;
    std::vector<std::string> logs_;
};

// Message body of a native transfer between system accounts.
struct TransferArgs {
    Pubkey from{};
    Pubkey to{};
    std::uint64_t amount = 0;
};

Bytes encodeTransfer(const TransferArgs& args);
// Throws ProgramError(InvalidInstruction) on a malformed message.
TransferArgs decodeTransfer(const Bytes& message);

struct TransactionReceipt {
    std::optional<ErrorCode> error;
    std::string errorMessage;
    std::vector<std::string> logs;
    std::string transcriptLeaf;

    bool ok() const { return !error.has_value(); }
};

// In-process host ledger: balances, program-owned records, a clock and
// serialized, all-or-nothing transaction processing.
class Ledger {
public:
    explicit Ledger(std::int64_t now = 0);

    std::int64_t now() const;
    void setTime(std::int64_t now);
    void advanceTime(std::int64_t seconds);

    void airdrop(const Pubkey& to, std::uint64_t amount);
    std::uint64_t balance(const Pubkey& address) const;
    std::optional<Account> getAccount(const Pubkey& address) const;
    std::vector<std::pair<Pubkey, Account>> accountsOwnedBy(const Pubkey& owner) const;

    TransactionReceipt process(const Transaction& tx, Program& program);
    // Moves lamports out of a system account whose owner signed an encoded
    // TransferArgs message. Program-owned sources are refused.
    TransactionReceipt transfer(const Transaction& tx);

    TranscriptLog transcript() const;
    std::string transcriptRoot() const;

private:
    std::set<Pubkey> verifySignatures(const Transaction& tx) const;

    mutable std::mutex mutex_;
    std::int64_t now_;
    AccountMap accounts_;
    TranscriptLog transcript_;
};

} // namespace pm
