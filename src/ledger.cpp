#include "ledger.hpp"

#include "checked_math.hpp"
#include "codec.hpp"

#include <sstream>

namespace pm {

namespace {

std::string describeTransaction(const Transaction& tx, const Pubkey& programId, std::int64_t now) {
    std::ostringstream oss;
    oss << "tx|program=" << toHex(programId) << "|time=" << now << "|signers=";
    for (std::size_t i = 0; i < tx.signatures.size(); ++i) {
        if (i != 0) {
            oss << ",";
        }
        oss << toHex(tx.signatures[i].signer);
    }
    oss << "|message=" << toHex(tx.message);
    return oss.str();
}

class SystemProgram : public Program {
public:
    const Pubkey& programId() const override { return kSystemOwner; }

    void processInstruction(InvokeContext& ctx, const Bytes& instruction) override {
        TransferArgs args = decodeTransfer(instruction);
        ctx.systemTransfer(args.from, args.to, args.amount);
        std::ostringstream oss;
        oss << "Transfer: " << args.amount << " to " << shortKey(args.to);
        ctx.log(oss.str());
    }
};

} // namespace

Bytes encodeTransfer(const TransferArgs& args) {
    ByteWriter w;
    w.putKey(args.from);
    w.putKey(args.to);
    w.putU64(args.amount);
    return w.take();
}

TransferArgs decodeTransfer(const Bytes& message) {
    ByteReader r(message, ErrorCode::InvalidInstruction);
    TransferArgs args;
    args.from = r.getKey();
    args.to = r.getKey();
    args.amount = r.getU64();
    r.expectEnd();
    return args;
}

InvokeContext::InvokeContext(AccountMap& accounts,
                             std::int64_t now,
                             const Pubkey& programId,
                             std::set<Pubkey> signers)
    : accounts_(accounts)
    , now_(now)
    , programId_(programId)
    , signers_(std::move(signers)) {}

void InvokeContext::requireSigner(const Pubkey& key) const {
    if (!isSigner(key)) {
        throw ProgramError(ErrorCode::MissingSignature, shortKey(key));
    }
}

const Account* InvokeContext::find(const Pubkey& address) const {
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::uint64_t InvokeContext::balance(const Pubkey& address) const {
    const Account* account = find(address);
    return account ? account->lamports : 0;
}

bool InvokeContext::isAllocated(const Pubkey& address) const {
    const Account* account = find(address);
    return account != nullptr && (account->owner != kSystemOwner || !account->data.empty());
}

Account& InvokeContext::createProgramAccount(const Pubkey& address, std::size_t space) {
    if (isAllocated(address)) {
        throw ProgramError(ErrorCode::AlreadyExists, shortKey(address));
    }
    // A funded system account with no data is taken over with its lamports.
    Account& account = accounts_[address];
    account.owner = programId_;
    account.data.assign(space, 0);
    return account;
}

Account& InvokeContext::programAccount(const Pubkey& address) {
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        throw ProgramError(ErrorCode::AccountNotFound, shortKey(address));
    }
    if (it->second.owner != programId_) {
        throw ProgramError(ErrorCode::InvalidAccountData, "account not owned by program");
    }
    return it->second;
}

void InvokeContext::systemTransfer(const Pubkey& from, const Pubkey& to, std::uint64_t amount) {
    requireSigner(from);
    auto it = accounts_.find(from);
    if (it == accounts_.end() || it->second.lamports < amount) {
        throw ProgramError(ErrorCode::InsufficientFunds, shortKey(from));
    }
    if (it->second.owner != kSystemOwner) {
        throw ProgramError(ErrorCode::UnauthorizedEscrowAccess, "system transfer from a program-owned account");
    }
    it->second.lamports -= amount;
    credit(to, amount);
}

void InvokeContext::debitProgramAccount(const Pubkey& from, const Pubkey& to, std::uint64_t amount) {
    auto it = accounts_.find(from);
    if (it == accounts_.end()) {
        throw ProgramError(ErrorCode::AccountNotFound, shortKey(from));
    }
    if (it->second.owner != programId_) {
        throw ProgramError(ErrorCode::UnauthorizedEscrowAccess, shortKey(from));
    }
    if (it->second.lamports < amount) {
        throw ProgramError(ErrorCode::InsufficientPoolBalance, shortKey(from));
    }
    it->second.lamports -= amount;
    credit(to, amount);
}

void InvokeContext::credit(const Pubkey& to, std::uint64_t amount) {
    Account& dest = accounts_[to];
    dest.lamports = checkedAdd(dest.lamports, amount);
}

void InvokeContext::log(const std::string& line) {
    logs_.push_back("Program log: " + line);
}

Ledger::Ledger(std::int64_t now) : now_(now) {}

std::int64_t Ledger::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void Ledger::setTime(std::int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = now;
}

void Ledger::advanceTime(std::int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += seconds;
}

void Ledger::airdrop(const Pubkey& to, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Account& account = accounts_[to];
    account.lamports = checkedAdd(account.lamports, amount);
}

std::uint64_t Ledger::balance(const Pubkey& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    return it == accounts_.end() ? 0 : it->second.lamports;
}

std::optional<Account> Ledger::getAccount(const Pubkey& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<Pubkey, Account>> Ledger::accountsOwnedBy(const Pubkey& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<Pubkey, Account>> out;
    for (const auto& [address, account] : accounts_) {
        if (account.owner == owner) {
            out.emplace_back(address, account);
        }
    }
    return out;
}

std::set<Pubkey> Ledger::verifySignatures(const Transaction& tx) const {
    std::set<Pubkey> signers;
    for (const auto& entry : tx.signatures) {
        if (!verifySignature(entry.signer, tx.message, entry.signature)) {
            throw ProgramError(ErrorCode::InvalidSignature, shortKey(entry.signer));
        }
        signers.insert(entry.signer);
    }
    return signers;
}

TransactionReceipt Ledger::process(const Transaction& tx, Program& program) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransactionReceipt receipt;

    std::set<Pubkey> signers;
    try {
        signers = verifySignatures(tx);
    } catch (const ProgramError& err) {
        receipt.error = err.code();
        receipt.errorMessage = err.what();
        return receipt;
    }

    AccountMap working = accounts_;
    InvokeContext ctx(working, now_, program.programId(), std::move(signers));
    try {
        program.processInstruction(ctx, tx.message);
    } catch (const ProgramError& err) {
        // The working copy is dropped, so nothing the program touched persists.
        ctx.log(std::string("failed: ") + err.what());
        receipt.error = err.code();
        receipt.errorMessage = err.what();
        receipt.logs = ctx.logs();
        return receipt;
    }

    accounts_ = std::move(working);
    receipt.logs = ctx.logs();
    receipt.transcriptLeaf = transcript_.append(describeTransaction(tx, program.programId(), now_));
    return receipt;
}

TransactionReceipt Ledger::transfer(const Transaction& tx) {
    SystemProgram system;
    return process(tx, system);
}

TranscriptLog Ledger::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

std::string Ledger::transcriptRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_.merkleRoot();
}

} // namespace pm
