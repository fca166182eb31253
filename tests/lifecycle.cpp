#include "address.hpp"
#include "audit.hpp"
#include "client.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "keys.hpp"
#include "ledger.hpp"
#include "program.hpp"
#include "records.hpp"
#include "transaction.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace {

constexpr std::int64_t kStart = 1'700'000'000;
constexpr std::int64_t kWindow = 3'600;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "lifecycle_test failure: " << msg << std::endl;
    std::exit(1);
}

pm::Keypair keyFor(const std::string& label) {
    return pm::Keypair::fromSeed(pm::sha256(label));
}

void expectOk(const pm::TransactionReceipt& receipt, const std::string& what) {
    if (!receipt.ok()) {
        fail(what + ": unexpected " + pm::errorCodeName(*receipt.error) + " (" + receipt.errorMessage + ")");
    }
}

void expectCode(const pm::TransactionReceipt& receipt, pm::ErrorCode code, const std::string& what) {
    if (receipt.ok()) {
        fail(what + ": expected " + pm::errorCodeName(code) + " but transaction succeeded");
    }
    if (*receipt.error != code) {
        fail(what + ": expected " + pm::errorCodeName(code) + ", got " + pm::errorCodeName(*receipt.error));
    }
}

void expectEq(std::uint64_t actual, std::uint64_t expected, const std::string& what) {
    if (actual != expected) {
        fail(what + ": expected " + std::to_string(expected) + ", got " + std::to_string(actual));
    }
}

pm::TransactionReceipt sendLamports(pm::Ledger& ledger,
                                   const pm::Keypair& from,
                                   const pm::Pubkey& to,
                                   std::uint64_t amount) {
    pm::Transaction tx(pm::encodeTransfer(pm::TransferArgs{ from.pubkey(), to, amount }));
    tx.sign(from);
    return ledger.transfer(tx);
}

struct Fixture {
    pm::Ledger ledger{ kStart };
    pm::PredictionMarketProgram program;
    pm::MarketClient client{ ledger, program };
    pm::Keypair creator = keyFor("creator");
    pm::Keypair alice = keyFor("alice");
    pm::Keypair bob = keyFor("bob");
    pm::Keypair dave = keyFor("dave");

    Fixture() {
        for (const pm::Keypair* key : { &creator, &alice, &bob, &dave }) {
            ledger.airdrop(key->pubkey(), 1'000);
        }
    }

    pm::Pubkey open(const std::string& question) {
        expectOk(client.createMarket(creator, question, kStart + kWindow), "create " + question);
        return client.marketAddress(creator.pubkey(), question);
    }
};

void fullLifecycle() {
    Fixture f;
    pm::Pubkey market = f.open("Will it rain tomorrow?");

    auto record = f.client.fetchMarket(market);
    if (!record || record->resolved() || record->feeBasisPoints != 100) {
        fail("fresh market not stored as expected");
    }
    if (record->resolutionAuthority != f.creator.pubkey()) {
        fail("authority should default to the creator");
    }

    expectOk(f.client.placeBet(f.alice, market, 50, true), "alice bets");
    expectOk(f.client.placeBet(f.bob, market, 50, true), "bob bets");
    expectOk(f.client.placeBet(f.dave, market, 200, false), "dave bets");
    expectEq(f.ledger.balance(market), 300, "pool after bets");
    expectEq(f.ledger.balance(f.alice.pubkey()), 950, "alice after bet");

    expectCode(f.client.placeBet(f.alice, market, 10, false), pm::ErrorCode::AlreadyExists, "second wager");
    expectCode(f.client.claimWinnings(f.alice, market), pm::ErrorCode::MarketNotResolved, "claim before resolve");
    expectCode(f.client.resolveMarket(f.creator, market, true), pm::ErrorCode::BettingPeriodNotEnded, "early resolve");

    f.ledger.advanceTime(kWindow);
    expectCode(f.client.placeBet(f.creator, market, 10, true), pm::ErrorCode::BettingPeriodEnded, "bet at end time");
    expectCode(f.client.resolveMarket(f.alice, market, false), pm::ErrorCode::UnauthorizedResolution, "stranger resolves");
    expectOk(f.client.resolveMarket(f.creator, market, true), "resolve");
    expectCode(f.client.resolveMarket(f.creator, market, false), pm::ErrorCode::AlreadyResolved, "resolve twice");
    expectCode(f.client.resolveMarket(f.alice, market, false), pm::ErrorCode::UnauthorizedResolution,
               "stranger on a resolved market");
    expectCode(f.client.placeBet(f.creator, market, 10, true), pm::ErrorCode::AlreadyResolved, "bet after resolve");

    auto claim = f.client.claimWinnings(f.alice, market);
    expectOk(claim, "alice claims");
    bool logged = false;
    for (const auto& line : claim.logs) {
        logged = logged || line == "Program log: Winnings claimed: 148";
    }
    if (!logged) {
        fail("claim did not log its payout");
    }
    expectEq(f.ledger.balance(f.alice.pubkey()), 1'098, "alice after claim");
    expectCode(f.client.claimWinnings(f.alice, market), pm::ErrorCode::AlreadyClaimed, "double claim");
    expectCode(f.client.claimWinnings(f.dave, market), pm::ErrorCode::NotAWinner, "loser claims");
    expectCode(f.client.claimWinnings(f.creator, market), pm::ErrorCode::AccountNotFound, "claim without a bet");
    expectOk(f.client.claimWinnings(f.bob, market), "bob claims");

    expectEq(f.ledger.balance(market), 4, "fee and dust stay in the pool");

    auto bet = f.client.fetchBet(f.client.betAddress(market, f.alice.pubkey()));
    if (!bet || !bet->claimed || bet->amount != 50 || !bet->outcomeChosen) {
        fail("claimed bet record not updated");
    }

    pm::MarketAudit audit = pm::auditMarket(f.ledger, f.program.programId(), market);
    if (!audit.totalsMatchBets() || !audit.escrowCoversFlows() || audit.surplus() != 0) {
        fail("audit does not balance");
    }
    expectEq(audit.claimedStake, 100, "claimed stake");
    expectEq(audit.liabilities.totalLiability, 300, "liability total");
    expectEq(audit.liabilities.betCount, 3, "liability count");
    expectEq(audit.paidOut, 296, "paid out");
}

void creationRules() {
    Fixture f;
    f.open("Duplicate?");
    expectCode(f.client.createMarket(f.creator, "Duplicate?", kStart + kWindow), pm::ErrorCode::AlreadyExists,
               "same question twice");
    expectOk(f.client.createMarket(f.alice, "Duplicate?", kStart + kWindow), "other creator, same question");

    expectCode(f.client.createMarket(f.creator, "past", kStart), pm::ErrorCode::InvalidEndTime, "end time now");
    expectCode(f.client.createMarket(f.creator, std::string(201, 'x'), kStart + 1), pm::ErrorCode::QuestionTooLong,
               "long question");
    expectOk(f.client.createMarket(f.creator, std::string(200, 'x'), kStart + 1), "question at the limit");

    pm::CreateMarketArgs forged;
    forged.creator = f.creator.pubkey();
    forged.question = "real text";
    forged.questionHash = pm::hashQuestion("other text");
    forged.endTime = kStart + 10;
    expectCode(f.client.submit(forged, { &f.creator }), pm::ErrorCode::QuestionHashMismatch, "hash mismatch");

    expectCode(f.client.submit(forged, {}), pm::ErrorCode::MissingSignature, "unsigned create");

    pm::Keypair oracle = keyFor("oracle");
    expectOk(f.client.createMarket(f.creator, "delegated", kStart + 5, oracle.pubkey()), "custom authority");
    pm::Pubkey delegated = f.client.marketAddress(f.creator.pubkey(), "delegated");
    f.ledger.advanceTime(5);
    expectCode(f.client.resolveMarket(f.creator, delegated, true), pm::ErrorCode::UnauthorizedResolution,
               "creator is not the authority");
    expectOk(f.client.resolveMarket(oracle, delegated, false), "delegated resolve");
    if (f.client.fetchMarket(delegated)->outcome != pm::Outcome::No) {
        fail("delegated outcome not stored");
    }
}

void wagerRules() {
    Fixture f;
    pm::Pubkey market = f.open("Wager rules");
    std::size_t committed = f.ledger.transcript().size();

    expectCode(f.client.placeBet(f.alice, market, 0, true), pm::ErrorCode::InvalidAmount, "zero stake");
    expectCode(f.client.placeBet(f.alice, market, 1'001, true), pm::ErrorCode::InsufficientFunds, "overdraw");
    expectEq(f.ledger.balance(f.alice.pubkey()), 1'000, "balance after failed wagers");
    if (f.client.fetchBet(f.client.betAddress(market, f.alice.pubkey()))) {
        fail("failed wager left a record behind");
    }
    if (f.ledger.transcript().size() != committed) {
        fail("failed transactions reached the transcript");
    }

    pm::Pubkey nowhere = f.client.marketAddress(f.creator.pubkey(), "never created");
    expectCode(f.client.placeBet(f.alice, nowhere, 5, true), pm::ErrorCode::AccountNotFound, "missing market");

    pm::PlaceBetArgs impostor{ f.alice.pubkey(), market, 5, true };
    expectCode(f.client.submit(impostor, { &f.bob }), pm::ErrorCode::MissingSignature, "bet signed by someone else");

    expectOk(f.client.placeBet(f.alice, market, 100, true), "alice bets");
    expectOk(f.client.placeBet(f.bob, market, 200, false), "bob bets");
    expectEq(f.client.quotePayout(market, 100, true), 198, "quote for a new yes stake");

    f.ledger.setTime(kStart + kWindow + 60);
    expectCode(f.client.placeBet(f.dave, market, 10, true), pm::ErrorCode::BettingPeriodEnded, "bet after end time");
    expectEq(f.ledger.balance(f.dave.pubkey()), 1'000, "late bettor keeps funds");
}

// Lamports sent to a derived address before its record exists do not block the
// record; they stay on the account.
void prefundedAddresses() {
    Fixture f;
    const std::string question = "Funded ahead of time";
    pm::Pubkey market = f.client.marketAddress(f.creator.pubkey(), question);
    pm::Pubkey aliceBet = f.client.betAddress(market, f.alice.pubkey());
    f.ledger.airdrop(market, 7);
    expectOk(sendLamports(f.ledger, f.dave, aliceBet, 3), "fund the bet address");

    expectOk(f.client.createMarket(f.creator, question, kStart + kWindow), "create over a funded address");
    expectEq(f.ledger.balance(market), 7, "market keeps prior lamports");
    expectCode(f.client.createMarket(f.creator, question, kStart + kWindow), pm::ErrorCode::AlreadyExists,
               "market record still unique");

    expectOk(f.client.placeBet(f.alice, market, 100, true), "bet over a funded address");
    expectOk(f.client.placeBet(f.bob, market, 100, false), "bob bets");
    expectEq(f.ledger.balance(aliceBet), 3, "bet record keeps prior lamports");
    expectCode(f.client.placeBet(f.alice, market, 5, true), pm::ErrorCode::AlreadyExists, "bet record still unique");

    f.ledger.advanceTime(kWindow);
    expectOk(f.client.resolveMarket(f.creator, market, true), "resolve");
    expectOk(f.client.claimWinnings(f.alice, market), "alice claims");
    expectEq(f.ledger.balance(f.alice.pubkey()), 1'098, "payout ignores outside credit");

    pm::MarketAudit audit = pm::auditMarket(f.ledger, f.program.programId(), market);
    if (!audit.totalsMatchBets() || !audit.escrowCoversFlows()) {
        fail("audit of a prefunded market does not balance");
    }
    expectEq(audit.surplus(), 7, "outside credit reported as surplus");
}

// A pool holding less than its recorded totals refuses the claim outright.
void claimAgainstShortPool() {
    pm::PredictionMarketProgram program;
    pm::Keypair creator = keyFor("short-pool-creator");
    pm::Keypair bettor = keyFor("short-pool-bettor");
    const pm::Hash questionHash = pm::hashQuestion("short pool");
    pm::Pubkey market = pm::deriveMarketAddress(program.programId(), creator.pubkey(), questionHash).address;
    pm::Pubkey betAddress = pm::deriveBetAddress(program.programId(), market, bettor.pubkey()).address;

    pm::Market record;
    record.creator = creator.pubkey();
    record.resolutionAuthority = creator.pubkey();
    record.question = "short pool";
    record.questionHash = questionHash;
    record.endTime = kStart;
    record.outcome = pm::Outcome::Yes;
    record.totalYesAmount = 100;
    record.feeBasisPoints = 100;

    pm::Bet bet;
    bet.bettor = bettor.pubkey();
    bet.market = market;
    bet.amount = 100;
    bet.outcomeChosen = true;

    pm::AccountMap accounts;
    pm::Account& pool = accounts[market];
    pool.owner = program.programId();
    pool.lamports = 10;
    pool.data = pm::encodeMarket(record);
    pm::Account& betAccount = accounts[betAddress];
    betAccount.owner = program.programId();
    betAccount.data = pm::encodeBet(bet);

    pm::InvokeContext ctx(accounts, kStart + kWindow, program.programId(), { bettor.pubkey() });
    try {
        program.claimWinnings(ctx, pm::ClaimWinningsArgs{ bettor.pubkey(), market, betAddress });
        fail("claim paid out of a short pool");
    } catch (const pm::ProgramError& err) {
        if (err.code() != pm::ErrorCode::InsufficientPoolBalance) {
            fail(std::string("short pool: expected InsufficientPoolBalance, got ") + pm::errorCodeName(err.code()));
        }
    }
    expectEq(pool.lamports, 10, "short pool untouched");
    if (accounts.count(bettor.pubkey()) != 0 || pm::decodeBet(betAccount.data).claimed) {
        fail("refused claim changed state");
    }
}

void claimRules() {
    Fixture f;
    pm::Pubkey market = f.open("Claim rules");
    expectOk(f.client.placeBet(f.alice, market, 100, true), "alice bets");
    expectOk(f.client.placeBet(f.bob, market, 100, true), "bob bets");
    f.ledger.advanceTime(kWindow);
    expectOk(f.client.resolveMarket(f.creator, market, true), "resolve");

    pm::Pubkey aliceBet = f.client.betAddress(market, f.alice.pubkey());
    pm::ClaimWinningsArgs stolen{ f.bob.pubkey(), market, aliceBet };
    expectCode(f.client.submit(stolen, { &f.bob }), pm::ErrorCode::InvalidBettor, "claim another bettor's record");

    pm::ClaimWinningsArgs unsigned_{ f.alice.pubkey(), market, aliceBet };
    expectCode(f.client.submit(unsigned_, { &f.bob }), pm::ErrorCode::MissingSignature, "claim without signature");

    // No losing side: each winner gets stake back less the fee share.
    expectOk(f.client.claimWinnings(f.alice, market), "alice claims");
    expectEq(f.ledger.balance(f.alice.pubkey()), 999, "alice after one-sided claim");
}

void arithmeticLimits() {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    Fixture f;
    pm::Keypair whale = keyFor("whale");
    f.ledger.airdrop(whale.pubkey(), kMax - 10);

    pm::Pubkey market = f.open("Overflow");
    expectOk(f.client.placeBet(whale, market, kMax - 10, true), "whale bets");
    expectCode(f.client.placeBet(f.alice, market, 20, true), pm::ErrorCode::MathOverflow, "yes total overflows");
    expectEq(f.ledger.balance(f.alice.pubkey()), 1'000, "alice untouched by failed wager");
    expectOk(f.client.placeBet(f.bob, market, 5, false), "bob bets no");

    f.ledger.advanceTime(kWindow);
    expectOk(f.client.resolveMarket(f.creator, market, true), "resolve");
    expectCode(f.client.claimWinnings(whale, market), pm::ErrorCode::MathOverflow, "payout product overflows");
    auto bet = f.client.fetchBet(f.client.betAddress(market, whale.pubkey()));
    if (!bet || bet->claimed) {
        fail("overflowing claim should leave the bet unclaimed");
    }
    expectEq(f.ledger.balance(market), kMax - 5, "pool untouched by failed claim");
}

void emptyWinningSide() {
    Fixture f;
    pm::Pubkey market = f.open("Nobody picked yes");
    expectOk(f.client.placeBet(f.alice, market, 100, false), "alice bets no");
    f.ledger.advanceTime(kWindow);
    expectOk(f.client.resolveMarket(f.creator, market, true), "resolve yes");
    expectCode(f.client.claimWinnings(f.alice, market), pm::ErrorCode::NotAWinner, "no winners to pay");
    expectEq(f.ledger.balance(market), 100, "stakes stay locked");
}

void transcriptCoversCommits() {
    Fixture f;
    pm::Pubkey market = f.open("Transcript");
    auto receipt = f.client.placeBet(f.alice, market, 10, true);
    expectOk(receipt, "bet");
    pm::TranscriptLog log = f.ledger.transcript();
    if (log.size() != 2) {
        fail("expected two committed transactions");
    }
    if (log.getLeaf(1) != receipt.transcriptLeaf) {
        fail("receipt leaf does not match the transcript");
    }
    if (!pm::TranscriptLog::verifyProof(receipt.transcriptLeaf, log.merkleProof(1), f.ledger.transcriptRoot())) {
        fail("receipt leaf is not provable against the root");
    }
}

} // namespace

int main() {
    fullLifecycle();
    creationRules();
    wagerRules();
    claimRules();
    arithmeticLimits();
    emptyWinningSide();
    prefundedAddresses();
    claimAgainstShortPool();
    transcriptCoversCommits();
    std::cout << "lifecycle_test passed" << std::endl;
    return 0;
}
