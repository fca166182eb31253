#include "audit.hpp"
#include "client.hpp"
#include "errors.hpp"
#include "keys.hpp"
#include "ledger.hpp"
#include "program.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace pm;

namespace {

constexpr std::int64_t kStartTime = 1'700'000'000;
constexpr std::int64_t kBettingWindow = 86'400;

void printReceipt(const std::string& label, const TransactionReceipt& receipt) {
    std::cout << "\n> " << label << ": " << (receipt.ok() ? "ok" : "FAILED") << "\n";
    for (const auto& line : receipt.logs) {
        std::cout << "    " << line << "\n";
    }
    if (!receipt.ok()) {
        std::cout << "    error: " << receipt.errorMessage << "\n";
    }
}

bool expectOk(const std::string& label, const TransactionReceipt& receipt) {
    printReceipt(label, receipt);
    return receipt.ok();
}

} // namespace

int main() {
    try {
        ProgramConfig cfg = ProgramConfig::fromEnvironment();
        PredictionMarketProgram program(cfg);
        Ledger ledger(kStartTime);
        MarketClient client(ledger, program);

        std::cout << "Prediction market demo\n";
        std::cout << "Program id: " << toHex(program.programId()) << "\n";
        std::cout << "Default fee: " << cfg.defaultFeeBasisPoints << " basis points\n";

        Keypair creator = Keypair::generate();
        Keypair alice = Keypair::generate();
        Keypair bob = Keypair::generate();
        Keypair carol = Keypair::generate();
        for (const Keypair* kp : { &creator, &alice, &bob, &carol }) {
            ledger.airdrop(kp->pubkey(), 1'000);
        }

        const std::string question = "Will the demo pay out 148 units to each Yes bettor?";
        if (!expectOk("create_market", client.createMarket(creator, question, kStartTime + kBettingWindow))) {
            return 1;
        }
        Pubkey market = client.marketAddress(creator.pubkey(), question);
        std::cout << "Market address: " << toHex(market) << "\n";

        bool placed = expectOk("alice bets 50 on Yes", client.placeBet(alice, market, 50, true)) &&
                      expectOk("bob bets 50 on Yes", client.placeBet(bob, market, 50, true)) &&
                      expectOk("carol bets 200 on No", client.placeBet(carol, market, 200, false));
        if (!placed) {
            return 1;
        }

        printReceipt("alice bets again", client.placeBet(alice, market, 10, false));
        printReceipt("early resolution", client.resolveMarket(creator, market, true));

        ledger.advanceTime(kBettingWindow);
        if (!expectOk("resolve Yes", client.resolveMarket(creator, market, true))) {
            return 1;
        }

        if (!expectOk("alice claims", client.claimWinnings(alice, market)) ||
            !expectOk("bob claims", client.claimWinnings(bob, market))) {
            return 1;
        }
        printReceipt("carol claims", client.claimWinnings(carol, market));
        printReceipt("alice claims again", client.claimWinnings(alice, market));

        MarketAudit audit = auditMarket(ledger, program.programId(), market);
        std::cout << "\n=== MARKET AUDIT ===\n";
        std::cout << "Totals: yes=" << audit.market.totalYesAmount << " no=" << audit.market.totalNoAmount << "\n";
        std::cout << "Bets: " << audit.liabilities.betCount << " liability=" << audit.liabilities.totalLiability
                  << " root=" << audit.liabilities.merkleRoot << "\n";
        std::cout << "Claimed stake: " << audit.claimedStake << "  Paid out: " << audit.paidOut
                  << "  Escrow remaining: " << audit.escrowBalance << " (surplus " << audit.surplus() << ")\n";
        std::cout << "Totals match bets: " << (audit.totalsMatchBets() ? "yes" : "NO") << "\n";
        std::cout << "Escrow covers flows: " << (audit.escrowCoversFlows() ? "yes" : "NO") << "\n";

        std::cout << "\nBalances:\n";
        std::cout << "  alice " << ledger.balance(alice.pubkey()) << "\n";
        std::cout << "  bob   " << ledger.balance(bob.pubkey()) << "\n";
        std::cout << "  carol " << ledger.balance(carol.pubkey()) << "\n";
        std::cout << "\nTranscript root (" << ledger.transcript().size() << " committed): "
                  << ledger.transcriptRoot() << "\n";
    } catch (const std::exception& ex) {
        std::cerr << "demo failed: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
