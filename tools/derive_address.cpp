#include "address.hpp"
#include "hash.hpp"
#include "program_config.hpp"
#include "types.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: derive_address <creatorPubkeyHex> <question> [bettorPubkeyHex]\n";
        std::cerr << "Environment: PM_PROGRAM_LABEL selects the program id (default \"prediction-market\").\n";
        return 1;
    }

    try {
        pm::ProgramConfig cfg = pm::ProgramConfig::fromEnvironment();
        pm::Pubkey programId = pm::programIdFromLabel(cfg.programLabel);
        pm::Pubkey creator = pm::pubkeyFromHex(argv[1]);
        std::string question = argv[2];
        pm::Hash questionHash = pm::hashQuestion(question);

        auto market = pm::deriveMarketAddress(programId, creator, questionHash);
        std::cout << "Program id:    " << pm::toHex(programId) << '\n';
        std::cout << "Question hash: " << pm::toHex(questionHash) << '\n';
        std::cout << "Market:        " << pm::toHex(market.address) << " (bump " << static_cast<int>(market.bump)
                  << ")\n";

        if (argc > 3) {
            pm::Pubkey bettor = pm::pubkeyFromHex(argv[3]);
            auto bet = pm::deriveBetAddress(programId, market.address, bettor);
            std::cout << "Bet:           " << pm::toHex(bet.address) << " (bump " << static_cast<int>(bet.bump)
                      << ")\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "derive_address: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
