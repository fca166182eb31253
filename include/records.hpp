#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pm {

// Resolved outcome of a market. Unset until resolution; "resolved but no
// outcome" cannot be expressed.
enum class Outcome : std::uint8_t { Unset = 0, Yes = 1, No = 2 };

inline Outcome outcomeFromBool(bool yes) { return yes ? Outcome::Yes : Outcome::No; }
const char* outcomeLabel(Outcome outcome);

struct Market {
    static constexpr std::size_t kMaxQuestionLength = 200;
    static constexpr std::uint16_t kBasisPointsDenominator = 10'000;

    Pubkey creator{};
    Pubkey resolutionAuthority{};
    std::string question;
    Hash questionHash{};
    std::int64_t endTime = 0;
    Outcome outcome = Outcome::Unset;
    std::uint64_t totalYesAmount = 0;
    std::uint64_t totalNoAmount = 0;
    std::uint16_t feeBasisPoints = 0;
    std::uint8_t bump = 0;

    bool resolved() const { return outcome != Outcome::Unset; }
    bool yesWon() const { return outcome == Outcome::Yes; }

    // Fixed allocation sized for the longest permitted question.
    static std::size_t space();
};

struct Bet {
    Pubkey bettor{};
    Pubkey market{};
    std::uint64_t amount = 0;
    bool outcomeChosen = false;
    bool claimed = false;
    std::uint8_t bump = 0;

    static std::size_t space();
};

constexpr std::size_t kDiscriminatorLength = 8;

Bytes encodeMarket(const Market& market);
Market decodeMarket(const Bytes& data);
Bytes encodeBet(const Bet& bet);
Bet decodeBet(const Bytes& data);

bool isMarketAccount(const Bytes& data);
bool isBetAccount(const Bytes& data);

} // namespace pm
