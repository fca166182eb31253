#include "instruction.hpp"

#include "codec.hpp"
#include "errors.hpp"

#include <type_traits>

namespace pm {

namespace {

enum class InstructionTag : std::uint8_t {
    CreateMarket = 0,
    PlaceBet = 1,
    ResolveMarket = 2,
    ClaimWinnings = 3,
};

// Questions longer than the record bound still decode so the program can
// reject them with QuestionTooLong rather than a codec error.
constexpr std::size_t kMaxEncodedQuestion = 4096;

} // namespace

Bytes encodeInstruction(const Instruction& ix) {
    ByteWriter w;
    std::visit(
        [&w](const auto& args) {
            using T = std::decay_t<decltype(args)>;
            if constexpr (std::is_same_v<T, CreateMarketArgs>) {
                w.putU8(static_cast<std::uint8_t>(InstructionTag::CreateMarket));
                w.putKey(args.creator);
                w.putString(args.question);
                w.putI64(args.endTime);
                w.putKey(args.questionHash);
                w.putBool(args.resolutionAuthority.has_value());
                if (args.resolutionAuthority) {
                    w.putKey(*args.resolutionAuthority);
                }
            } else if constexpr (std::is_same_v<T, PlaceBetArgs>) {
                w.putU8(static_cast<std::uint8_t>(InstructionTag::PlaceBet));
                w.putKey(args.bettor);
                w.putKey(args.market);
                w.putU64(args.amount);
                w.putBool(args.outcome);
            } else if constexpr (std::is_same_v<T, ResolveMarketArgs>) {
                w.putU8(static_cast<std::uint8_t>(InstructionTag::ResolveMarket));
                w.putKey(args.authority);
                w.putKey(args.market);
                w.putBool(args.outcome);
            } else {
                w.putU8(static_cast<std::uint8_t>(InstructionTag::ClaimWinnings));
                w.putKey(args.bettor);
                w.putKey(args.market);
                w.putKey(args.bet);
            }
        },
        ix);
    return w.take();
}

Instruction decodeInstruction(const Bytes& data) {
    ByteReader r(data, ErrorCode::InvalidInstruction);
    auto tag = static_cast<InstructionTag>(r.getU8());
    switch (tag) {
    case InstructionTag::CreateMarket: {
        CreateMarketArgs args;
        args.creator = r.getKey();
        args.question = r.getString(kMaxEncodedQuestion);
        args.endTime = r.getI64();
        args.questionHash = r.getKey();
        if (r.getBool()) {
            args.resolutionAuthority = r.getKey();
        }
        r.expectEnd();
        return args;
    }
    case InstructionTag::PlaceBet: {
        PlaceBetArgs args;
        args.bettor = r.getKey();
        args.market = r.getKey();
        args.amount = r.getU64();
        args.outcome = r.getBool();
        r.expectEnd();
        return args;
    }
    case InstructionTag::ResolveMarket: {
        ResolveMarketArgs args;
        args.authority = r.getKey();
        args.market = r.getKey();
        args.outcome = r.getBool();
        r.expectEnd();
        return args;
    }
    case InstructionTag::ClaimWinnings: {
        ClaimWinningsArgs args;
        args.bettor = r.getKey();
        args.market = r.getKey();
        args.bet = r.getKey();
        r.expectEnd();
        return args;
    }
    }
    r.fail("unknown instruction tag");
}

const char* instructionName(const Instruction& ix) {
    switch (ix.index()) {
    case 0: return "create_market";
    case 1: return "place_bet";
    case 2: return "resolve_market";
    case 3: return "claim_winnings";
    }
    return "unknown";
}

} // namespace pm
