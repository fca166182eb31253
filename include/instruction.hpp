#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pm {

struct CreateMarketArgs {
    Pubkey creator{};
    std::string question;
    std::int64_t endTime = 0;
    Hash questionHash{};
    std::optional<Pubkey> resolutionAuthority;
};

struct PlaceBetArgs {
    Pubkey bettor{};
    Pubkey market{};
    std::uint64_t amount = 0;
    bool outcome = false;
};

struct ResolveMarketArgs {
    Pubkey authority{};
    Pubkey market{};
    bool outcome = false;
};

struct ClaimWinningsArgs {
    Pubkey bettor{};
    Pubkey market{};
    Pubkey bet{};
};

using Instruction = std::variant<CreateMarketArgs, PlaceBetArgs, ResolveMarketArgs, ClaimWinningsArgs>;

// | tag u8 | fields... | little-endian, strings u32-length prefixed,
// optional keys prefixed by a presence byte.
Bytes encodeInstruction(const Instruction& ix);
Instruction decodeInstruction(const Bytes& data);

const char* instructionName(const Instruction& ix);

} // namespace pm
