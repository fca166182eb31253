#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pm {

constexpr std::size_t kMaxSeeds = 16;
constexpr std::size_t kMaxSeedLength = 32;

struct DerivedAddress {
    Pubkey address{};
    std::uint8_t bump = 0;
};

using Seeds = std::vector<Bytes>;

Bytes seedFromString(const std::string& tag);
Bytes seedFromKey(const Pubkey& key);

// True when the bytes decode to an Ed25519 point in the prime-order subgroup,
// i.e. a key somebody could hold the secret for.
bool isOnCurve(const Pubkey& candidate);

// SHA-256(seeds... || programId || "ProgramDerivedAddress"). Throws
// InvalidSeeds if the seed limits are exceeded or the digest lies on the curve.
Pubkey createProgramAddress(const Seeds& seeds, const Pubkey& programId);

// Searches bump values from 255 down for the first off-curve address.
DerivedAddress findProgramAddress(const Seeds& seeds, const Pubkey& programId);

Pubkey programIdFromLabel(const std::string& label);

DerivedAddress deriveMarketAddress(const Pubkey& programId, const Pubkey& creator, const Hash& questionHash);
DerivedAddress deriveBetAddress(const Pubkey& programId, const Pubkey& market, const Pubkey& bettor);

} // namespace pm
