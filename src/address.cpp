#include "address.hpp"

#include "errors.hpp"
#include "hash.hpp"
#include "keys.hpp"

#include <string_view>

#include <sodium.h>

namespace pm {

namespace {

constexpr std::string_view kDerivationMarker = "ProgramDerivedAddress";
constexpr std::string_view kProgramIdDomainTag = "prediction-market:program:v1|";

void validateSeeds(const Seeds& seeds) {
    if (seeds.size() > kMaxSeeds) {
        throw ProgramError(ErrorCode::InvalidSeeds, "too many seeds");
    }
    for (const auto& seed : seeds) {
        if (seed.size() > kMaxSeedLength) {
            throw ProgramError(ErrorCode::InvalidSeeds, "seed longer than 32 bytes");
        }
    }
}

Pubkey hashSeeds(const Seeds& seeds, const Pubkey& programId) {
    Bytes preimage;
    for (const auto& seed : seeds) {
        preimage.insert(preimage.end(), seed.begin(), seed.end());
    }
    preimage.insert(preimage.end(), programId.begin(), programId.end());
    preimage.insert(preimage.end(), kDerivationMarker.begin(), kDerivationMarker.end());
    return sha256(preimage);
}

} // namespace

Bytes seedFromString(const std::string& tag) {
    return Bytes(tag.begin(), tag.end());
}

Bytes seedFromKey(const Pubkey& key) {
    return Bytes(key.begin(), key.end());
}

bool isOnCurve(const Pubkey& candidate) {
    ensureSodiumReady();
    return crypto_core_ed25519_is_valid_point(candidate.data()) == 1;
}

Pubkey createProgramAddress(const Seeds& seeds, const Pubkey& programId) {
    validateSeeds(seeds);
    Pubkey address = hashSeeds(seeds, programId);
    if (isOnCurve(address)) {
        throw ProgramError(ErrorCode::InvalidSeeds, "derived address lies on the curve");
    }
    return address;
}

DerivedAddress findProgramAddress(const Seeds& seeds, const Pubkey& programId) {
    Seeds withBump = seeds;
    withBump.push_back(Bytes{ 0 });
    validateSeeds(withBump);
    for (int bump = 255; bump >= 0; --bump) {
        withBump.back()[0] = static_cast<std::uint8_t>(bump);
        Pubkey address = hashSeeds(withBump, programId);
        if (!isOnCurve(address)) {
            return DerivedAddress{ address, static_cast<std::uint8_t>(bump) };
        }
    }
    throw ProgramError(ErrorCode::InvalidSeeds, "no viable bump seed");
}

Pubkey programIdFromLabel(const std::string& label) {
    std::string preimage(kProgramIdDomainTag);
    preimage += label;
    return sha256(preimage);
}

DerivedAddress deriveMarketAddress(const Pubkey& programId, const Pubkey& creator, const Hash& questionHash) {
    Seeds seeds{ seedFromString("market"), seedFromKey(creator), seedFromKey(questionHash) };
    return findProgramAddress(seeds, programId);
}

DerivedAddress deriveBetAddress(const Pubkey& programId, const Pubkey& market, const Pubkey& bettor) {
    Seeds seeds{ seedFromString("bet"), seedFromKey(market), seedFromKey(bettor) };
    return findProgramAddress(seeds, programId);
}

} // namespace pm
