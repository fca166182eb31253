#include "address.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "keys.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "address_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectInvalidSeeds(const pm::Seeds& seeds, const pm::Pubkey& programId, const std::string& what) {
    try {
        pm::findProgramAddress(seeds, programId);
    } catch (const pm::ProgramError& err) {
        if (err.code() != pm::ErrorCode::InvalidSeeds) {
            fail(what + ": wrong error");
        }
        return;
    }
    fail(what + ": accepted");
}

} // namespace

int main() {
    using namespace pm;

    Pubkey programId = programIdFromLabel("address-test");
    Keypair creator = Keypair::fromSeed(sha256(std::string("creator")));
    Keypair bettor = Keypair::fromSeed(sha256(std::string("bettor")));
    Keypair other = Keypair::fromSeed(sha256(std::string("other")));

    if (!isOnCurve(creator.pubkey())) {
        fail("a real signing key should be on the curve");
    }

    Hash question = hashQuestion("Will it rain tomorrow?");
    DerivedAddress first = deriveMarketAddress(programId, creator.pubkey(), question);
    DerivedAddress second = deriveMarketAddress(programId, creator.pubkey(), question);
    if (first.address != second.address || first.bump != second.bump) {
        fail("market derivation is not deterministic");
    }
    if (isOnCurve(first.address)) {
        fail("derived market address has a possible private key");
    }

    if (deriveMarketAddress(programId, creator.pubkey(), hashQuestion("Will it rain today?")).address ==
        first.address) {
        fail("different questions share a market address");
    }
    if (deriveMarketAddress(programId, other.pubkey(), question).address == first.address) {
        fail("different creators share a market address");
    }
    if (deriveMarketAddress(programIdFromLabel("another-program"), creator.pubkey(), question).address ==
        first.address) {
        fail("different programs share a market address");
    }

    // The found bump reproduces the same address through the explicit path.
    Seeds explicitSeeds{ seedFromString("market"), seedFromKey(creator.pubkey()), seedFromKey(question),
                         Bytes{ first.bump } };
    if (createProgramAddress(explicitSeeds, programId) != first.address) {
        fail("createProgramAddress disagrees with findProgramAddress");
    }

    DerivedAddress bet = deriveBetAddress(programId, first.address, bettor.pubkey());
    if (bet.address != deriveBetAddress(programId, first.address, bettor.pubkey()).address) {
        fail("bet derivation is not deterministic");
    }
    if (bet.address == deriveBetAddress(programId, first.address, other.pubkey()).address) {
        fail("different bettors share a bet address");
    }
    if (bet.address == first.address) {
        fail("bet and market addresses collide");
    }

    expectInvalidSeeds(Seeds{ Bytes(33, 0x11) }, programId, "oversized seed");
    expectInvalidSeeds(Seeds(16, Bytes{ 0x01 }), programId, "too many seeds once the bump is added");

    std::cout << "address_test passed" << std::endl;
    return 0;
}
