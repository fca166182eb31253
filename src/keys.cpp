#include "keys.hpp"

#include <stdexcept>

namespace pm {

static_assert(crypto_sign_PUBLICKEYBYTES == kPubkeyBytes, "Ed25519 public keys are 32 bytes");

void ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

Keypair Keypair::generate() {
    return fromSeed(secureRandomSeed());
}

Keypair Keypair::fromSeed(const KeySeed& seed) {
    ensureSodiumReady();
    Keypair kp;
    if (crypto_sign_seed_keypair(kp.publicKey_.data(), kp.secretKey_.data(), seed.data()) != 0) {
        throw std::runtime_error("crypto_sign_seed_keypair failed");
    }
    return kp;
}

Signature Keypair::sign(const Bytes& message) const {
    Signature sig{};
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(sig.data(), &sigLen, message.data(), message.size(), secretKey_.data()) != 0) {
        throw std::runtime_error("Signing failed");
    }
    return sig;
}

bool verifySignature(const Pubkey& signer, const Bytes& message, const Signature& signature) {
    ensureSodiumReady();
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(), signer.data()) == 0;
}

KeySeed secureRandomSeed() {
    ensureSodiumReady();
    KeySeed seed{};
    randombytes_buf(seed.data(), seed.size());
    return seed;
}

} // namespace pm
