#pragma once

#include "secure_memory.hpp"
#include "types.hpp"

#include <array>
#include <cstdint>

#include <sodium.h>

namespace pm {

using Signature = std::array<std::uint8_t, crypto_sign_BYTES>;
using KeySeed = std::array<std::uint8_t, crypto_sign_SEEDBYTES>;

// Ed25519 signing identity. Account identities throughout the ledger are the
// 32-byte public keys.
class Keypair {
public:
    static Keypair generate();
    static Keypair fromSeed(const KeySeed& seed);

    Keypair(Keypair&&) noexcept = default;
    Keypair& operator=(Keypair&&) noexcept = default;

    const Pubkey& pubkey() const { return publicKey_; }
    Signature sign(const Bytes& message) const;

private:
    Keypair() = default;

    Pubkey publicKey_{};
    SecureBytes<crypto_sign_SECRETKEYBYTES> secretKey_;
};

bool verifySignature(const Pubkey& signer, const Bytes& message, const Signature& signature);

KeySeed secureRandomSeed();

// Throws if libsodium cannot be initialized.
void ensureSodiumReady();

} // namespace pm
