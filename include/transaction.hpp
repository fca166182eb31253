#pragma once

#include "keys.hpp"
#include "types.hpp"

#include <utility>
#include <vector>

namespace pm {

struct SignatureEntry {
    Pubkey signer{};
    Signature signature{};
};

// A signed instruction message. Every signature covers the full message bytes.
struct Transaction {
    Bytes message;
    std::vector<SignatureEntry> signatures;

    Transaction() = default;
    explicit Transaction(Bytes msg) : message(std::move(msg)) {}

    void sign(const Keypair& signer);
};

} // namespace pm
