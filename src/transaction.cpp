#include "transaction.hpp"

namespace pm {

void Transaction::sign(const Keypair& signer) {
    signatures.push_back({ signer.pubkey(), signer.sign(message) });
}

} // namespace pm
