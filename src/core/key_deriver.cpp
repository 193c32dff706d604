#include "key_deriver.h"
#include "errors.h"

KeyPair KeyDeriver::deriveKeyPair(const Bytes& seed32) const {
    if (seed32.size() != SEED_LENGTH) {
        throw KeyDerivationError("key derivation requires a " + std::to_string(SEED_LENGTH) +
                                 "-byte seed, got " + std::to_string(seed32.size()) + " bytes");
    }

    try {
        CryptoHelper::PKeyPtr key = CryptoHelper::ed25519FromSeed(seed32);
        KeyPair pair;
        pair.privateKey = seed32;
        pair.publicKey = CryptoHelper::rawPublicKey(key.get());
        return pair;
    } catch (const CryptoError& e) {
        throw KeyDerivationError(std::string("key derivation failed: ") + e.what());
    }
}

Bytes KeyDeriver::derivePublicKey(const Bytes& privateKey) const {
    return deriveKeyPair(privateKey).publicKey;
}
