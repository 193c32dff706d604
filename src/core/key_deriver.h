#ifndef KEY_DERIVER_H
#define KEY_DERIVER_H

#include <vector>
#include "crypto_helper.h"

/**
 * @brief An Ed25519 keypair in raw form.
 * privateKey is the 32-byte RFC 8032 seed, publicKey the 32-byte encoded point.
 */
struct KeyPair {
    Bytes privateKey;
    Bytes publicKey;
};

/**
 * @brief Derives Ed25519 keypairs deterministically from 32 seed bytes.
 * No randomness is consumed: the same seed always yields the same keypair.
 */
class KeyDeriver {
public:
    static constexpr std::size_t SEED_LENGTH = CryptoHelper::ED25519_KEY_LENGTH;

    KeyDeriver() = default;

    /**
     * @brief Builds the keypair whose private key is exactly the given seed.
     * @param seed32 Exactly 32 bytes drawn from a SeededByteStream.
     * @return The keypair.
     * @throws KeyDerivationError if the seed length is wrong or OpenSSL fails.
     */
    KeyPair deriveKeyPair(const Bytes& seed32) const;

    /**
     * @brief Re-derives the public key belonging to a raw private key.
     * @throws KeyDerivationError under the same conditions as deriveKeyPair.
     */
    Bytes derivePublicKey(const Bytes& privateKey) const;
};

#endif // KEY_DERIVER_H
