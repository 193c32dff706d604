#ifndef IDENTIFIER_ENCODER_H
#define IDENTIFIER_ENCODER_H

#include <string>
#include <cstdint>
#include "crypto_helper.h"

/**
 * @brief Which multihash function wraps the public-key envelope.
 */
enum class HashMode {
    Sha256,       // Always sha2-256 of the envelope.
    Libp2pInline  // libp2p peer ID rule: envelopes up to 42 bytes are inlined (identity hash).
};

/**
 * @brief The fields of a parsed identifier.
 */
struct DecodedIdentifier {
    std::uint64_t version = 0;
    std::uint64_t codec = 0;
    std::uint64_t multihashCode = 0;
    Bytes digest;
};

/**
 * @brief Computes the canonical textual identifier for an Ed25519 public key.
 *
 * The key is wrapped in the libp2p PublicKey protobuf envelope, hashed into a multihash,
 * placed in a CIDv1 with the libp2p-key codec and rendered as multibase base36 ("k...").
 * Envelope, multihash and CID come from cpp-libp2p.
 */
class IdentifierEncoder {
public:
    explicit IdentifierEncoder(HashMode mode = HashMode::Sha256) : hashMode(mode) {}

    /**
     * @brief Encodes a raw public key as an identifier.
     * @param publicKey Exactly 32 bytes.
     * @return The base36 multibase string.
     * @throws EncodingError if the key has the wrong length.
     */
    std::string encode(const Bytes& publicKey) const;

    /**
     * @brief Parses an identifier produced by encode().
     * @throws EncodingError if the text is not a base36 CIDv1.
     */
    static DecodedIdentifier decode(const std::string& identifier);

    /**
     * @brief Serializes the libp2p PublicKey message for an Ed25519 key.
     * @throws EncodingError if the key has the wrong length.
     */
    static Bytes publicKeyEnvelope(const Bytes& publicKey);

    HashMode mode() const { return hashMode; }

private:
    HashMode hashMode;
};

#endif // IDENTIFIER_ENCODER_H
