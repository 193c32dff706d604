#ifndef IDENTITY_H
#define IDENTITY_H

#include <string>
#include <cstddef>

#include "crypto_helper.h"
#include "identifier_encoder.h"
#include "key_deriver.h"
#include "key_exporter.h"
#include "seeded_byte_stream.h"

/**
 * @brief The outputs of one derivation: the public identifier and the exported private key.
 */
struct DerivedIdentity {
    std::string identifier;  // base36 CIDv1 of the public key
    std::string exportedKey; // PKCS#8 PEM of the private key
    Bytes publicKey;         // raw 32-byte Ed25519 public key
};

/**
 * @brief Runs the full name -> byte stream -> keypair -> {identifier, PEM} pipeline.
 *
 * Each call allocates its own stream and keys, so one IdentityDeriver may be shared by
 * several threads without locking.
 */
class IdentityDeriver {
public:
    explicit IdentityDeriver(std::size_t streamCapacity = SeededByteStream::DEFAULT_CAPACITY,
                             HashMode hashMode = HashMode::Sha256);

    /**
     * @brief Derives the identity for a name.
     * @param name The seed string; any bytes, including empty.
     * @return The identifier, the PEM-encoded private key and the raw public key.
     * @throws SeedExpansionError, KeyDerivationError, EncodingError or ExportError. The message
     *         names the failing step and the name being derived.
     */
    DerivedIdentity deriveIdentity(const std::string& name) const;

private:
    std::size_t streamCapacity;
    KeyDeriver keyDeriver;
    IdentifierEncoder identifierEncoder;
    KeyMaterialExporter keyExporter;
};

#endif // IDENTITY_H
