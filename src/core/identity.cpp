#include "identity.h"
#include "errors.h"

namespace {

// Rethrows a pipeline error as the same kind, prefixed with the step and the name.
template <typename Error>
[[noreturn]] void rethrowWithContext(const Error& e, const char* step, const std::string& name) {
    throw Error(std::string("deriveIdentity(\"") + name + "\") " + step + ": " + e.what());
}

} // namespace

IdentityDeriver::IdentityDeriver(std::size_t capacity, HashMode hashMode)
    : streamCapacity(capacity), identifierEncoder(hashMode) {}

DerivedIdentity IdentityDeriver::deriveIdentity(const std::string& name) const {
    Bytes seed32;
    try {
        SeededByteStream stream(name, streamCapacity);
        seed32 = stream.read(KeyDeriver::SEED_LENGTH);
    } catch (const SeedExpansionError& e) {
        rethrowWithContext(e, "seed expansion", name);
    } catch (const CryptoError& e) {
        throw SeedExpansionError(std::string("deriveIdentity(\"") + name + "\") seed expansion: " + e.what());
    }

    KeyPair keyPair;
    try {
        keyPair = keyDeriver.deriveKeyPair(seed32);
    } catch (const KeyDerivationError& e) {
        rethrowWithContext(e, "key derivation", name);
    }

    DerivedIdentity identity;
    try {
        identity.identifier = identifierEncoder.encode(keyPair.publicKey);
    } catch (const EncodingError& e) {
        rethrowWithContext(e, "identifier encoding", name);
    }

    try {
        identity.exportedKey = keyExporter.exportKey(keyPair.privateKey);
    } catch (const ExportError& e) {
        rethrowWithContext(e, "key export", name);
    }

    identity.publicKey = keyPair.publicKey;
    return identity;
}
