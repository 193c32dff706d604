#ifndef KEY_IMPORTER_H
#define KEY_IMPORTER_H

#include <string>

/**
 * @brief Capability for handing exported key material to an external key store.
 *
 * Implementations report every failure (transport, remote validation, duplicate name) by
 * throwing ImportError with a human-readable message. Callers do not retry.
 */
class KeyImporter {
public:
    virtual ~KeyImporter() = default;

    /**
     * @brief Stores a PEM-encoded private key under the given name.
     * @param name The key name in the remote store.
     * @param exportedKeyPem The PKCS#8 PEM text.
     * @throws ImportError on any failure.
     */
    virtual void importKey(const std::string& name, const std::string& exportedKeyPem) = 0;
};

#endif // KEY_IMPORTER_H
