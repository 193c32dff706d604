#ifndef KEY_SERVICE_H
#define KEY_SERVICE_H

#include <string>
#include <memory> // For std::shared_ptr

#include "identity.h"
#include "../storage/key_importer.h"

/**
 * @brief Combines identity derivation with an external key store.
 *
 * The service derives the key for a name and hands the exported PEM to its importer.
 * Importer failures are rethrown as ImportError naming the key; nothing is retried.
 */
class KeyService {
private:
    IdentityDeriver deriver;
    std::shared_ptr<KeyImporter> importer;
    bool verbose;

    void log(const std::string& message) const;

public:
    /**
     * @brief Constructor for KeyService.
     * @param deriver Configured identity deriver.
     * @param importer The key store to upload into. Must not be null.
     * @param verboseLogging Log each step to std::clog.
     * @throws ImportError if importer is null.
     */
    KeyService(IdentityDeriver deriver, std::shared_ptr<KeyImporter> importer, bool verboseLogging = false);

    /**
     * @brief Uploads an already-derived identity under the given name.
     * @throws ImportError with the key name and the importer's message.
     */
    void importIdentity(const std::string& name, const DerivedIdentity& identity);

    /**
     * @brief Derives the identity for a name and imports its private key.
     * @return The derived identity, so the caller can report its identifier.
     * @throws Any derivation error, or ImportError.
     */
    DerivedIdentity deriveAndImport(const std::string& name);
};

#endif // KEY_SERVICE_H
