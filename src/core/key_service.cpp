#include "key_service.h"
#include "errors.h"

#include <exception>
#include <iostream>
#include <utility>

KeyService::KeyService(IdentityDeriver identityDeriver, std::shared_ptr<KeyImporter> keyImporter,
                       bool verboseLogging)
    : deriver(std::move(identityDeriver)), importer(std::move(keyImporter)), verbose(verboseLogging) {
    if (!importer) {
        throw ImportError("KeyService initialized with a null KeyImporter instance.");
    }
}

void KeyService::log(const std::string& message) const {
    if (verbose) {
        std::clog << "[KeyService] " << message << std::endl;
    }
}

void KeyService::importIdentity(const std::string& name, const DerivedIdentity& identity) {
    log("Importing key '" + name + "' (" + identity.identifier + ")");
    try {
        importer->importKey(name, identity.exportedKey);
    } catch (const ImportError& e) {
        throw ImportError("failed to import key '" + name + "': " + e.what());
    } catch (const std::exception& e) {
        throw ImportError("failed to import key '" + name + "': " + e.what());
    }
    log("Key '" + name + "' imported.");
}

DerivedIdentity KeyService::deriveAndImport(const std::string& name) {
    DerivedIdentity identity = deriver.deriveIdentity(name);
    log("Derived identifier " + identity.identifier + " for '" + name + "'");
    importIdentity(name, identity);
    return identity;
}
