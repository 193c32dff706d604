#include "key_exporter.h"
#include "errors.h"

namespace {

CryptoHelper::PKeyPtr loadPrivateKey(const Bytes& privateKey) {
    if (privateKey.size() != CryptoHelper::ED25519_KEY_LENGTH) {
        throw ExportError("Ed25519 private key must be " +
                          std::to_string(CryptoHelper::ED25519_KEY_LENGTH) +
                          " bytes, got " + std::to_string(privateKey.size()));
    }
    try {
        return CryptoHelper::ed25519FromSeed(privateKey);
    } catch (const CryptoError& e) {
        throw ExportError(std::string("cannot load private key: ") + e.what());
    }
}

} // namespace

std::string KeyMaterialExporter::exportKey(const Bytes& privateKey) const {
    CryptoHelper::PKeyPtr key = loadPrivateKey(privateKey);
    try {
        return CryptoHelper::privateKeyToPem(key.get());
    } catch (const CryptoError& e) {
        throw ExportError(std::string("failed to generate PEM data: ") + e.what());
    }
}

Bytes KeyMaterialExporter::exportDer(const Bytes& privateKey) const {
    CryptoHelper::PKeyPtr key = loadPrivateKey(privateKey);
    try {
        return CryptoHelper::privateKeyToPkcs8Der(key.get());
    } catch (const CryptoError& e) {
        throw ExportError(std::string("failed to convert key format: ") + e.what());
    }
}

Bytes KeyMaterialExporter::parsePrivateKey(const std::string& pem) const {
    try {
        CryptoHelper::PKeyPtr key = CryptoHelper::privateKeyFromPem(pem);
        if (EVP_PKEY_get_id(key.get()) != EVP_PKEY_ED25519) {
            throw ExportError("PEM private key is not an Ed25519 key");
        }
        return CryptoHelper::rawPrivateKey(key.get());
    } catch (const CryptoError& e) {
        throw ExportError(std::string("failed to read PEM private key: ") + e.what());
    }
}
