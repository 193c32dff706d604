#include "crypto_helper.h" // We must include our own header file first

#include <openssl/crypto.h> // For OPENSSL_init_crypto
#include <openssl/x509.h>   // For PKCS8_PRIV_KEY_INFO, EVP_PKEY2PKCS8
#include <cctype>
#include <sstream>
#include <iomanip>

// Initialize the static flag to ensure OpenSSL is initialized only once
std::once_flag CryptoHelper::cryptoInitFlag;

namespace {

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using Pkcs8Ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)>;

std::string bioContents(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr) {
        return std::string();
    }
    return std::string(data, static_cast<std::size_t>(length));
}

} // namespace

// --- Implementation of CryptoHelper helper functions ---

void CryptoHelper::initializeOpenSSL() {
    // Loads error strings and registers digests so failures carry a readable reason.
    OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS | OPENSSL_INIT_ADD_ALL_DIGESTS, nullptr);
}

std::string CryptoHelper::withOpenSSLError(const std::string& message) {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return message;
    }
    char reason[256];
    ERR_error_string_n(code, reason, sizeof(reason));
    return message + " (" + reason + ")";
}

Bytes CryptoHelper::digestSha256(const void* data, std::size_t length) {
    std::call_once(cryptoInitFlag, initializeOpenSSL);

    Bytes hash(SHA256_DIGEST_LENGTH);

    // EVP_MD_CTX: A context for Message Digest operations in OpenSSL
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdCtx(
        EVP_MD_CTX_new(), EVP_MD_CTX_free
    );

    if (!mdCtx) {
        throw CryptoError("Failed to create message digest context");
    }

    if (EVP_DigestInit_ex(mdCtx.get(), EVP_sha256(), nullptr) != 1) {
        throw CryptoError(withOpenSSLError("Failed to initialize SHA256 digest"));
    }

    if (EVP_DigestUpdate(mdCtx.get(), data, length) != 1) {
        throw CryptoError(withOpenSSLError("Failed to update SHA256 digest with data"));
    }

    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(mdCtx.get(), hash.data(), &digestLen) != 1) {
        throw CryptoError(withOpenSSLError("Failed to finalize SHA256 digest"));
    }

    hash.resize(digestLen);
    return hash;
}

Bytes CryptoHelper::sha256Bytes(const unsigned char* data, std::size_t length) {
    return digestSha256(data, length);
}

Bytes CryptoHelper::sha256Bytes(const Bytes& data) {
    return digestSha256(data.data(), data.size());
}

Bytes CryptoHelper::sha256Bytes(const std::string& data) {
    return digestSha256(data.c_str(), data.size());
}

CryptoHelper::PKeyPtr CryptoHelper::ed25519FromSeed(const Bytes& seed) {
    std::call_once(cryptoInitFlag, initializeOpenSSL);

    if (seed.size() != ED25519_KEY_LENGTH) {
        throw CryptoError("Ed25519 seed must be " + std::to_string(ED25519_KEY_LENGTH) +
                          " bytes, got " + std::to_string(seed.size()));
    }

    // The raw private key is the RFC 8032 seed; OpenSSL performs the SHA-512 expansion itself.
    PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                EVP_PKEY_free);
    if (!key) {
        throw CryptoError(withOpenSSLError("Failed to create Ed25519 key from seed"));
    }
    return key;
}

Bytes CryptoHelper::rawPublicKey(const EVP_PKEY* key) {
    if (key == nullptr) {
        throw CryptoError("Cannot read public key of a null EVP_PKEY");
    }
    std::size_t length = 0;
    if (EVP_PKEY_get_raw_public_key(key, nullptr, &length) != 1) {
        throw CryptoError(withOpenSSLError("Failed to query raw public key length"));
    }
    Bytes publicKey(length);
    if (EVP_PKEY_get_raw_public_key(key, publicKey.data(), &length) != 1) {
        throw CryptoError(withOpenSSLError("Failed to extract raw public key"));
    }
    publicKey.resize(length);
    return publicKey;
}

Bytes CryptoHelper::rawPrivateKey(const EVP_PKEY* key) {
    if (key == nullptr) {
        throw CryptoError("Cannot read private key of a null EVP_PKEY");
    }
    std::size_t length = 0;
    if (EVP_PKEY_get_raw_private_key(key, nullptr, &length) != 1) {
        throw CryptoError(withOpenSSLError("Failed to query raw private key length"));
    }
    Bytes privateKey(length);
    if (EVP_PKEY_get_raw_private_key(key, privateKey.data(), &length) != 1) {
        throw CryptoError(withOpenSSLError("Failed to extract raw private key"));
    }
    privateKey.resize(length);
    return privateKey;
}

Bytes CryptoHelper::privateKeyToPkcs8Der(const EVP_PKEY* key) {
    if (key == nullptr) {
        throw CryptoError("Cannot encode a null EVP_PKEY");
    }

    Pkcs8Ptr info(EVP_PKEY2PKCS8(key), PKCS8_PRIV_KEY_INFO_free);
    if (!info) {
        throw CryptoError(withOpenSSLError("Failed to build PKCS#8 structure"));
    }

    // i2d means "Internal to DER"
    unsigned char* der = nullptr;
    int derLen = i2d_PKCS8_PRIV_KEY_INFO(info.get(), &der);
    if (derLen <= 0) {
        throw CryptoError(withOpenSSLError("Failed to convert PKCS#8 structure to DER format"));
    }

    Bytes result(der, der + derLen);
    OPENSSL_free(der); // The memory allocated by i2d_PKCS8_PRIV_KEY_INFO must be freed
    return result;
}

std::string CryptoHelper::privateKeyToPem(const EVP_PKEY* key) {
    if (key == nullptr) {
        throw CryptoError("Cannot encode a null EVP_PKEY");
    }

    BioPtr bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio) {
        throw CryptoError("Failed to allocate memory BIO");
    }

    // Unencrypted PKCS#8: no cipher, no passphrase.
    if (PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw CryptoError(withOpenSSLError("Failed to write PEM private key"));
    }

    std::string pem = bioContents(bio.get());
    if (pem.empty()) {
        throw CryptoError("PEM encoder produced no output");
    }
    return pem;
}

CryptoHelper::PKeyPtr CryptoHelper::privateKeyFromPem(const std::string& pem) {
    std::call_once(cryptoInitFlag, initializeOpenSSL);

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio) {
        throw CryptoError("Failed to allocate memory BIO for PEM input");
    }

    PKeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key) {
        throw CryptoError(withOpenSSLError("Failed to parse PEM private key"));
    }
    return key;
}

std::string CryptoHelper::bytesToHex(const Bytes& bytes) {
    std::stringstream ss;
    for (unsigned char byte : bytes) {
        // Format the bytes to be two hexadecimal digits (e.g., 0a, ff)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

Bytes CryptoHelper::hexToBytes(const std::string& hexString) {
    if (hexString.length() % 2 != 0) {
        throw std::runtime_error("Hex string must have an even length");
    }

    Bytes bytes;
    bytes.reserve(hexString.length() / 2);
    for (std::size_t i = 0; i < hexString.length(); i += 2) {
        std::string byteString = hexString.substr(i, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byteString[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byteString[1]))) {
            throw std::runtime_error("Invalid hex character in: " + byteString);
        }
        bytes.push_back(static_cast<unsigned char>(std::stoul(byteString, nullptr, 16)));
    }
    return bytes;
}
