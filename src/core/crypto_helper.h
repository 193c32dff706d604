#ifndef CRYPTO_HELPER_H
#define CRYPTO_HELPER_H

#include <string>
#include <cstddef> // For std::size_t
#include <vector>
#include <memory>    // For std::unique_ptr
#include <stdexcept> // For std::runtime_error
#include <mutex>     // For std::once_flag, std::call_once

// OpenSSL Includes
#include <openssl/evp.h>    // For EVP_PKEY, EVP_MD_CTX, EVP_sha256
#include <openssl/sha.h>    // For SHA256_DIGEST_LENGTH
#include <openssl/err.h>    // For error handling
#include <openssl/bio.h>    // For BIO_new, BIO_new_mem_buf
#include <openssl/pem.h>    // For PEM_write_bio_PrivateKey, PEM_read_bio_PrivateKey

/**
 * @brief Custom exception for cryptographic errors.
 */
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& msg) : std::runtime_error(msg) {}
};

using Bytes = std::vector<unsigned char>;

/**
 * @brief Utility class for cryptographic operations using OpenSSL.
 * Provides hashing, raw Ed25519 key handling and PKCS#8/PEM conversion.
 * All public methods are static to allow direct calls without an object instance.
 */
class CryptoHelper {
public:
    // Owning pointer to an EVP_PKEY. EVP_PKEY_free runs when the pointer goes out of scope.
    using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

    static constexpr std::size_t ED25519_KEY_LENGTH = 32;

private:
    // A flag to ensure OpenSSL initialization happens only once across the application.
    static std::once_flag cryptoInitFlag;

    // Called exactly once the first time any static CryptoHelper method needs OpenSSL.
    static void initializeOpenSSL();

    // Appends the most recent OpenSSL error string (if any) to a message.
    static std::string withOpenSSLError(const std::string& message);

    // Shared EVP SHA-256 pass over any contiguous buffer.
    static Bytes digestSha256(const void* data, std::size_t length);

public:
    // Constructors and destructors are deleted as this is a utility class with only static methods.
    CryptoHelper() = delete;
    ~CryptoHelper() = delete;

    /**
     * @brief Computes the SHA-256 digest of a byte range.
     * @param data Pointer to the first byte.
     * @param length Number of bytes to hash.
     * @return The 32-byte digest.
     * @throws CryptoError if hashing fails.
     */
    static Bytes sha256Bytes(const unsigned char* data, std::size_t length);

    static Bytes sha256Bytes(const Bytes& data);

    static Bytes sha256Bytes(const std::string& data);

    /**
     * @brief Builds an Ed25519 private key object from its raw 32-byte seed (RFC 8032).
     * @param seed The raw private key bytes. Must be exactly 32 bytes.
     * @return An owning pointer to the EVP_PKEY.
     * @throws CryptoError if the length is wrong or OpenSSL rejects the key.
     */
    static PKeyPtr ed25519FromSeed(const Bytes& seed);

    /**
     * @brief Extracts the raw 32-byte public key from an Ed25519 EVP_PKEY.
     * @throws CryptoError if extraction fails.
     */
    static Bytes rawPublicKey(const EVP_PKEY* key);

    /**
     * @brief Extracts the raw 32-byte private seed from an Ed25519 EVP_PKEY.
     * @throws CryptoError if extraction fails or the key holds no private part.
     */
    static Bytes rawPrivateKey(const EVP_PKEY* key);

    /**
     * @brief Serializes a private key as PKCS#8 (unencrypted) DER.
     * @throws CryptoError if encoding fails.
     */
    static Bytes privateKeyToPkcs8Der(const EVP_PKEY* key);

    /**
     * @brief Serializes a private key as a PEM "PRIVATE KEY" block (PKCS#8, unencrypted).
     * Base64 lines are 64 characters and the text ends with a newline.
     * @throws CryptoError if encoding fails.
     */
    static std::string privateKeyToPem(const EVP_PKEY* key);

    /**
     * @brief Parses a PEM private key block back into an EVP_PKEY.
     * @throws CryptoError if the text is not a readable PEM private key.
     */
    static PKeyPtr privateKeyFromPem(const std::string& pem);

    /**
     * @brief Converts a vector of bytes to its lowercase hexadecimal string representation.
     */
    static std::string bytesToHex(const Bytes& bytes);

    /**
     * @brief Converts a hexadecimal string to a vector of bytes.
     * @throws std::runtime_error if the hex string has an odd length or invalid characters.
     */
    static Bytes hexToBytes(const std::string& hexString);
};

#endif // CRYPTO_HELPER_H
