#ifndef DETKEY_ERRORS_H
#define DETKEY_ERRORS_H

#include <string>
#include <stdexcept> // For std::runtime_error

// ---------------------------
// Error Handling
// ---------------------------
/**
 * @brief Base class for every error raised by the key-derivation pipeline.
 * Catching DetKeyError catches all of the more specific kinds below.
 */
class DetKeyError : public std::runtime_error {
public:
    explicit DetKeyError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Raised when a SeededByteStream cannot be constructed (invalid buffer capacity).
 */
class SeedExpansionError : public DetKeyError {
public:
    explicit SeedExpansionError(const std::string& msg) : DetKeyError(msg) {}
};

/**
 * @brief Raised when a keypair cannot be derived from the supplied seed bytes.
 */
class KeyDerivationError : public DetKeyError {
public:
    explicit KeyDerivationError(const std::string& msg) : DetKeyError(msg) {}
};

/**
 * @brief Raised when an identifier cannot be built from a public key, or parsed back.
 */
class EncodingError : public DetKeyError {
public:
    explicit EncodingError(const std::string& msg) : DetKeyError(msg) {}
};

/**
 * @brief Raised when private key material cannot be serialized to (or parsed from) PEM.
 */
class ExportError : public DetKeyError {
public:
    explicit ExportError(const std::string& msg) : DetKeyError(msg) {}
};

/**
 * @brief Raised when the external key store rejects or fails to receive a key.
 */
class ImportError : public DetKeyError {
public:
    explicit ImportError(const std::string& msg) : DetKeyError(msg) {}
};

/**
 * @brief Raised when the configuration file is unreadable or holds invalid values.
 */
class ConfigError : public DetKeyError {
public:
    explicit ConfigError(const std::string& msg) : DetKeyError(msg) {}
};

#endif // DETKEY_ERRORS_H
