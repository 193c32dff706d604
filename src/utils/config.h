#ifndef DETKEY_CONFIG_H
#define DETKEY_CONFIG_H

#include <string>
#include <cstddef>
#include "../core/identifier_encoder.h" // For HashMode

/**
 * @brief Runtime settings for key derivation and the key-store importer.
 *
 * Loaded from a JSON object; any key that is absent keeps its default. Example:
 * {
 *   "api_endpoint": "http://127.0.0.1:5001",
 *   "connect_timeout_seconds": 5,
 *   "request_timeout_seconds": 30,
 *   "stream_capacity": 8192,
 *   "identifier_hash": "sha2-256",
 *   "verbose": false
 * }
 */
struct AppConfig {
    std::string apiEndpoint = "http://127.0.0.1:5001";
    long connectTimeoutSeconds = 5;
    long requestTimeoutSeconds = 30;
    std::size_t streamCapacity = 8192;
    HashMode identifierHash = HashMode::Sha256;
    bool verbose = false;

    /**
     * @brief Parses configuration from JSON text.
     * @throws ConfigError on malformed JSON, wrong value types or out-of-range values.
     */
    static AppConfig fromJson(const std::string& jsonText);

    /**
     * @brief Reads and parses a JSON configuration file.
     * @throws ConfigError if the file cannot be opened or fromJson() rejects it.
     */
    static AppConfig loadFromFile(const std::string& path);

    std::string toJson() const;
};

HashMode hashModeFromString(const std::string& name);
std::string hashModeToString(HashMode mode);

#endif // DETKEY_CONFIG_H
