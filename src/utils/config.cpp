#include "config.h"
#include "../core/errors.h"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

HashMode hashModeFromString(const std::string& name) {
    if (name == "sha2-256") {
        return HashMode::Sha256;
    }
    if (name == "libp2p-inline") {
        return HashMode::Libp2pInline;
    }
    throw ConfigError("unknown identifier_hash '" + name + "' (expected sha2-256 or libp2p-inline)");
}

std::string hashModeToString(HashMode mode) {
    return mode == HashMode::Libp2pInline ? "libp2p-inline" : "sha2-256";
}

AppConfig AppConfig::fromJson(const std::string& jsonText) {
    AppConfig config;
    try {
        json j = json::parse(jsonText);
        if (!j.is_object()) {
            throw ConfigError("configuration must be a JSON object");
        }

        // Numeric keys must be JSON integers; value() would silently truncate 2.5 to 2.
        for (const char* key : {"connect_timeout_seconds", "request_timeout_seconds", "stream_capacity"}) {
            if (j.contains(key) && !j.at(key).is_number_integer()) {
                throw ConfigError(std::string(key) + " must be an integer, got " + j.at(key).dump());
            }
        }

        config.apiEndpoint = j.value("api_endpoint", config.apiEndpoint);
        config.connectTimeoutSeconds = j.value("connect_timeout_seconds", config.connectTimeoutSeconds);
        config.requestTimeoutSeconds = j.value("request_timeout_seconds", config.requestTimeoutSeconds);
        long long capacity = j.value("stream_capacity", static_cast<long long>(config.streamCapacity));
        if (capacity < 32 || capacity % 32 != 0) {
            throw ConfigError("stream_capacity must be a non-zero multiple of 32, got " +
                              std::to_string(capacity));
        }
        config.streamCapacity = static_cast<std::size_t>(capacity);
        config.verbose = j.value("verbose", config.verbose);
        if (j.contains("identifier_hash")) {
            config.identifierHash = hashModeFromString(j.at("identifier_hash").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    if (config.apiEndpoint.empty()) {
        throw ConfigError("api_endpoint must not be empty");
    }
    // Trailing slashes would produce "//api/v0/..." request paths.
    while (config.apiEndpoint.size() > 1 && config.apiEndpoint.back() == '/') {
        config.apiEndpoint.pop_back();
    }
    if (config.connectTimeoutSeconds <= 0 || config.requestTimeoutSeconds <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    return config;
}

AppConfig AppConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

std::string AppConfig::toJson() const {
    json j;
    j["api_endpoint"] = apiEndpoint;
    j["connect_timeout_seconds"] = connectTimeoutSeconds;
    j["request_timeout_seconds"] = requestTimeoutSeconds;
    j["stream_capacity"] = streamCapacity;
    j["identifier_hash"] = hashModeToString(identifierHash);
    j["verbose"] = verbose;
    return j.dump(4);
}
