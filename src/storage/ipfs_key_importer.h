#ifndef IPFS_KEY_IMPORTER_H
#define IPFS_KEY_IMPORTER_H

#include <string>
#include "key_importer.h"

/**
 * @brief Imports keys into an IPFS (Kubo) node through its HTTP RPC API.
 *
 * Sends POST {endpoint}/api/v0/key/import?arg=<name>&format=pem-pkcs8-cleartext with the PEM
 * as a multipart "file" field. Any status other than 200 is an ImportError that carries the
 * status code, the response body and the request URL.
 */
class IpfsKeyImporter : public KeyImporter {
private:
    std::string apiEndpoint;   // e.g. "http://127.0.0.1:5001", without trailing slash
    long connectTimeoutSeconds;
    long requestTimeoutSeconds;
    bool verbose;

    void log(const std::string& message) const;

public:
    /**
     * @brief Constructor for IpfsKeyImporter.
     * @param endpoint Base URL of the IPFS RPC API.
     * @param connectTimeout Seconds allowed for the TCP/TLS connect.
     * @param requestTimeout Seconds allowed for the whole request.
     * @param verboseLogging Log request progress to std::clog.
     */
    explicit IpfsKeyImporter(const std::string& endpoint,
                             long connectTimeout = 5,
                             long requestTimeout = 30,
                             bool verboseLogging = false);

    void importKey(const std::string& name, const std::string& exportedKeyPem) override;

    /**
     * @brief Builds the full import URL for a key name, URL-escaping the name.
     * @throws ImportError if libcurl cannot escape the name.
     */
    std::string buildImportUrl(const std::string& name) const;

    /**
     * @brief Returns the multipart filename for a key name: '/' and ':' become '_', plus ".pem".
     */
    static std::string safeFilename(const std::string& name);

    const std::string& endpoint() const { return apiEndpoint; }
};

#endif // IPFS_KEY_IMPORTER_H
