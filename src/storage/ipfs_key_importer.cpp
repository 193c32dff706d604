#include "ipfs_key_importer.h"
#include "../core/errors.h"

#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <mutex>

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using MimePtr = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;
using HeaderListPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag curlInitFlag;

void initializeCurl() {
    // Process-wide and not thread-safe, so it runs exactly once.
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

// Callback for libcurl to collect the response body
size_t collectResponse(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(contents), realsize);
    return realsize;
}

CurlPtr newHandle() {
    std::call_once(curlInitFlag, initializeCurl);
    CurlPtr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ImportError("failed to initialize curl handle");
    }
    return curl;
}

} // namespace

IpfsKeyImporter::IpfsKeyImporter(const std::string& endpoint, long connectTimeout,
                                 long requestTimeout, bool verboseLogging)
    : apiEndpoint(endpoint),
      connectTimeoutSeconds(connectTimeout),
      requestTimeoutSeconds(requestTimeout),
      verbose(verboseLogging) {
    while (apiEndpoint.size() > 1 && apiEndpoint.back() == '/') {
        apiEndpoint.pop_back();
    }
    log("Initialized with API endpoint: " + apiEndpoint);
}

void IpfsKeyImporter::log(const std::string& message) const {
    if (verbose) {
        std::clog << "[IpfsKeyImporter] " << message << std::endl;
    }
}

std::string IpfsKeyImporter::safeFilename(const std::string& name) {
    std::string filename = name;
    for (char& c : filename) {
        if (c == '/' || c == ':') {
            c = '_';
        }
    }
    return filename + ".pem";
}

std::string IpfsKeyImporter::buildImportUrl(const std::string& name) const {
    CurlPtr curl = newHandle();
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl.get(), name.c_str(), static_cast<int>(name.size())), curl_free);
    if (!escaped) {
        throw ImportError("failed to URL-escape key name '" + name + "'");
    }
    return apiEndpoint + "/api/v0/key/import?arg=" + escaped.get() + "&format=pem-pkcs8-cleartext";
}

void IpfsKeyImporter::importKey(const std::string& name, const std::string& exportedKeyPem) {
    const std::string url = buildImportUrl(name);
    CurlPtr curl = newHandle();

    MimePtr mime(curl_mime_init(curl.get()), curl_mime_free);
    if (!mime) {
        throw ImportError("failed to create multipart form");
    }
    curl_mimepart* part = curl_mime_addpart(mime.get());
    if (part == nullptr ||
        curl_mime_name(part, "file") != CURLE_OK ||
        curl_mime_filename(part, safeFilename(name).c_str()) != CURLE_OK ||
        curl_mime_type(part, "application/octet-stream") != CURLE_OK ||
        curl_mime_data(part, exportedKeyPem.data(), exportedKeyPem.size()) != CURLE_OK) {
        throw ImportError("failed to write key data into multipart form");
    }

    // Suppress "Expect: 100-continue"; the RPC API answers the request directly.
    HeaderListPtr headers(curl_slist_append(nullptr, "Expect:"), curl_slist_free_all);
    if (!headers) {
        throw ImportError("failed to build request headers");
    }

    std::string responseBody;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, requestTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collectResponse);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);

    log("POST " + url);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string reason = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(res);
        throw ImportError("failed to send request: " + reason + "\nRequest URL: " + url);
    }

    long httpCode = 0;
    res = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
    if (res != CURLE_OK) {
        throw ImportError(std::string("failed to read response status: ") + curl_easy_strerror(res) +
                          "\nRequest URL: " + url);
    }
    if (httpCode != 200) {
        throw ImportError("IPFS API returned error status: " + std::to_string(httpCode) +
                          ", body: " + responseBody + "\nRequest URL: " + url);
    }

    log("Imported key '" + name + "': " + responseBody);
}
