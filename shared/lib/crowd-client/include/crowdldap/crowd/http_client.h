/**
 * @file http_client.h
 * @brief Blocking HTTP transport for the Crowd REST API (libcurl)
 *
 * One curl easy handle per request, so a single client may be shared by
 * all sessions without locking. No retries; every request carries its own
 * timeout.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace crowdldap::crowd {

/// @brief Connection settings for the identity service
struct HttpClientConfig {
    std::string baseUrl;          ///< e.g. "https://crowd.example.com/crowd"
    std::string username;         ///< Application name (HTTP basic auth)
    std::string password;         ///< Application password
    long timeoutSec = 10;
    long connectTimeoutSec = 5;
    bool verifyTls = true;
    std::string userAgent = "crowd-ldap-bridge";
};

struct HttpRequest {
    std::string method = "GET";   ///< GET or POST
    std::string path;             ///< Path plus query, appended to the base URL
    std::string body;             ///< JSON body for POST
};

struct HttpResponse {
    bool transportOk = false;     ///< false on DNS, connect, TLS or timeout errors
    long status = 0;              ///< HTTP status code (valid when transportOk)
    std::string body;
    std::string error;            ///< Transport error text
};

/**
 * @brief HTTP transport interface
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /// @brief Perform one request; never throws
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed transport
 *
 * curl_global_init() must have been called by the process before use.
 */
class CurlHttpClient : public IHttpTransport {
public:
    explicit CurlHttpClient(HttpClientConfig config);

    HttpResponse send(const HttpRequest& request) override;

    const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;
};

/**
 * @brief Percent-encode a query component (RFC 3986 unreserved set kept)
 */
std::string urlEncode(const std::string& value);

/**
 * @brief Build "?k1=v1&k2=v2" with encoded values ("" for no parameters)
 */
std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params);

/**
 * @brief Join base URL and path with exactly one '/'
 */
std::string joinUrl(const std::string& baseUrl, const std::string& path);

} // namespace crowdldap::crowd
