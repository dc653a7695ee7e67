/**
 * @file http_client.cpp
 * @brief libcurl transport implementation
 */

#include "crowdldap/crowd/http_client.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cctype>

namespace crowdldap::crowd {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

} // anonymous namespace

CurlHttpClient::CurlHttpClient(HttpClientConfig config)
    : config_(std::move(config)) {}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    std::string url = joinUrl(config_.baseUrl, request.path);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (request.method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl, CURLOPT_USERNAME, config_.username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, config_.password.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeoutSec);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connectTimeoutSec);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verifyTls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verifyTls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        response.transportOk = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::debug("HTTP {} {} -> {}", request.method, request.path, response.status);
    } else {
        response.error = curl_easy_strerror(res);
        spdlog::warn("HTTP {} {} failed: {}", request.method, request.path, response.error);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        query += query.empty() ? "?" : "&";
        query += key + "=" + urlEncode(value);
    }
    return query;
}

std::string joinUrl(const std::string& baseUrl, const std::string& path) {
    if (path.empty()) return baseUrl;
    bool baseSlash = !baseUrl.empty() && baseUrl.back() == '/';
    bool pathSlash = path.front() == '/';
    if (baseSlash && pathSlash) return baseUrl + path.substr(1);
    if (!baseSlash && !pathSlash) return baseUrl + "/" + path;
    return baseUrl + path;
}

} // namespace crowdldap::crowd
