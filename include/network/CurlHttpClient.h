#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace trendpilot {
namespace network {

// Blocking JSON-over-HTTPS client with a bounded per-request timeout
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient(const std::string& base_url, long timeout_seconds = 10);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post(const std::string& endpoint, const nlohmann::json& body) override;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string base_url_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
};

} // namespace network
} // namespace trendpilot
