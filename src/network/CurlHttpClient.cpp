#include "network/CurlHttpClient.h"

namespace trendpilot {
namespace network {

CurlHttpClient::CurlHttpClient(const std::string& base_url, long timeout_seconds)
    : base_url_(base_url)
    , timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 10)
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::post(const std::string& endpoint, const nlohmann::json& body) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string url = base_url_ + endpoint;
    const std::string payload = body.dump();
    std::string response_body;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

    struct curl_slist* header_list = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    const CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        // The URL carries the bot token, keep it out of the message
        throw HttpTransportError("CURL error: " + std::string(curl_easy_strerror(res)),
                                 res == CURLE_OPERATION_TIMEDOUT);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace network
} // namespace trendpilot
