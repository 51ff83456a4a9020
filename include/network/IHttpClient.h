#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace trendpilot {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
};

// Connection-level failure (DNS, refused, timeout): no HTTP status exists
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message)
        , timed_out_(timed_out) {}

    bool timedOut() const { return timed_out_; }

private:
    bool timed_out_;
};

// JSON POST transport used by the notification sinks
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Throws HttpTransportError when no response arrives
    virtual HttpResponse post(const std::string& endpoint, const nlohmann::json& body) = 0;
};

} // namespace network
} // namespace trendpilot
