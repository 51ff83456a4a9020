#include "network/Notifiers.h"
#include "common/Logger.h"

namespace trendpilot {
namespace network {

TelegramNotifier::TelegramNotifier(std::shared_ptr<IHttpClient> http_client,
                                   const std::string& bot_token,
                                   const std::string& chat_id)
    : http_client_(std::move(http_client))
    , endpoint_("/bot" + bot_token + "/sendMessage")
    , chat_id_(chat_id) {
}

bool TelegramNotifier::send(const std::string& text) {
    nlohmann::json body;
    body["chat_id"] = chat_id_;
    body["text"] = text.size() > kMaxMessageLength ? text.substr(0, kMaxMessageLength) : text;
    body["disable_web_page_preview"] = true;

    try {
        HttpResponse response = http_client_->post(endpoint_, body);
        if (!response.isSuccess()) {
            // Body may echo the request; the token only lives in the URL
            LOG_WARN("Telegram send failed: HTTP {}", response.status_code);
            return false;
        }
        return true;
    } catch (const HttpTransportError& e) {
        LOG_WARN("Telegram send failed{}: {}", e.timedOut() ? " (timeout)" : "", e.what());
        return false;
    }
}

bool LogNotifier::send(const std::string& text) {
    LOG_INFO("[notify] {}", text);
    return true;
}

bool RecordingNotifier::send(const std::string& text) {
    if (failing_) {
        return false;
    }
    messages_.push_back(text);
    return true;
}

} // namespace network
} // namespace trendpilot
