#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/contracts/INotificationSink.h"
#include "network/IHttpClient.h"

namespace trendpilot {
namespace network {

// Telegram bot API sink: POST /bot<token>/sendMessage
class TelegramNotifier : public core::INotificationSink {
public:
    TelegramNotifier(std::shared_ptr<IHttpClient> http_client,
                     const std::string& bot_token,
                     const std::string& chat_id);

    bool send(const std::string& text) override;

    static constexpr const char* kApiBaseUrl = "https://api.telegram.org";
    static constexpr size_t kMaxMessageLength = 4096;

private:
    std::shared_ptr<IHttpClient> http_client_;
    std::string endpoint_;
    std::string chat_id_;
};

// Used when no chat credentials are configured
class LogNotifier : public core::INotificationSink {
public:
    bool send(const std::string& text) override;
};

// Keeps messages in memory (tests, backtests)
class RecordingNotifier : public core::INotificationSink {
public:
    bool send(const std::string& text) override;

    const std::vector<std::string>& messages() const { return messages_; }
    void setFailing(bool failing) { failing_ = failing; }

private:
    std::vector<std::string> messages_;
    bool failing_ = false;
};

} // namespace network
} // namespace trendpilot
