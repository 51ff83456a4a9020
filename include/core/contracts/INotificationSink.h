#pragma once

#include <string>

namespace trendpilot {
namespace core {

class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    // false on delivery failure; callers log and move on
    virtual bool send(const std::string& text) = 0;
};

} // namespace core
} // namespace trendpilot
