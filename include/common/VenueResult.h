#pragma once

#include <optional>
#include <string>
#include <utility>

namespace trendpilot {

enum class VenueErrorKind {
    NONE,
    TRANSIENT,              // network, timeout, rate limit: retry later
    INSUFFICIENT_MARGIN,    // order too large for free margin
    BELOW_MINIMUM,          // order below venue minimum
    REJECTED,               // venue refused the request
    FATAL                   // unusable collaborator (bad credentials, unknown symbol)
};

inline const char* toString(VenueErrorKind kind) {
    switch (kind) {
        case VenueErrorKind::NONE: return "none";
        case VenueErrorKind::TRANSIENT: return "transient";
        case VenueErrorKind::INSUFFICIENT_MARGIN: return "insufficient_margin";
        case VenueErrorKind::BELOW_MINIMUM: return "below_minimum";
        case VenueErrorKind::REJECTED: return "rejected";
        case VenueErrorKind::FATAL: return "fatal";
    }
    return "none";
}

struct VenueError {
    VenueErrorKind kind = VenueErrorKind::NONE;
    std::string message;
};

// Value-or-error returned by every external collaborator call
template <typename T>
class VenueResult {
public:
    static VenueResult success(T value) {
        VenueResult r;
        r.value_ = std::move(value);
        return r;
    }

    static VenueResult failure(VenueErrorKind kind, std::string message) {
        VenueResult r;
        r.error_.kind = kind;
        r.error_.message = std::move(message);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    bool isTransient() const { return !ok() && error_.kind == VenueErrorKind::TRANSIENT; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const VenueError& error() const { return error_; }

private:
    std::optional<T> value_;
    VenueError error_;
};

} // namespace trendpilot
