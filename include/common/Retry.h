#pragma once

#include <chrono>
#include "common/Clock.h"
#include "common/Logger.h"

namespace trendpilot {

struct RetryPolicy {
    int retries = 3;            // attempts after the first transient failure
    int backoff_ms = 1000;      // fixed, no growth
};

// Repeats `call` while its VenueResult fails transiently, sleeping the fixed
// backoff through the injected clock between attempts
template <typename Call>
auto retryTransient(IClock& clock, const RetryPolicy& policy, const char* what, Call&& call)
    -> decltype(call()) {
    auto result = call();
    int attempt = 0;
    while (result.isTransient() && attempt < policy.retries) {
        attempt++;
        LOG_WARN("{} failed transiently ({}), retry {}/{} in {} ms",
                 what, result.error().message, attempt, policy.retries, policy.backoff_ms);
        clock.sleepFor(std::chrono::milliseconds(policy.backoff_ms));
        result = call();
    }
    return result;
}

} // namespace trendpilot
