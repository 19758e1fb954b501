#pragma once

#include <chrono>
#include <mutex>

namespace mcplex::proxy {

/*
 * Token bucket for forwarded requests. Capacity is one second of allowance (at least one
 * request). A rate <= 0 disables limiting.
 */
class RequestRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RequestRateLimiter(double requestsPerSecond = 0.0);

    void setRate(double requestsPerSecond);
    double rate() const;

    // Takes one token if available; never blocks.
    bool tryAcquire();

private:
    void refillLocked(Clock::time_point now);

    mutable std::mutex mutex_;
    double rate_{0.0};
    double capacity_{0.0};
    double tokens_{0.0};
    Clock::time_point lastRefill_{Clock::now()};
};

} // namespace mcplex::proxy
