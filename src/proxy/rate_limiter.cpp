#include <mcplex/proxy/rate_limiter.h>

#include <algorithm>

namespace mcplex::proxy {

RequestRateLimiter::RequestRateLimiter(double requestsPerSecond) {
    setRate(requestsPerSecond);
}

void RequestRateLimiter::setRate(double requestsPerSecond) {
    std::lock_guard<std::mutex> lk(mutex_);
    rate_ = requestsPerSecond > 0.0 ? requestsPerSecond : 0.0;
    if (rate_ > 0.0) {
        capacity_ = std::max(rate_, 1.0);
        // Start full so the first second's burst goes through
        tokens_ = capacity_;
    } else {
        capacity_ = 0.0;
        tokens_ = 0.0;
    }
    lastRefill_ = Clock::now();
}

double RequestRateLimiter::rate() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return rate_;
}

bool RequestRateLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (rate_ <= 0.0)
        return true;

    refillLocked(Clock::now());
    if (tokens_ < 1.0)
        return false;
    tokens_ -= 1.0;
    return true;
}

void RequestRateLimiter::refillLocked(Clock::time_point now) {
    const auto dt = std::chrono::duration<double>(now - lastRefill_).count();
    if (dt <= 0.0)
        return;
    tokens_ = std::min(capacity_, tokens_ + rate_ * dt);
    lastRefill_ = now;
}

} // namespace mcplex::proxy
