#include <conduit/auth/rate_limiter.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace conduit::auth {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

} // namespace

RateDecision FixedWindowRateLimiter::allow(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto& w = windows_[key];
    if (w.count == 0 || now >= w.resetAt) {
        w.resetAt = now + window_;
        w.count = 0;
    }
    if (w.count >= maxRequests_) {
        auto remaining = std::chrono::ceil<std::chrono::seconds>(w.resetAt - now);
        if (remaining < std::chrono::seconds{1})
            remaining = std::chrono::seconds{1};
        spdlog::debug("[RateLimit] {} over limit ({}/{}s), retry in {}s", key, maxRequests_,
                      window_.count(), remaining.count());
        return RateDecision{false, remaining};
    }
    ++w.count;
    return RateDecision{true, std::chrono::seconds{0}};
}

std::size_t FixedWindowRateLimiter::sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    std::size_t dropped = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now >= it->second.resetAt) {
            it = windows_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t FixedWindowRateLimiter::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return windows_.size();
}

std::string clientKey(std::string_view forwardedFor, std::string_view realIp,
                      std::string_view peerAddress,
                      const std::vector<std::string>& trustedProxies) {
    if (peerAddress.empty())
        return "unknown";
    if (std::find(trustedProxies.begin(), trustedProxies.end(), peerAddress) ==
        trustedProxies.end())
        return std::string(peerAddress);

    auto first = trim(forwardedFor.substr(0, forwardedFor.find(',')));
    if (!first.empty())
        return std::string(first);
    auto real = trim(realIp);
    if (!real.empty())
        return std::string(real);
    return std::string(peerAddress);
}

} // namespace conduit::auth
