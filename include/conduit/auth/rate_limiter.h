#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace conduit::auth {

struct RateDecision {
    bool allowed{true};
    std::chrono::seconds retryAfter{0};
};

/**
 * @brief Per-client fixed-window counter.
 *
 * The window starts on the first request from a key and resets once it elapses.
 * A rejected request does not extend the window.
 */
class FixedWindowRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    FixedWindowRateLimiter(std::size_t maxRequests, std::chrono::seconds window)
        : maxRequests_(maxRequests), window_(window) {}

    RateDecision allow(const std::string& key, Clock::time_point now = Clock::now());

    /// Drop windows that have elapsed. Returns how many were dropped.
    std::size_t sweep(Clock::time_point now = Clock::now());

    std::size_t size() const;

    std::size_t maxRequests() const noexcept { return maxRequests_; }
    std::chrono::seconds window() const noexcept { return window_; }

private:
    struct Window {
        Clock::time_point resetAt;
        std::size_t count{0};
    };

    std::size_t maxRequests_;
    std::chrono::seconds window_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
};

/**
 * @brief Address a request is accounted to.
 *
 * The first X-Forwarded-For entry, else X-Real-IP, is honored only when @p peerAddress is
 * one of @p trustedProxies. Otherwise the socket peer address is used.
 */
std::string clientKey(std::string_view forwardedFor, std::string_view realIp,
                      std::string_view peerAddress,
                      const std::vector<std::string>& trustedProxies = {});

} // namespace conduit::auth
