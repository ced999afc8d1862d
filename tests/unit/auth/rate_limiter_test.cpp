#include <gtest/gtest.h>

#include <conduit/auth/rate_limiter.h>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace conduit::auth::test {

TEST(RateLimiterTest, AllowsUpToLimitThenRejects) {
    FixedWindowRateLimiter limiter(3, 60s);
    const auto t0 = FixedWindowRateLimiter::Clock::now();
    for (int i = 0; i < 3; ++i)
        EXPECT_TRUE(limiter.allow("1.2.3.4", t0 + std::chrono::seconds(i)).allowed);

    auto denied = limiter.allow("1.2.3.4", t0 + 10s);
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.retryAfter, 50s);
}

TEST(RateLimiterTest, RetryAfterIsAtLeastOneSecond) {
    FixedWindowRateLimiter limiter(1, 60s);
    const auto t0 = FixedWindowRateLimiter::Clock::now();
    EXPECT_TRUE(limiter.allow("k", t0).allowed);
    auto denied = limiter.allow("k", t0 + 59s + 900ms);
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.retryAfter, 1s);
}

TEST(RateLimiterTest, WindowResetsAfterElapsing) {
    FixedWindowRateLimiter limiter(2, 60s);
    const auto t0 = FixedWindowRateLimiter::Clock::now();
    EXPECT_TRUE(limiter.allow("k", t0).allowed);
    EXPECT_TRUE(limiter.allow("k", t0 + 1s).allowed);
    EXPECT_FALSE(limiter.allow("k", t0 + 2s).allowed);
    // Rejections do not push the reset point out.
    EXPECT_FALSE(limiter.allow("k", t0 + 59s).allowed);
    EXPECT_TRUE(limiter.allow("k", t0 + 60s).allowed);
}

TEST(RateLimiterTest, KeysAreIndependent) {
    FixedWindowRateLimiter limiter(1, 60s);
    const auto t0 = FixedWindowRateLimiter::Clock::now();
    EXPECT_TRUE(limiter.allow("a", t0).allowed);
    EXPECT_FALSE(limiter.allow("a", t0).allowed);
    EXPECT_TRUE(limiter.allow("b", t0).allowed);
    EXPECT_EQ(limiter.size(), 2u);
}

TEST(RateLimiterTest, SweepDropsElapsedWindows) {
    FixedWindowRateLimiter limiter(5, 10s);
    const auto t0 = FixedWindowRateLimiter::Clock::now();
    limiter.allow("old", t0);
    limiter.allow("new", t0 + 8s);
    EXPECT_EQ(limiter.sweep(t0 + 10s), 1u);
    EXPECT_EQ(limiter.size(), 1u);
    EXPECT_EQ(limiter.sweep(t0 + 18s), 1u);
    EXPECT_EQ(limiter.size(), 0u);
}

TEST(RateLimiterTest, ClientKeyPrecedence) {
    const std::vector<std::string> proxies{"127.0.0.1"};
    EXPECT_EQ(clientKey(" 10.0.0.1 , 10.0.0.2", "10.0.0.9", "127.0.0.1", proxies), "10.0.0.1");
    EXPECT_EQ(clientKey("", " 10.0.0.9 ", "127.0.0.1", proxies), "10.0.0.9");
    EXPECT_EQ(clientKey("", "", "127.0.0.1", proxies), "127.0.0.1");
    EXPECT_EQ(clientKey("", "", "192.168.1.5"), "192.168.1.5");
    EXPECT_EQ(clientKey("", "", ""), "unknown");
}

TEST(RateLimiterTest, ForwardingHeadersIgnoredFromUntrustedPeers) {
    EXPECT_EQ(clientKey("10.0.0.1", "10.0.0.9", "203.0.113.4"), "203.0.113.4");
    EXPECT_EQ(clientKey("127.0.0.1", "", "203.0.113.4", {"127.0.0.1"}), "203.0.113.4");

    // Rotating the header does not buy a fresh window.
    FixedWindowRateLimiter limiter(2, 60s);
    const auto t0 = FixedWindowRateLimiter::Clock::now();
    int allowed = 0;
    for (int i = 0; i < 5; ++i) {
        auto key = clientKey("10.1.1." + std::to_string(i), "", "203.0.113.4");
        allowed += limiter.allow(key, t0).allowed ? 1 : 0;
    }
    EXPECT_EQ(allowed, 2);
}

} // namespace conduit::auth::test
