#include <gtest/gtest.h>

#include <conduit/exec/cancellation_registry.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace conduit::exec::test {

TEST(CancellationRegistryTest, RegisterCancelRelease) {
    CancellationRegistry registry;
    auto token = registry.registerRequest("req-1");
    ASSERT_TRUE(token) << token.error().message;
    EXPECT_TRUE(registry.contains("req-1"));
    EXPECT_FALSE(token.value().isCancelled());

    EXPECT_TRUE(registry.cancel("req-1"));
    EXPECT_TRUE(token.value().isCancelled());

    registry.release("req-1");
    EXPECT_FALSE(registry.contains("req-1"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(CancellationRegistryTest, DuplicateLiveIdIsConflict) {
    CancellationRegistry registry;
    auto first = registry.registerRequest("dup");
    ASSERT_TRUE(first);
    auto second = registry.registerRequest("dup");
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::Conflict);

    // The original token is untouched by the rejected registration.
    EXPECT_TRUE(registry.cancel("dup"));
    EXPECT_TRUE(first.value().isCancelled());
}

TEST(CancellationRegistryTest, IdReusableAfterRelease) {
    CancellationRegistry registry;
    ASSERT_TRUE(registry.registerRequest("again"));
    registry.release("again");
    auto token = registry.registerRequest("again");
    ASSERT_TRUE(token);
    EXPECT_FALSE(token.value().isCancelled());
}

TEST(CancellationRegistryTest, CancelUnknownIsNoop) {
    CancellationRegistry registry;
    EXPECT_FALSE(registry.cancel("missing"));
    registry.release("missing");
    EXPECT_EQ(registry.size(), 0u);
}

TEST(CancellationRegistryTest, EmptyIdRejected) {
    CancellationRegistry registry;
    auto token = registry.registerRequest("");
    ASSERT_FALSE(token);
    EXPECT_EQ(token.error().code, ErrorCode::InvalidArgument);
}

TEST(CancellationRegistryTest, DistinctIdsDoNotInterfere) {
    CancellationRegistry registry;
    auto a = registry.registerRequest("a");
    auto b = registry.registerRequest("b");
    ASSERT_TRUE(a && b);
    EXPECT_TRUE(registry.cancel("a"));
    EXPECT_TRUE(a.value().isCancelled());
    EXPECT_FALSE(b.value().isCancelled());

    auto ids = registry.activeIds();
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_TRUE(registry.startedAt("b").has_value());
    EXPECT_FALSE(registry.startedAt("c").has_value());
}

TEST(CancellationRegistryTest, CallbackRunsOnceOnCancel) {
    CancellationRegistry registry;
    auto token = registry.registerRequest("cb");
    ASSERT_TRUE(token);
    int calls = 0;
    auto registration = token.value().onCancel([&] { ++calls; });
    registry.cancel("cb");
    registry.cancel("cb");
    EXPECT_EQ(calls, 1);

    // Registering after cancellation fires immediately.
    int late = 0;
    auto lateRegistration = token.value().onCancel([&] { ++late; });
    EXPECT_EQ(late, 1);
}

TEST(CancellationRegistryTest, CallbackUnregisteredOnDestruction) {
    CancellationRegistry registry;
    auto token = registry.registerRequest("scoped");
    ASSERT_TRUE(token);
    int calls = 0;
    {
        auto registration = token.value().onCancel([&] { ++calls; });
    }
    registry.cancel("scoped");
    EXPECT_EQ(calls, 0);
}

TEST(CancellationRegistryTest, ConcurrentRegisterAndCancel) {
    CancellationRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string id = "t" + std::to_string(t) + "-" + std::to_string(i);
                auto token = registry.registerRequest(id);
                if (!token) {
                    ++conflicts;
                    continue;
                }
                registry.cancel(id);
                if (!token.value().isCancelled())
                    ++conflicts;
                registry.release(id);
            }
        });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(conflicts.load(), 0);
    EXPECT_EQ(registry.size(), 0u);
}

} // namespace conduit::exec::test
