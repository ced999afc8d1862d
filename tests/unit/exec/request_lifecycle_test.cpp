#include <gtest/gtest.h>

#include <conduit/exec/request_lifecycle.h>

#include "test_support.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <functional>
#include <stdexcept>

using conduit::stream::Channel;
using conduit::stream::EventSink;
using conduit::stream::EventType;
using conduit::stream::StreamEvent;
using conduit::test::RecordingSink;
using conduit::test::runAwaitable;

namespace conduit::exec::test {

namespace {

// Adapter whose behavior is supplied by the test.
class ScriptedAdapter final : public ProcessAdapter {
public:
    using Body = std::function<void(const CancellationToken&, EventSink&)>;
    explicit ScriptedAdapter(Body body) : body_(std::move(body)) {}

    const char* kind() const noexcept override { return "scripted"; }
    boost::asio::awaitable<void> run(CancellationToken token, EventSink& sink) override {
        ++runs;
        body_(token, sink);
        co_return;
    }

    int runs{0};

private:
    Body body_;
};

// Waits until cancelled, then reports it.
class WaitForCancelAdapter final : public ProcessAdapter {
public:
    const char* kind() const noexcept override { return "waiting"; }
    boost::asio::awaitable<void> run(CancellationToken token, EventSink& sink) override {
        sink.emit(StreamEvent::start());
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_at(boost::asio::steady_timer::time_point::max());
        auto registration = token.onCancel([&timer] { timer.cancel(); });
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        sink.emit(StreamEvent::aborted());
    }
};

} // namespace

TEST(RequestLifecycleTest, CompletedRunReleasesEntry) {
    boost::asio::io_context io;
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    RecordingSink sink;
    ScriptedAdapter adapter([&](const CancellationToken&, EventSink& s) {
        EXPECT_TRUE(registry.contains("r1"));
        s.emit(StreamEvent::start());
        s.emit(StreamEvent::data(Channel::Stdout, "hi"));
        s.emit(StreamEvent::exit(0));
    });

    auto state = runAwaitable(io, lifecycle.start("r1", adapter, sink));
    ASSERT_TRUE(state) << state.error().message;
    EXPECT_EQ(state.value(), RequestState::Completed);
    EXPECT_EQ(sink.events.size(), 3u);
    EXPECT_FALSE(registry.contains("r1"));
}

TEST(RequestLifecycleTest, EventsAfterTerminalAreSuppressed) {
    boost::asio::io_context io;
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    RecordingSink sink;
    ScriptedAdapter adapter([](const CancellationToken&, EventSink& s) {
        s.emit(StreamEvent::done());
        s.emit(StreamEvent::data(Channel::Stdout, "late"));
        s.emit(StreamEvent::error("also late"));
    });

    auto state = runAwaitable(io, lifecycle.start("r2", adapter, sink));
    ASSERT_TRUE(state);
    EXPECT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.terminalCount(), 1u);
}

TEST(RequestLifecycleTest, AdapterExceptionBecomesErrorEvent) {
    boost::asio::io_context io;
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    RecordingSink sink;
    ScriptedAdapter adapter([](const CancellationToken&, EventSink& s) {
        s.emit(StreamEvent::start());
        throw std::runtime_error("adapter blew up");
    });

    auto state = runAwaitable(io, lifecycle.start("r3", adapter, sink));
    ASSERT_TRUE(state);
    EXPECT_EQ(state.value(), RequestState::Failed);
    ASSERT_EQ(sink.events.size(), 2u);
    EXPECT_EQ(sink.events[1].type, EventType::Error);
    EXPECT_EQ(sink.events[1].text, "adapter blew up");
    EXPECT_EQ(registry.size(), 0u);
}

TEST(RequestLifecycleTest, MissingTerminalIsSynthesized) {
    boost::asio::io_context io;
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    RecordingSink sink;
    ScriptedAdapter adapter(
        [](const CancellationToken&, EventSink& s) { s.emit(StreamEvent::start()); });

    auto state = runAwaitable(io, lifecycle.start("r4", adapter, sink));
    ASSERT_TRUE(state);
    EXPECT_EQ(state.value(), RequestState::Failed);
    EXPECT_EQ(sink.terminalCount(), 1u);
    EXPECT_EQ(sink.events.back().type, EventType::Error);
}

TEST(RequestLifecycleTest, DuplicateInFlightIdIsConflict) {
    boost::asio::io_context io;
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    auto first = lifecycle.begin("dup");
    ASSERT_TRUE(first);

    RecordingSink sink;
    ScriptedAdapter adapter([](const CancellationToken&, EventSink& s) { s.emit(StreamEvent::done()); });
    auto second = runAwaitable(io, lifecycle.start("dup", adapter, sink));
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::Conflict);
    EXPECT_EQ(adapter.runs, 0);
    EXPECT_TRUE(sink.events.empty());

    // The first owner is unaffected and still releases on destruction.
    EXPECT_TRUE(registry.contains("dup"));
    first.value().release();
    EXPECT_FALSE(registry.contains("dup"));
}

TEST(RequestLifecycleTest, HandleReleasesOnDestruction) {
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    {
        auto handle = lifecycle.begin("scoped");
        ASSERT_TRUE(handle);
        RequestHandle moved = std::move(handle).value();
        EXPECT_TRUE(moved.active());
        EXPECT_TRUE(registry.contains("scoped"));
    }
    EXPECT_FALSE(registry.contains("scoped"));
}

TEST(RequestLifecycleTest, CancelReachesRunningAdapter) {
    boost::asio::io_context io;
    CancellationRegistry registry;
    RequestLifecycleManager lifecycle(registry);
    RecordingSink sink;
    WaitForCancelAdapter adapter;

    EXPECT_FALSE(lifecycle.cancel("r5"));
    boost::asio::steady_timer trigger(io);
    trigger.expires_after(std::chrono::milliseconds(50));
    trigger.async_wait(
        [&](boost::system::error_code) { EXPECT_TRUE(lifecycle.cancel("r5")); });

    auto state = runAwaitable(io, lifecycle.start("r5", adapter, sink));
    ASSERT_TRUE(state);
    EXPECT_EQ(state.value(), RequestState::Cancelled);
    EXPECT_EQ(sink.events.back().type, EventType::Aborted);
    EXPECT_EQ(registry.size(), 0u);
}

} // namespace conduit::exec::test
