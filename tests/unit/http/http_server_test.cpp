#include <gtest/gtest.h>

#include <conduit/http/http_server.h>
#include <conduit/stream/stream_event.h>

#include "test_support.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using nlohmann::json;
using conduit::test::runAwaitable;

namespace conduit::http::test {

namespace {

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = auth::DeviceStore::open(":memory:", storage::ConnectionMode::Memory);
        ASSERT_TRUE(opened) << opened.error().message;
        store_ = std::move(opened).value();
        config_.host = "127.0.0.1";
        config_.port = 0;
        config_.compatLayer = exec::CompatLayerMode::Off;
        config_.rateLimit.writeMax = 10;
        config_.rateLimit.readMax = 5;
        config_.auth.verifyTimeout = std::chrono::milliseconds(100);
    }

    void build() {
        authorizer_ = std::make_unique<auth::DeviceAuthorizer>(
            io_.get_executor(), *store_, auth::TokenSigner("http-test-secret"), config_.auth);
        server_ = std::make_unique<HttpServer>(io_, config_, *authorizer_, lifecycle_);
    }

    Request request(bhttp::verb method, const std::string& target, const json& body = nullptr) {
        Request req{method, target, 11};
        req.set(bhttp::field::host, "10.0.0.5:8080");
        if (!body.is_null()) {
            req.set(bhttp::field::content_type, "application/json");
            req.body() = body.dump();
            req.prepare_payload();
        }
        return req;
    }

    Response call(const Request& req, const std::string& client = "10.0.0.9") {
        return runAwaitable(io_, server_->dispatch(req, client));
    }

    static json bodyOf(const Response& res) { return json::parse(res.body()); }

    exec::CancellationRegistry registry_;
    exec::RequestLifecycleManager lifecycle_{registry_};
    boost::asio::io_context io_;
    std::unique_ptr<auth::DeviceStore> store_;
    config::ServerConfig config_;
    std::unique_ptr<auth::DeviceAuthorizer> authorizer_;
    std::unique_ptr<HttpServer> server_;
};

// Send one raw request and read until the server closes the connection.
boost::asio::awaitable<void> roundTrip(std::uint16_t port, Request req, std::string& out) {
    auto ex = co_await boost::asio::this_coro::executor;
    tcp::socket socket(ex);
    co_await socket.async_connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port),
                                  boost::asio::use_awaitable);
    co_await bhttp::async_write(socket, req, boost::asio::use_awaitable);
    boost::system::error_code ec;
    char buf[4096];
    for (;;) {
        auto n = co_await socket.async_read_some(
            boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        out.append(buf, n);
        if (ec)
            break;
    }
}

std::vector<stream::StreamEvent> ndjsonEvents(const std::string& raw) {
    std::vector<stream::StreamEvent> events;
    auto bodyStart = raw.find("\r\n\r\n");
    if (bodyStart == std::string::npos)
        return events;
    std::istringstream in(raw.substr(bodyStart + 4));
    std::string line;
    while (std::getline(in, line)) {
        if (auto ev = stream::decodeEvent(line))
            events.push_back(std::move(*ev));
    }
    return events;
}

} // namespace

TEST(RequestPathTest, StripsQueryAndDecodes) {
    EXPECT_EQ(requestPath("/api/chat?x=1"), "/api/chat");
    EXPECT_EQ(requestPath("/api/abort/req%201"), "/api/abort/req 1");
    EXPECT_EQ(requestPath("/bad%zzescape"), "/bad%zzescape");
    EXPECT_EQ(requestPath("/trailing%2"), "/trailing%2");
}

TEST(JsonResponseTest, CarriesCorsHeaders) {
    auto res = jsonResponse(201, json{{"ok", true}});
    EXPECT_EQ(res.result_int(), 201u);
    EXPECT_EQ(res[bhttp::field::access_control_allow_origin], "*");
    EXPECT_EQ(res[bhttp::field::content_type], "application/json");
    EXPECT_FALSE(res.keep_alive());
    EXPECT_EQ(json::parse(res.body())["ok"], true);
}

TEST_F(HttpServerTest, UnknownRouteIs404) {
    build();
    auto res = call(request(bhttp::verb::get, "/api/nothing"));
    EXPECT_EQ(res.result_int(), 404u);
    EXPECT_EQ(bodyOf(res)["error"], "Not found");
}

TEST_F(HttpServerTest, CancelUnknownRequest) {
    build();
    auto res = call(request(bhttp::verb::post, "/api/abort/missing-id"));
    EXPECT_EQ(res.result_int(), 404u);
    EXPECT_EQ(bodyOf(res)["error"], "Request not found or already completed");

    auto handle = lifecycle_.begin("live-id");
    ASSERT_TRUE(handle);
    auto ok = call(request(bhttp::verb::post, "/api/terminal/abort/live-id"));
    EXPECT_EQ(ok.result_int(), 200u);
    EXPECT_EQ(bodyOf(ok)["success"], true);
    EXPECT_TRUE(handle.value().token().isCancelled());
}

TEST_F(HttpServerTest, ShellsAndSystemInfo) {
    build();
    auto shells = bodyOf(call(request(bhttp::verb::get, "/api/terminal/shells")));
    EXPECT_EQ(shells["default"], "bash");
    EXPECT_TRUE(shells["shells"].is_array());
    EXPECT_EQ(shells["platform"], "linux");

    auto info = bodyOf(call(request(bhttp::verb::get, "/api/terminal/info")));
    EXPECT_TRUE(info.contains("hostname"));
    EXPECT_TRUE(info.contains("homeDirectory"));
    EXPECT_EQ(info["isWSL"], false);
}

TEST_F(HttpServerTest, ValidatePath) {
    build();
    auto missing = call(request(bhttp::verb::post, "/api/terminal/validate-path", json::object()));
    EXPECT_EQ(missing.result_int(), 400u);
    EXPECT_EQ(bodyOf(missing)["message"], "Path is required");

    auto tmp = call(request(bhttp::verb::post, "/api/terminal/validate-path",
                            json{{"path", "/tmp"}}));
    EXPECT_EQ(tmp.result_int(), 200u);
    EXPECT_EQ(bodyOf(tmp)["isValid"], true);
}

TEST_F(HttpServerTest, PairingFlowOverDispatch) {
    build();
    auto reg = call(request(bhttp::verb::post, "/api/auth/register",
                            json{{"deviceName", "Tablet"}, {"deviceType", "tablet"}}));
    ASSERT_EQ(reg.result_int(), 200u) << reg.body();
    auto registered = bodyOf(reg);
    EXPECT_EQ(registered["status"], "pending");
    const auto deviceId = registered["deviceId"].get<std::string>();
    const auto code = registered["verificationCode"].get<std::string>();

    auto listed = bodyOf(call(request(bhttp::verb::get, "/api/auth/devices")));
    ASSERT_EQ(listed["devices"].size(), 1u);
    EXPECT_EQ(listed["devices"][0]["type"], "tablet");
    EXPECT_TRUE(listed["devices"][0]["lastActiveAt"].is_null());

    // Nobody decides within the verification timeout.
    auto verify = call(request(bhttp::verb::post, "/api/auth/verify",
                               json{{"deviceId", deviceId}, {"verificationCode", code}}));
    EXPECT_EQ(verify.result_int(), 200u);
    EXPECT_EQ(bodyOf(verify)["status"], "expired");
    EXPECT_FALSE(bodyOf(verify).contains("authToken"));

    auto bad = call(request(bhttp::verb::post, "/api/auth/authorize",
                            json{{"deviceId", deviceId}, {"action", "maybe"}}));
    EXPECT_EQ(bad.result_int(), 400u);

    auto revoke = call(request(bhttp::verb::delete_, "/api/auth/devices/" + deviceId));
    EXPECT_EQ(revoke.result_int(), 200u);
    auto again = call(request(bhttp::verb::delete_, "/api/auth/devices/unknown-device"));
    EXPECT_EQ(again.result_int(), 404u);
}

TEST_F(HttpServerTest, VerifyErrorsMapToStatus) {
    build();
    auto missing = call(request(bhttp::verb::post, "/api/auth/verify", json{{"deviceId", "x"}}));
    EXPECT_EQ(missing.result_int(), 400u);

    auto unknown = call(request(bhttp::verb::post, "/api/auth/verify",
                                json{{"deviceId", "x"}, {"verificationCode", "123456"}}));
    EXPECT_EQ(unknown.result_int(), 404u);
    EXPECT_EQ(bodyOf(unknown)["error"], "Device not found");
}

TEST_F(HttpServerTest, WriteEndpointsAreRateLimited) {
    config_.rateLimit.writeMax = 3;
    build();
    for (int i = 0; i < 3; ++i) {
        auto res = call(request(bhttp::verb::post, "/api/auth/register",
                                json{{"deviceName", "Phone " + std::to_string(i)}}));
        EXPECT_EQ(res.result_int(), 200u);
    }
    auto limited = call(request(bhttp::verb::post, "/api/auth/register",
                                json{{"deviceName", "One too many"}}));
    EXPECT_EQ(limited.result_int(), 429u);
    EXPECT_EQ(bodyOf(limited)["error"], "Too many requests");
    EXPECT_FALSE(limited[bhttp::field::retry_after].empty());

    // Another client has its own window.
    auto other = call(request(bhttp::verb::post, "/api/auth/register",
                              json{{"deviceName", "Laptop"}}),
                      "10.0.0.10");
    EXPECT_EQ(other.result_int(), 200u);
}

TEST_F(HttpServerTest, ExecuteStreamsOverTcp) {
    build();
    ASSERT_TRUE(server_->start());
    const auto port = server_->localPort();
    ASSERT_NE(port, 0);

    auto req = request(bhttp::verb::post, "/api/terminal/execute",
                       json{{"command", "echo streamed"}, {"requestId", "tcp-1"}, {"shell", "sh"}});
    req.set(bhttp::field::host, "127.0.0.1");
    std::string raw;
    boost::asio::co_spawn(
        io_,
        [&]() -> boost::asio::awaitable<void> {
            co_await roundTrip(port, req, raw);
            server_->stop();
        },
        [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });
    io_.run();

    EXPECT_NE(raw.find("application/x-ndjson"), std::string::npos);
    auto events = ndjsonEvents(raw);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().type, stream::EventType::Start);
    EXPECT_EQ(events[1].text, "streamed\n");
    EXPECT_EQ(events.back().type, stream::EventType::Exit);
    EXPECT_EQ(events.back().exitCode, 0);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(HttpServerTest, RemoteRequestWithoutTokenIsRejected) {
    config_.allowLocalhost = false;
    build();
    ASSERT_TRUE(server_->start());
    const auto port = server_->localPort();

    auto req = request(bhttp::verb::post, "/api/chat",
                       json{{"message", "hi"}, {"requestId", "r-1"}});
    std::string raw;
    boost::asio::co_spawn(
        io_,
        [&]() -> boost::asio::awaitable<void> {
            co_await roundTrip(port, req, raw);
            server_->stop();
        },
        [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });
    io_.run();

    EXPECT_EQ(raw.rfind("HTTP/1.1 401", 0), 0u) << raw;
    EXPECT_NE(raw.find("Unauthorized"), std::string::npos);
}

TEST_F(HttpServerTest, ForwardedRemoteClientIsNotTreatedAsLocal) {
    config_.trustedProxies = {"127.0.0.1"};
    build();
    ASSERT_TRUE(server_->start());
    const auto port = server_->localPort();

    auto req = request(bhttp::verb::post, "/api/terminal/execute",
                       json{{"command", "echo pwned"}, {"requestId", "fwd-1"}, {"shell", "sh"}});
    req.set(bhttp::field::host, "localhost");
    req.set(bhttp::field::origin, "http://localhost");
    req.set("X-Forwarded-For", "203.0.113.7");
    std::string raw;
    boost::asio::co_spawn(
        io_,
        [&]() -> boost::asio::awaitable<void> {
            co_await roundTrip(port, req, raw);
            server_->stop();
        },
        [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });
    io_.run();

    EXPECT_EQ(raw.rfind("HTTP/1.1 401", 0), 0u) << raw;
    EXPECT_EQ(raw.find("pwned"), std::string::npos);
}

TEST_F(HttpServerTest, StreamingEndpointsAreRateLimited) {
    config_.rateLimit.writeMax = 1;
    build();
    ASSERT_TRUE(server_->start());
    const auto port = server_->localPort();

    // The peer is not a trusted proxy, so a changing X-Forwarded-For shares one window.
    auto first = request(bhttp::verb::post, "/api/terminal/execute",
                         json{{"command", "true"}, {"requestId", "rl-1"}, {"shell", "sh"}});
    first.set("X-Forwarded-For", "10.9.0.1");
    auto second = request(bhttp::verb::post, "/api/chat",
                          json{{"message", "hi"}, {"requestId", "rl-2"}});
    second.set("X-Forwarded-For", "10.9.0.2");
    std::string rawFirst, rawSecond;
    boost::asio::co_spawn(
        io_,
        [&]() -> boost::asio::awaitable<void> {
            co_await roundTrip(port, first, rawFirst);
            co_await roundTrip(port, second, rawSecond);
            server_->stop();
        },
        [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });
    io_.run();

    EXPECT_EQ(rawFirst.rfind("HTTP/1.1 200", 0), 0u) << rawFirst;
    EXPECT_EQ(rawSecond.rfind("HTTP/1.1 429", 0), 0u) << rawSecond;
    EXPECT_NE(rawSecond.find("Retry-After"), std::string::npos);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(HttpServerTest, AbortEndsRunningStreamOverTcp) {
    build();
    ASSERT_TRUE(server_->start());
    const auto port = server_->localPort();

    auto execReq = request(bhttp::verb::post, "/api/terminal/execute",
                        json{{"command", "echo begin; sleep 30; echo late"},
                             {"requestId", "r1"},
                             {"shell", "sh"}});
    auto abortReq = request(bhttp::verb::post, "/api/terminal/abort/r1");
    abortReq.prepare_payload();
    std::string streamed, abortReply;
    int pending = 2;
    auto finishOne = [&] {
        if (--pending == 0)
            server_->stop();
    };

    boost::asio::co_spawn(
        io_,
        [&]() -> boost::asio::awaitable<void> {
            co_await roundTrip(port, execReq, streamed);
            finishOne();
        },
        [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });
    boost::asio::co_spawn(
        io_,
        [&]() -> boost::asio::awaitable<void> {
            boost::asio::steady_timer poll(co_await boost::asio::this_coro::executor);
            for (int i = 0; i < 500 && !registry_.contains("r1"); ++i) {
                poll.expires_after(std::chrono::milliseconds(10));
                co_await poll.async_wait(boost::asio::use_awaitable);
            }
            co_await roundTrip(port, abortReq, abortReply);
            finishOne();
        },
        [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });

    const auto started = std::chrono::steady_clock::now();
    io_.run();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(abortReply.rfind("HTTP/1.1 200", 0), 0u) << abortReply;
    auto events = ndjsonEvents(streamed);
    ASSERT_FALSE(events.empty()) << streamed;
    EXPECT_EQ(events.front().type, stream::EventType::Start);
    EXPECT_EQ(events.back().type, stream::EventType::Aborted);
    std::size_t terminals = 0;
    for (const auto& ev : events)
        terminals += ev.isTerminal() ? 1 : 0;
    EXPECT_EQ(terminals, 1u);
    EXPECT_EQ(streamed.find("late"), std::string::npos);
    EXPECT_FALSE(registry_.contains("r1"));
}

} // namespace conduit::http::test
