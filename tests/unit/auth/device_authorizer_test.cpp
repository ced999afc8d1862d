#include <gtest/gtest.h>

#include <conduit/auth/device_authorizer.h>

#include "test_support.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

using namespace std::chrono_literals;
using conduit::test::runAwaitable;

namespace conduit::auth::test {

namespace {

class DeviceAuthorizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = DeviceStore::open(":memory:", storage::ConnectionMode::Memory);
        ASSERT_TRUE(opened) << opened.error().message;
        store_ = std::move(opened).value();
    }

    std::unique_ptr<DeviceAuthorizer> makeAuthorizer(AuthorizerOptions options = {}) {
        return std::make_unique<DeviceAuthorizer>(io_.get_executor(), *store_,
                                                  TokenSigner("authorizer-test-secret"),
                                                  options);
    }

    Registration registerPhone(DeviceAuthorizer& auth) {
        auto reg = auth.registerDevice("Pixel", DeviceClass::Mobile, "UnitTest/1.0", "10.1.1.1");
        EXPECT_TRUE(reg) << reg.error().message;
        return reg.value();
    }

    // Start verify() and, after @p delay, run @p decide on the io thread.
    Result<VerificationOutcome> verifyWith(DeviceAuthorizer& auth, const Registration& reg,
                                           std::chrono::milliseconds delay,
                                           std::function<void()> decide) {
        std::optional<Result<VerificationOutcome>> outcome;
        boost::asio::co_spawn(
            io_,
            [&]() -> boost::asio::awaitable<void> {
                outcome.emplace(co_await auth.verify(reg.deviceId, reg.verificationCode));
            },
            [](std::exception_ptr e) { conduit::test::rethrowIfSet(e); });
        boost::asio::steady_timer trigger(io_);
        if (decide) {
            trigger.expires_after(delay);
            trigger.async_wait([&](boost::system::error_code ec) {
                if (!ec)
                    decide();
            });
        }
        io_.run();
        io_.restart();
        if (!outcome)
            return Error{ErrorCode::InternalError, "verify did not complete"};
        return std::move(*outcome);
    }

    boost::asio::io_context io_;
    std::unique_ptr<DeviceStore> store_;
};

} // namespace

TEST_F(DeviceAuthorizerTest, RegisterCreatesPendingDevice) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);
    EXPECT_FALSE(reg.deviceId.empty());
    EXPECT_EQ(reg.verificationCode.size(), 6u);

    auto devices = auth->listDevices();
    ASSERT_TRUE(devices);
    ASSERT_EQ(devices.value().size(), 1u);
    EXPECT_EQ(devices.value()[0].record.status, DeviceStatus::Pending);
    EXPECT_FALSE(devices.value()[0].awaitingDecision);

    auto unnamed = auth->registerDevice("", DeviceClass::Desktop, "", "");
    ASSERT_FALSE(unnamed);
    EXPECT_EQ(unnamed.error().code, ErrorCode::InvalidArgument);
}

TEST_F(DeviceAuthorizerTest, ApproveIssuesWorkingToken) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);

    bool sawWaiting = false;
    auto outcome = verifyWith(*auth, reg, 20ms, [&] {
        sawWaiting = auth->pendingCount() == 1;
        auto listed = auth->listDevices();
        sawWaiting = sawWaiting && listed && listed.value()[0].awaitingDecision;
        EXPECT_TRUE(auth->authorize(reg.deviceId, ApprovalDecision::Approve));
        // Only the first decision counts.
        EXPECT_FALSE(auth->authorize(reg.deviceId, ApprovalDecision::Reject));
    });

    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_TRUE(sawWaiting);
    EXPECT_EQ(outcome.value().status, DeviceStatus::Approved);
    ASSERT_TRUE(outcome.value().authToken.has_value());
    EXPECT_TRUE(outcome.value().expiresAt.has_value());
    EXPECT_EQ(auth->pendingCount(), 0u);

    auto deviceId = auth->validateToken(*outcome.value().authToken);
    ASSERT_TRUE(deviceId) << deviceId.error().message;
    EXPECT_EQ(deviceId.value(), reg.deviceId);
}

TEST_F(DeviceAuthorizerTest, RejectLeavesNoToken) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);
    auto outcome = verifyWith(*auth, reg, 10ms, [&] {
        EXPECT_TRUE(auth->authorize(reg.deviceId, ApprovalDecision::Reject));
    });
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, DeviceStatus::Rejected);
    EXPECT_FALSE(outcome.value().authToken.has_value());
}

TEST_F(DeviceAuthorizerTest, UndecidedVerificationTimesOut) {
    AuthorizerOptions options;
    options.verifyTimeout = 50ms;
    auto auth = makeAuthorizer(options);
    auto reg = registerPhone(*auth);

    const auto started = std::chrono::steady_clock::now();
    auto outcome = verifyWith(*auth, reg, 0ms, nullptr);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, DeviceStatus::Expired);
    EXPECT_EQ(auth->pendingCount(), 0u);
    // A late decision finds nothing to resolve.
    EXPECT_FALSE(auth->authorize(reg.deviceId, ApprovalDecision::Approve));

    auto record = store_->find(reg.deviceId);
    ASSERT_TRUE(record && record.value());
    EXPECT_EQ(record.value()->status, DeviceStatus::Expired);
}

TEST_F(DeviceAuthorizerTest, BadCodesFailImmediately) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);

    auto unknown = runAwaitable(io_, auth->verify("no-such-device", "123456"));
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    const std::string wrong = reg.verificationCode == "000000" ? "111111" : "000000";
    auto mismatch = runAwaitable(io_, auth->verify(reg.deviceId, wrong));
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().code, ErrorCode::InvalidCode);

    // The failed attempt consumed the code.
    auto retry = runAwaitable(io_, auth->verify(reg.deviceId, reg.verificationCode));
    ASSERT_FALSE(retry);
    EXPECT_EQ(retry.error().code, ErrorCode::InvalidCode);
    EXPECT_EQ(auth->pendingCount(), 0u);
}

TEST_F(DeviceAuthorizerTest, LapsedRegistrationIsExpired) {
    AuthorizerOptions options;
    options.registrationTtl = 0s;
    auto auth = makeAuthorizer(options);
    auto reg = registerPhone(*auth);

    auto outcome = runAwaitable(io_, auth->verify(reg.deviceId, reg.verificationCode));
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::Expired);
    EXPECT_EQ(store_->find(reg.deviceId).value()->status, DeviceStatus::Expired);
}

TEST_F(DeviceAuthorizerTest, RevokeInvalidatesToken) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);
    auto outcome = verifyWith(*auth, reg, 10ms, [&] {
        auth->authorize(reg.deviceId, ApprovalDecision::Approve);
    });
    ASSERT_TRUE(outcome);
    ASSERT_TRUE(outcome.value().authToken.has_value());
    const auto token = *outcome.value().authToken;
    ASSERT_TRUE(auth->validateToken(token));

    ASSERT_TRUE(auth->revoke(reg.deviceId));
    auto after = auth->validateToken(token);
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, ErrorCode::Unauthorized);

    auto unknown = auth->revoke("no-such-device");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST_F(DeviceAuthorizerTest, RevokeWhileWaitingRejects) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);
    auto outcome = verifyWith(*auth, reg, 10ms, [&] {
        EXPECT_TRUE(auth->revoke(reg.deviceId));
    });
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, DeviceStatus::Rejected);
    EXPECT_EQ(auth->pendingCount(), 0u);
}

TEST_F(DeviceAuthorizerTest, ForgedTokenRejected) {
    auto auth = makeAuthorizer();
    TokenSigner stranger("some-other-secret");
    const auto now = std::chrono::system_clock::now();
    auto forged = stranger.issue("device-x", now, now + 1h);
    auto result = auth->validateToken(forged);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Unauthorized);
}

TEST_F(DeviceAuthorizerTest, ShutdownExpiresWaitingVerifications) {
    auto auth = makeAuthorizer();
    auto reg = registerPhone(*auth);
    auto outcome = verifyWith(*auth, reg, 10ms, [&] { auth->shutdown(); });
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, DeviceStatus::Expired);
    EXPECT_EQ(auth->pendingCount(), 0u);
}

} // namespace conduit::auth::test
