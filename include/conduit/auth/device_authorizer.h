#pragma once

#include <conduit/auth/device_store.h>
#include <conduit/auth/pending_approval.h>
#include <conduit/auth/token_signer.h>
#include <conduit/core/types.h>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conduit::auth {

struct AuthorizerOptions {
    std::chrono::seconds codeTtl{300};
    std::chrono::seconds registrationTtl{600};
    std::chrono::milliseconds verifyTimeout{std::chrono::minutes(5)};
    std::chrono::hours tokenTtl{24 * 30};
    std::size_t codeDigits{6};
};

struct Registration {
    std::string deviceId;
    std::string verificationCode;
    TimePoint expiresAt{};
};

struct VerificationOutcome {
    std::string deviceId;
    DeviceStatus status{DeviceStatus::Pending};
    std::optional<std::string> authToken;
    std::optional<TimePoint> expiresAt;
};

struct DeviceSummary {
    DeviceRecord record;
    bool awaitingDecision{false};
};

/**
 * @brief Device pairing: register, verify (held open until decided), authorize, revoke.
 *
 * A successful verify() parks a PendingApproval slot keyed by device id and suspends until
 * authorize() decides it or the verification timeout fires. Whichever resolves first removes
 * the slot under the table lock, so exactly one of them takes effect.
 */
class DeviceAuthorizer {
public:
    DeviceAuthorizer(boost::asio::any_io_executor executor, DeviceStore& store,
                     TokenSigner signer, AuthorizerOptions options = {});
    ~DeviceAuthorizer();

    DeviceAuthorizer(const DeviceAuthorizer&) = delete;
    DeviceAuthorizer& operator=(const DeviceAuthorizer&) = delete;

    Result<Registration> registerDevice(const std::string& deviceName, DeviceClass deviceClass,
                                        const std::string& userAgent,
                                        const std::string& clientIp);

    /**
     * NotFound for unknown devices, InvalidCode for a wrong/used/expired code, Expired when
     * the registration itself lapsed. Otherwise waits for the decision.
     */
    boost::asio::awaitable<Result<VerificationOutcome>> verify(std::string deviceId,
                                                               std::string code);

    /// Resolve a waiting verification. False (no-op) when nothing is waiting.
    bool authorize(const std::string& deviceId, ApprovalDecision decision);

    /// Device id for a valid, current, approved token.
    Result<std::string> validateToken(const std::string& token);

    Result<void> revoke(const std::string& deviceId);

    Result<std::vector<DeviceSummary>> listDevices();

    std::size_t pendingCount() const;

    Result<int> purgeExpired(TimePoint now);

    /// Resolve every waiting verification as expired.
    void shutdown();

    const AuthorizerOptions& options() const noexcept { return options_; }

private:
    bool resolveSlot(const std::string& deviceId, ApprovalDecision decision);
    Result<VerificationOutcome> applyDecision(const std::string& deviceId,
                                              ApprovalDecision decision);

    boost::asio::any_io_executor executor_;
    DeviceStore& store_;
    TokenSigner signer_;
    AuthorizerOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PendingApproval>> slots_;
};

} // namespace conduit::auth
