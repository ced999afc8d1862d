#include <conduit/auth/device_authorizer.h>
#include <conduit/core/uuid.h>

#include <spdlog/spdlog.h>

namespace conduit::auth {

DeviceAuthorizer::DeviceAuthorizer(boost::asio::any_io_executor executor, DeviceStore& store,
                                   TokenSigner signer, AuthorizerOptions options)
    : executor_(executor), store_(store), signer_(std::move(signer)), options_(options) {}

DeviceAuthorizer::~DeviceAuthorizer() {
    shutdown();
}

Result<Registration> DeviceAuthorizer::registerDevice(const std::string& deviceName,
                                                      DeviceClass deviceClass,
                                                      const std::string& userAgent,
                                                      const std::string& clientIp) {
    if (deviceName.empty())
        return Error{ErrorCode::InvalidArgument, "deviceName is required"};

    auto code = generateVerificationCode(options_.codeDigits);
    if (!code)
        return code.error();

    const auto now = std::chrono::system_clock::now();
    DeviceRecord record;
    record.deviceId = core::generateUUID();
    record.deviceName = deviceName;
    record.deviceClass = deviceClass;
    record.verificationCode = code.value();
    record.codeExpiresAt = now + options_.codeTtl;
    record.status = DeviceStatus::Pending;
    record.createdAt = now;
    record.expiresAt = now + options_.registrationTtl;
    record.clientIp = clientIp;
    record.userAgent = userAgent;

    if (auto r = store_.insertPending(record); !r)
        return r.error();

    spdlog::info("[DeviceAuth] registered {} '{}' ({}) from {}", record.deviceId, deviceName,
                 toString(deviceClass), clientIp.empty() ? std::string("unknown") : clientIp);
    return Registration{record.deviceId, *record.verificationCode, *record.codeExpiresAt};
}

boost::asio::awaitable<Result<VerificationOutcome>>
DeviceAuthorizer::verify(std::string deviceId, std::string code) {
    const auto now = std::chrono::system_clock::now();
    auto check = store_.consumeCode(deviceId, code, now);
    if (!check)
        co_return check.error();

    switch (check.value()) {
        case CodeCheck::NotFound:
            co_return Error{ErrorCode::NotFound, "Device not found"};
        case CodeCheck::RegistrationExpired: {
            auto marked = store_.markExpired(deviceId);
            if (!marked)
                co_return marked.error();
            co_return Error{ErrorCode::Expired, "Device registration expired"};
        }
        case CodeCheck::CodeExpired:
            co_return Error{ErrorCode::InvalidCode, "Verification code expired"};
        case CodeCheck::Mismatch:
        case CodeCheck::NotPending:
            co_return Error{ErrorCode::InvalidCode, "Invalid verification code"};
        case CodeCheck::Accepted:
            break;
    }

    auto slot = std::make_shared<PendingApproval>(executor_);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!slots_.emplace(deviceId, slot).second)
            co_return Error{ErrorCode::Conflict, "Verification already in progress"};
    }
    slot->armDeadline(options_.verifyTimeout,
                      [this, deviceId] { resolveSlot(deviceId, ApprovalDecision::Expired); });
    spdlog::info("[DeviceAuth] {} verified code; waiting for approval ({} ms)", deviceId,
                 options_.verifyTimeout.count());

    const auto decision = co_await slot->wait();
    co_return applyDecision(deviceId, decision);
}

Result<VerificationOutcome> DeviceAuthorizer::applyDecision(const std::string& deviceId,
                                                            ApprovalDecision decision) {
    VerificationOutcome outcome;
    outcome.deviceId = deviceId;

    switch (decision) {
        case ApprovalDecision::Approve: {
            const auto now = std::chrono::system_clock::now();
            const auto expiresAt = now + options_.tokenTtl;
            auto token = signer_.issue(deviceId, now, expiresAt);
            auto approved = store_.approve(deviceId, token, expiresAt);
            if (!approved)
                return approved.error();
            if (!approved.value()) {
                // Revoked or purged while waiting.
                outcome.status = DeviceStatus::Rejected;
                spdlog::warn("[DeviceAuth] {} left pending state before approval", deviceId);
                return outcome;
            }
            outcome.status = DeviceStatus::Approved;
            outcome.authToken = std::move(token);
            outcome.expiresAt = expiresAt;
            spdlog::info("[DeviceAuth] {} approved", deviceId);
            return outcome;
        }
        case ApprovalDecision::Reject: {
            auto rejected = store_.reject(deviceId);
            if (!rejected)
                return rejected.error();
            outcome.status = DeviceStatus::Rejected;
            spdlog::info("[DeviceAuth] {} rejected", deviceId);
            return outcome;
        }
        case ApprovalDecision::Expired: {
            auto expired = store_.markExpired(deviceId);
            if (!expired)
                return expired.error();
            outcome.status = DeviceStatus::Expired;
            spdlog::info("[DeviceAuth] {} verification timed out", deviceId);
            return outcome;
        }
    }
    return Error{ErrorCode::InternalError, "Unknown approval decision"};
}

bool DeviceAuthorizer::resolveSlot(const std::string& deviceId, ApprovalDecision decision) {
    std::shared_ptr<PendingApproval> slot;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = slots_.find(deviceId);
        if (it == slots_.end())
            return false;
        slot = std::move(it->second);
        slots_.erase(it);
    }
    return slot->resolve(decision);
}

bool DeviceAuthorizer::authorize(const std::string& deviceId, ApprovalDecision decision) {
    if (decision == ApprovalDecision::Expired)
        return false;
    bool resolved = resolveSlot(deviceId, decision);
    if (resolved) {
        spdlog::info("[DeviceAuth] {} -> {}", deviceId, toString(decision));
    } else {
        spdlog::debug("[DeviceAuth] authorize {} for {}: no verification waiting",
                      toString(decision), deviceId);
    }
    return resolved;
}

Result<std::string> DeviceAuthorizer::validateToken(const std::string& token) {
    const auto now = std::chrono::system_clock::now();
    auto claims = signer_.verify(token, now);
    if (!claims)
        return claims.error();

    auto record = store_.findByToken(token, now);
    if (!record)
        return record.error();
    if (!record.value() || record.value()->deviceId != claims.value().deviceId)
        return Error{ErrorCode::Unauthorized, "Invalid or expired token"};

    if (auto touched = store_.touch(claims.value().deviceId, token, now); !touched) {
        spdlog::warn("[DeviceAuth] last-active update failed: {}", touched.error().message);
    }
    return claims.value().deviceId;
}

Result<void> DeviceAuthorizer::revoke(const std::string& deviceId) {
    auto revoked = store_.revoke(deviceId);
    if (!revoked)
        return revoked.error();
    if (!revoked.value())
        return Error{ErrorCode::NotFound, "Device not found"};
    resolveSlot(deviceId, ApprovalDecision::Reject);
    spdlog::info("[DeviceAuth] {} revoked", deviceId);
    return {};
}

Result<std::vector<DeviceSummary>> DeviceAuthorizer::listDevices() {
    auto records = store_.list();
    if (!records)
        return records.error();
    std::vector<DeviceSummary> out;
    out.reserve(records.value().size());
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& r : records.value()) {
        bool waiting = slots_.find(r.deviceId) != slots_.end();
        out.push_back(DeviceSummary{std::move(r), waiting});
    }
    return out;
}

std::size_t DeviceAuthorizer::pendingCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return slots_.size();
}

Result<int> DeviceAuthorizer::purgeExpired(TimePoint now) {
    return store_.purgeExpired(now);
}

void DeviceAuthorizer::shutdown() {
    std::unordered_map<std::string, std::shared_ptr<PendingApproval>> slots;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        slots.swap(slots_);
    }
    for (auto& [id, slot] : slots) {
        spdlog::debug("[DeviceAuth] expiring pending verification for {}", id);
        slot->resolve(ApprovalDecision::Expired);
    }
}

} // namespace conduit::auth
