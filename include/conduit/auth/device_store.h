#pragma once

#include <conduit/core/types.h>
#include <conduit/storage/database.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::auth {

enum class DeviceStatus { Pending, Approved, Rejected, Expired };
enum class DeviceClass { Mobile, Tablet, Desktop };

const char* toString(DeviceStatus status) noexcept;
const char* toString(DeviceClass deviceClass) noexcept;
std::optional<DeviceStatus> parseDeviceStatus(std::string_view s);
/// Unknown values map to Desktop.
DeviceClass parseDeviceClass(std::string_view s);

struct DeviceRecord {
    std::string deviceId;
    std::string deviceName;
    DeviceClass deviceClass{DeviceClass::Desktop};
    std::optional<std::string> verificationCode;
    std::optional<TimePoint> codeExpiresAt;
    std::optional<std::string> authToken;
    DeviceStatus status{DeviceStatus::Pending};
    TimePoint createdAt{};
    std::optional<TimePoint> lastActiveAt;
    /// Registration deadline while pending, token expiry once approved.
    TimePoint expiresAt{};
    std::string clientIp;
    std::string userAgent;
};

/// Result of presenting a verification code.
enum class CodeCheck {
    Accepted,
    Mismatch,
    CodeExpired,
    RegistrationExpired,
    NotPending,
    NotFound
};

/**
 * @brief Persistent device authorization records (SQLite table `devices`).
 *
 * Every write goes through one mutex so a revoke and a concurrent activity touch cannot
 * interleave. The touch itself is conditional on the token still being current, so it can
 * never bring a revoked device back.
 */
class DeviceStore {
public:
    static Result<std::unique_ptr<DeviceStore>>
    open(const std::string& path, storage::ConnectionMode mode = storage::ConnectionMode::Create);

    explicit DeviceStore(storage::Database db);
    DeviceStore(const DeviceStore&) = delete;
    DeviceStore& operator=(const DeviceStore&) = delete;

    Result<void> initializeSchema();

    Result<void> insertPending(const DeviceRecord& record);
    Result<std::optional<DeviceRecord>> find(const std::string& deviceId);

    /**
     * Check @p code against a pending device. The stored code is cleared on every attempt,
     * matching or not. Nothing changes for unknown or non-pending devices.
     */
    Result<CodeCheck> consumeCode(const std::string& deviceId, const std::string& code,
                                  TimePoint now);

    /// pending -> approved with @p token. False when the device is no longer pending.
    Result<bool> approve(const std::string& deviceId, const std::string& token,
                         TimePoint tokenExpiresAt);
    /// pending -> rejected.
    Result<bool> reject(const std::string& deviceId);
    /// pending -> expired.
    Result<bool> markExpired(const std::string& deviceId);
    /// Any status -> rejected, token cleared. False for unknown devices.
    Result<bool> revoke(const std::string& deviceId);

    /// Approved, unexpired device currently holding @p token.
    Result<std::optional<DeviceRecord>> findByToken(const std::string& token, TimePoint now);
    /// Refresh last-active only while @p token is still the device's approved token.
    Result<bool> touch(const std::string& deviceId, const std::string& token, TimePoint now);

    Result<std::vector<DeviceRecord>> list();

    /// Delete pending registrations past their deadline; expire lapsed tokens.
    Result<int> purgeExpired(TimePoint now);

private:
    Result<bool> transition(const std::string& sql, const std::string& deviceId);

    std::mutex mutex_;
    storage::Database db_;
};

} // namespace conduit::auth
