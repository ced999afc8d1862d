#include <conduit/auth/device_store.h>

#include <spdlog/spdlog.h>

namespace conduit::auth {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS devices (
    device_id          TEXT PRIMARY KEY,
    device_name        TEXT NOT NULL,
    device_type        TEXT NOT NULL,
    verification_code  TEXT,
    code_expires_at    INTEGER,
    auth_token         TEXT,
    status             TEXT NOT NULL DEFAULT 'pending',
    created_at         INTEGER NOT NULL,
    last_active_at     INTEGER,
    expires_at         INTEGER NOT NULL,
    ip_address         TEXT,
    user_agent         TEXT
);
CREATE INDEX IF NOT EXISTS idx_devices_token ON devices(auth_token);
CREATE INDEX IF NOT EXISTS idx_devices_status ON devices(status);
)sql";

constexpr const char* kColumns =
    "device_id, device_name, device_type, verification_code, code_expires_at, auth_token, "
    "status, created_at, last_active_at, expires_at, ip_address, user_agent";

DeviceRecord readRecord(const storage::Statement& stmt) {
    DeviceRecord r;
    r.deviceId = stmt.getString(0);
    r.deviceName = stmt.getString(1);
    r.deviceClass = parseDeviceClass(stmt.getString(2));
    r.verificationCode = stmt.getOptionalString(3);
    r.codeExpiresAt = stmt.getOptionalTime(4);
    r.authToken = stmt.getOptionalString(5);
    r.status = parseDeviceStatus(stmt.getString(6)).value_or(DeviceStatus::Rejected);
    r.createdAt = stmt.getTime(7);
    r.lastActiveAt = stmt.getOptionalTime(8);
    r.expiresAt = stmt.getTime(9);
    r.clientIp = stmt.getString(10);
    r.userAgent = stmt.getString(11);
    return r;
}

} // namespace

const char* toString(DeviceStatus status) noexcept {
    switch (status) {
        case DeviceStatus::Pending: return "pending";
        case DeviceStatus::Approved: return "approved";
        case DeviceStatus::Rejected: return "rejected";
        case DeviceStatus::Expired: return "expired";
    }
    return "rejected";
}

const char* toString(DeviceClass deviceClass) noexcept {
    switch (deviceClass) {
        case DeviceClass::Mobile: return "mobile";
        case DeviceClass::Tablet: return "tablet";
        case DeviceClass::Desktop: return "desktop";
    }
    return "desktop";
}

std::optional<DeviceStatus> parseDeviceStatus(std::string_view s) {
    if (s == "pending")
        return DeviceStatus::Pending;
    if (s == "approved")
        return DeviceStatus::Approved;
    if (s == "rejected")
        return DeviceStatus::Rejected;
    if (s == "expired")
        return DeviceStatus::Expired;
    return std::nullopt;
}

DeviceClass parseDeviceClass(std::string_view s) {
    if (s == "mobile")
        return DeviceClass::Mobile;
    if (s == "tablet")
        return DeviceClass::Tablet;
    return DeviceClass::Desktop;
}

Result<std::unique_ptr<DeviceStore>> DeviceStore::open(const std::string& path,
                                                       storage::ConnectionMode mode) {
    storage::Database db;
    if (auto r = db.open(path, mode); !r)
        return r.error();
    if (mode != storage::ConnectionMode::Memory) {
        if (auto r = db.enableWAL(); !r)
            spdlog::warn("[DeviceStore] WAL unavailable: {}", r.error().message);
    }
    auto store = std::make_unique<DeviceStore>(std::move(db));
    if (auto r = store->initializeSchema(); !r)
        return r.error();
    spdlog::info("[DeviceStore] using {}", path);
    return std::move(store);
}

DeviceStore::DeviceStore(storage::Database db) : db_(std::move(db)) {}

Result<void> DeviceStore::initializeSchema() {
    std::lock_guard<std::mutex> lk(mutex_);
    return db_.execute(kSchema);
}

Result<void> DeviceStore::insertPending(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stmtResult = db_.prepare(std::string("INSERT INTO devices (") + kColumns +
                                  ") VALUES (?, ?, ?, ?, ?, NULL, 'pending', ?, NULL, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(record.deviceId, record.deviceName, toString(record.deviceClass),
                              record.verificationCode, record.codeExpiresAt, record.createdAt,
                              record.expiresAt, record.clientIp, record.userAgent);
    if (!bound)
        return bound;
    return stmt.execute();
}

Result<std::optional<DeviceRecord>> DeviceStore::find(const std::string& deviceId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kColumns + " FROM devices WHERE device_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto b = stmt.bind(1, deviceId); !b)
        return b.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<DeviceRecord>{};
    return std::optional<DeviceRecord>{readRecord(stmt)};
}

Result<CodeCheck> DeviceStore::consumeCode(const std::string& deviceId, const std::string& code,
                                           TimePoint now) {
    std::lock_guard<std::mutex> lk(mutex_);
    CodeCheck outcome = CodeCheck::NotFound;
    auto txn = db_.transaction([&]() -> Result<void> {
        auto sel = db_.prepare("SELECT status, verification_code, code_expires_at, expires_at "
                               "FROM devices WHERE device_id = ?");
        if (!sel)
            return sel.error();
        auto stmt = std::move(sel).value();
        if (auto b = stmt.bind(1, deviceId); !b)
            return b;
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value()) {
            outcome = CodeCheck::NotFound;
            return {};
        }
        const auto status = parseDeviceStatus(stmt.getString(0));
        const auto stored = stmt.getOptionalString(1);
        const auto codeExpiry = stmt.getOptionalTime(2);
        const auto registrationExpiry = stmt.getTime(3);
        if (status != DeviceStatus::Pending) {
            outcome = CodeCheck::NotPending;
            return {};
        }

        if (registrationExpiry <= now)
            outcome = CodeCheck::RegistrationExpired;
        else if (!stored || *stored != code)
            outcome = CodeCheck::Mismatch;
        else if (!codeExpiry || *codeExpiry <= now)
            outcome = CodeCheck::CodeExpired;
        else
            outcome = CodeCheck::Accepted;

        auto clear = db_.prepare("UPDATE devices SET verification_code = NULL, "
                                 "code_expires_at = NULL WHERE device_id = ?");
        if (!clear)
            return clear.error();
        auto upd = std::move(clear).value();
        if (auto b = upd.bind(1, deviceId); !b)
            return b;
        return upd.execute();
    });
    if (!txn)
        return txn.error();
    return outcome;
}

Result<bool> DeviceStore::transition(const std::string& sql, const std::string& deviceId) {
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto b = stmt.bind(1, deviceId); !b)
        return b.error();
    if (auto e = stmt.execute(); !e)
        return e.error();
    return db_.changes() > 0;
}

Result<bool> DeviceStore::approve(const std::string& deviceId, const std::string& token,
                                  TimePoint tokenExpiresAt) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stmtResult = db_.prepare("UPDATE devices SET status = 'approved', auth_token = ?, "
                                  "expires_at = ?, verification_code = NULL, "
                                  "code_expires_at = NULL "
                                  "WHERE device_id = ? AND status = 'pending'");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(token, tokenExpiresAt, deviceId); !b)
        return b.error();
    if (auto e = stmt.execute(); !e)
        return e.error();
    return db_.changes() > 0;
}

Result<bool> DeviceStore::reject(const std::string& deviceId) {
    std::lock_guard<std::mutex> lk(mutex_);
    return transition("UPDATE devices SET status = 'rejected', verification_code = NULL, "
                      "code_expires_at = NULL WHERE device_id = ? AND status = 'pending'",
                      deviceId);
}

Result<bool> DeviceStore::markExpired(const std::string& deviceId) {
    std::lock_guard<std::mutex> lk(mutex_);
    return transition("UPDATE devices SET status = 'expired', verification_code = NULL, "
                      "code_expires_at = NULL WHERE device_id = ? AND status = 'pending'",
                      deviceId);
}

Result<bool> DeviceStore::revoke(const std::string& deviceId) {
    std::lock_guard<std::mutex> lk(mutex_);
    return transition("UPDATE devices SET status = 'rejected', auth_token = NULL, "
                      "verification_code = NULL, code_expires_at = NULL WHERE device_id = ?",
                      deviceId);
}

Result<std::optional<DeviceRecord>> DeviceStore::findByToken(const std::string& token,
                                                             TimePoint now) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stmtResult = db_.prepare(std::string("SELECT ") + kColumns +
                                  " FROM devices WHERE auth_token = ? AND status = 'approved' "
                                  "AND expires_at > ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(token, now); !b)
        return b.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<DeviceRecord>{};
    return std::optional<DeviceRecord>{readRecord(stmt)};
}

Result<bool> DeviceStore::touch(const std::string& deviceId, const std::string& token,
                                TimePoint now) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stmtResult = db_.prepare("UPDATE devices SET last_active_at = ? WHERE device_id = ? "
                                  "AND auth_token = ? AND status = 'approved'");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(now, deviceId, token); !b)
        return b.error();
    if (auto e = stmt.execute(); !e)
        return e.error();
    return db_.changes() > 0;
}

Result<std::vector<DeviceRecord>> DeviceStore::list() {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stmtResult = db_.prepare(std::string("SELECT ") + kColumns +
                                  " FROM devices ORDER BY created_at DESC, device_id");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    std::vector<DeviceRecord> out;
    for (;;) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        out.push_back(readRecord(stmt));
    }
    return out;
}

Result<int> DeviceStore::purgeExpired(TimePoint now) {
    std::lock_guard<std::mutex> lk(mutex_);
    int affected = 0;
    auto txn = db_.transaction([&]() -> Result<void> {
        auto del = db_.prepare("DELETE FROM devices WHERE status = 'pending' AND expires_at <= ?");
        if (!del)
            return del.error();
        auto stmt = std::move(del).value();
        if (auto b = stmt.bind(1, now); !b)
            return b;
        if (auto e = stmt.execute(); !e)
            return e;
        affected += db_.changes();

        auto exp = db_.prepare("UPDATE devices SET status = 'expired', auth_token = NULL "
                               "WHERE status = 'approved' AND expires_at <= ?");
        if (!exp)
            return exp.error();
        auto upd = std::move(exp).value();
        if (auto b = upd.bind(1, now); !b)
            return b;
        if (auto e = upd.execute(); !e)
            return e;
        affected += db_.changes();
        return {};
    });
    if (!txn)
        return txn.error();
    if (affected > 0)
        spdlog::info("[DeviceStore] purged/expired {} device record(s)", affected);
    return affected;
}

} // namespace conduit::auth
