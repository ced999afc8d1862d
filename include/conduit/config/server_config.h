#pragma once

#include <conduit/auth/device_authorizer.h>
#include <conduit/core/types.h>
#include <conduit/exec/path_resolver.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace conduit::config {

struct RateLimitSettings {
    std::size_t writeMax{10};
    std::chrono::seconds writeWindow{60};
    std::size_t readMax{20};
    std::chrono::seconds readWindow{60};
};

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    bool debug{false};
    std::string logLevel{"info"};
    std::string logFile;
    std::filesystem::path dataDir;
    std::filesystem::path configPath;

    /// Peers whose X-Forwarded-For / X-Real-IP headers name the real client.
    std::vector<std::string> trustedProxies;

    std::string jwtSecret;
    bool allowLocalhost{true};
    auth::AuthorizerOptions auth;
    RateLimitSettings rateLimit;

    std::string assistantExecutable;
    exec::CompatLayerMode compatLayer{exec::CompatLayerMode::Auto};
    std::chrono::milliseconds terminationGrace{2000};

    std::filesystem::path databasePath() const { return dataDir / "devices.db"; }
};

/// Values given on the command line; unset fields defer to lower layers.
struct ConfigOverrides {
    std::optional<std::string> configPath;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<bool> debug;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<std::string> dataDir;
};

/// Apply flattened TOML keys ("server.port", "auth.jwt_secret", ...). Unknown keys are ignored.
Result<void> applyConfigValues(ServerConfig& config, const std::map<std::string, std::string>& kv);

/// Apply CONDUIT_* (and JWT_SECRET) environment variables.
Result<void> applyEnvironment(ServerConfig& config);

void applyOverrides(ServerConfig& config, const ConfigOverrides& overrides);

/**
 * @brief Build the effective configuration: defaults < TOML file < environment < CLI.
 *
 * The config file is --config, else CONDUIT_CONFIG_PATH, else the XDG location; a missing
 * file is not an error. A malformed value yields ErrorCode::ConfigurationFailure.
 */
Result<ServerConfig> resolveServerConfig(const ConfigOverrides& overrides);

} // namespace conduit::config
