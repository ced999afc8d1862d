#include <conduit/config/config_resolver.h>
#include <conduit/config/server_config.h>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <limits>

namespace conduit::config {

namespace {

Error invalidValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::ConfigurationFailure,
                 "Invalid value for " + key + ": '" + value + "'"};
}

template <typename T>
Result<T> parseNumber(const std::string& key, const std::string& value, T minValue = 0,
                      T maxValue = std::numeric_limits<T>::max()) {
    T out{};
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || out < minValue || out > maxValue)
        return invalidValue(key, value);
    return out;
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return invalidValue(key, value);
}

bool validLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // namespace

Result<void> applyConfigValues(ServerConfig& config,
                               const std::map<std::string, std::string>& kv) {
    using Setter = std::function<Result<void>(const std::string&, const std::string&)>;

    auto seconds = [](std::chrono::seconds& field) -> Setter {
        return [&field](const std::string& k, const std::string& v) -> Result<void> {
            auto n = parseNumber<long long>(k, v, 1);
            if (!n)
                return n.error();
            field = std::chrono::seconds{n.value()};
            return {};
        };
    };
    auto count = [](std::size_t& field) -> Setter {
        return [&field](const std::string& k, const std::string& v) -> Result<void> {
            auto n = parseNumber<std::size_t>(k, v, 1);
            if (!n)
                return n.error();
            field = n.value();
            return {};
        };
    };
    auto text = [](std::string& field) -> Setter {
        return [&field](const std::string&, const std::string& v) -> Result<void> {
            field = v;
            return {};
        };
    };
    auto flag = [](bool& field) -> Setter {
        return [&field](const std::string& k, const std::string& v) -> Result<void> {
            auto b = parseBool(k, v);
            if (!b)
                return b.error();
            field = b.value();
            return {};
        };
    };

    const std::map<std::string, Setter> setters = {
        {"server.host", text(config.host)},
        {"server.port",
         [&config](const std::string& k, const std::string& v) -> Result<void> {
             auto n = parseNumber<unsigned>(k, v, 1, 65535);
             if (!n)
                 return n.error();
             config.port = static_cast<std::uint16_t>(n.value());
             return {};
         }},
        {"server.debug", flag(config.debug)},
        {"server.log_level",
         [&config](const std::string& k, const std::string& v) -> Result<void> {
             if (!validLogLevel(v))
                 return invalidValue(k, v);
             config.logLevel = v;
             return {};
         }},
        {"server.log_file", text(config.logFile)},
        {"server.data_dir",
         [&config](const std::string&, const std::string& v) -> Result<void> {
             config.dataDir = exec::expandHome(v, exec::homeDirectory());
             return {};
         }},
        {"server.trusted_proxies",
         [&config](const std::string&, const std::string& v) -> Result<void> {
             std::vector<std::string> proxies;
             boost::algorithm::split(proxies, v, boost::algorithm::is_any_of(","));
             config.trustedProxies.clear();
             for (auto& p : proxies) {
                 boost::algorithm::trim(p);
                 if (!p.empty())
                     config.trustedProxies.push_back(p);
             }
             return {};
         }},
        {"auth.jwt_secret", text(config.jwtSecret)},
        {"auth.allow_localhost", flag(config.allowLocalhost)},
        {"auth.verify_timeout_seconds",
         [&config](const std::string& k, const std::string& v) -> Result<void> {
             auto n = parseNumber<long long>(k, v, 1);
             if (!n)
                 return n.error();
             config.auth.verifyTimeout = std::chrono::seconds{n.value()};
             return {};
         }},
        {"auth.code_ttl_seconds", seconds(config.auth.codeTtl)},
        {"auth.registration_ttl_seconds", seconds(config.auth.registrationTtl)},
        {"auth.token_ttl_days",
         [&config](const std::string& k, const std::string& v) -> Result<void> {
             auto n = parseNumber<long long>(k, v, 1, 3650);
             if (!n)
                 return n.error();
             config.auth.tokenTtl = std::chrono::hours{24 * n.value()};
             return {};
         }},
        {"rate_limit.write_max", count(config.rateLimit.writeMax)},
        {"rate_limit.write_window_seconds", seconds(config.rateLimit.writeWindow)},
        {"rate_limit.read_max", count(config.rateLimit.readMax)},
        {"rate_limit.read_window_seconds", seconds(config.rateLimit.readWindow)},
        {"assistant.executable", text(config.assistantExecutable)},
        {"exec.compat_layer",
         [&config](const std::string&, const std::string& v) -> Result<void> {
             config.compatLayer = exec::parseCompatLayerMode(v);
             return {};
         }},
        {"exec.termination_grace_ms",
         [&config](const std::string& k, const std::string& v) -> Result<void> {
             auto n = parseNumber<long long>(k, v, 0);
             if (!n)
                 return n.error();
             config.terminationGrace = std::chrono::milliseconds{n.value()};
             return {};
         }},
    };

    for (const auto& [key, value] : kv) {
        auto it = setters.find(key);
        if (it == setters.end()) {
            spdlog::debug("[Config] ignoring unknown key '{}'", key);
            continue;
        }
        if (auto r = it->second(key, value); !r)
            return r;
    }
    return {};
}

Result<void> applyEnvironment(ServerConfig& config) {
    std::map<std::string, std::string> kv;
    if (auto v = ConfigResolver::envValue("CONDUIT_HOST"))
        kv["server.host"] = *v;
    if (auto v = ConfigResolver::envValue("CONDUIT_PORT"))
        kv["server.port"] = *v;
    if (auto v = ConfigResolver::envValue("CONDUIT_DATA_DIR"))
        kv["server.data_dir"] = *v;
    if (auto v = ConfigResolver::envValue("CONDUIT_TRUSTED_PROXIES"))
        kv["server.trusted_proxies"] = *v;
    if (auto v = ConfigResolver::envValue("JWT_SECRET"))
        kv["auth.jwt_secret"] = *v;
    if (auto v = ConfigResolver::envValue("CONDUIT_JWT_SECRET"))
        kv["auth.jwt_secret"] = *v;
    if (auto v = ConfigResolver::envValue("CONDUIT_ASSISTANT_PATH"))
        kv["assistant.executable"] = *v;
    if (auto r = applyConfigValues(config, kv); !r)
        return r;

    if (auto v = ConfigResolver::envValue("CONDUIT_DEBUG"))
        config.debug = ConfigResolver::envTruthy(v->c_str());
    return {};
}

void applyOverrides(ServerConfig& config, const ConfigOverrides& overrides) {
    if (overrides.host)
        config.host = *overrides.host;
    if (overrides.port)
        config.port = *overrides.port;
    if (overrides.debug)
        config.debug = *overrides.debug;
    if (overrides.logLevel)
        config.logLevel = *overrides.logLevel;
    if (overrides.logFile)
        config.logFile = *overrides.logFile;
    if (overrides.dataDir)
        config.dataDir = exec::expandHome(*overrides.dataDir, exec::homeDirectory());
}

Result<ServerConfig> resolveServerConfig(const ConfigOverrides& overrides) {
    ServerConfig config;
    config.dataDir = ConfigResolver::resolveDefaultDataDir();
    config.configPath = overrides.configPath
                            ? std::filesystem::path(*overrides.configPath)
                            : ConfigResolver::resolveDefaultConfigPath();

    if (!config.configPath.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(config.configPath, ec)) {
            auto kv = ConfigResolver::parseSimpleTomlFlat(config.configPath);
            if (auto r = applyConfigValues(config, kv); !r)
                return r.error();
        } else if (overrides.configPath) {
            return Error{ErrorCode::ConfigurationFailure,
                         "Config file not found: " + config.configPath.string()};
        }
    }

    if (auto r = applyEnvironment(config); !r)
        return r.error();
    applyOverrides(config, overrides);

    if (config.debug && config.logLevel == "info")
        config.logLevel = "debug";
    if (!validLogLevel(config.logLevel))
        return invalidValue("log level", config.logLevel);
    return config;
}

} // namespace conduit::config
