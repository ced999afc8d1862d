#include <conduit/auth/device_authorizer.h>
#include <conduit/auth/device_store.h>
#include <conduit/auth/token_signer.h>
#include <conduit/config/server_config.h>
#include <conduit/exec/cancellation_registry.h>
#include <conduit/exec/request_lifecycle.h>
#include <conduit/http/http_server.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <functional>
#include <iostream>
#include <vector>

// Fatal signal/backtrace support
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <execinfo.h>

namespace {

void log_fatal(const char* what) {
    spdlog::critical("FATAL: {}", what);
    spdlog::critical("Aborting after fatal error");
    if (auto logger = spdlog::default_logger())
        logger->flush();
}

void signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                         : (signo == SIGBUS)  ? "SIGBUS"
                                              : "UNKNOWN";
    log_fatal(sigstr);
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        }
        free(syms);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::_Exit(128 + signo);
}

void setup_fatal_handlers() {
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
    std::signal(SIGBUS, signal_handler);
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

void setup_logging(const conduit::config::ServerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string rotationNote;
    if (!config.logFile.empty()) {
        std::filesystem::path logPath(config.logFile);
        std::error_code ec;
        if (logPath.has_parent_path())
            std::filesystem::create_directories(logPath.parent_path(), ec);
        const size_t max_size = 10 * 1024 * 1024; // 10MB per file
        const size_t max_files = 3;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), max_size, max_files));
            rotationNote = fmt::format("{} (max {}MB x {} files)", logPath.string(),
                                       max_size / (1024 * 1024), max_files);
        } catch (const spdlog::spdlog_ex& e) {
            std::fprintf(stderr, "conduit: cannot open log file %s: %s\n",
                         logPath.string().c_str(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("conduit", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.logLevel));
    spdlog::flush_on(spdlog::level::info);
    if (!rotationNote.empty())
        spdlog::info("Log rotation enabled: {}", rotationNote);
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"Conduit - remote assistant and terminal streaming server"};

    conduit::config::ConfigOverrides overrides;
    std::string configPath;
    std::string host;
    unsigned port = 0;
    bool debug = false;
    std::string logLevel;
    std::string logFile;
    std::string dataDir;

    auto* configOpt = app.add_option("--config", configPath, "Configuration file path");
    auto* hostOpt = app.add_option("--host", host, "Bind address");
    auto* portOpt = app.add_option("-p,--port", port, "Listen port")->check(CLI::Range(1, 65535));
    app.add_flag("-d,--debug", debug, "Debug logging and raw assistant message dumps");
    auto* levelOpt =
        app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
            ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    auto* logFileOpt = app.add_option("--log-file", logFile, "Rotating log file path");
    auto* dataDirOpt = app.add_option("--data-dir", dataDir, "Directory for devices.db");

    CLI11_PARSE(app, argc, argv);

    if (configOpt->count() > 0)
        overrides.configPath = configPath;
    if (hostOpt->count() > 0)
        overrides.host = host;
    if (portOpt->count() > 0)
        overrides.port = static_cast<std::uint16_t>(port);
    if (debug)
        overrides.debug = true;
    if (levelOpt->count() > 0)
        overrides.logLevel = logLevel;
    if (logFileOpt->count() > 0)
        overrides.logFile = logFile;
    if (dataDirOpt->count() > 0)
        overrides.dataDir = dataDir;

    auto resolved = conduit::config::resolveServerConfig(overrides);
    if (!resolved) {
        std::cerr << "conduit: " << resolved.error().message << std::endl;
        return 2;
    }
    auto config = std::move(resolved).value();
    setup_logging(config);
    spdlog::info("Configuration: {}", config.configPath.empty() ? std::string("(defaults)")
                                                                : config.configPath.string());

    if (config.jwtSecret.empty()) {
        auto secret = conduit::auth::generateSecret(32);
        if (!secret) {
            spdlog::error("Failed to generate token secret: {}", secret.error().message);
            return 1;
        }
        config.jwtSecret = secret.value();
        spdlog::warn("No JWT secret configured; generated a random one. Issued tokens will "
                     "not survive a restart (set CONDUIT_JWT_SECRET or auth.jwt_secret)");
    }

    std::error_code ec;
    std::filesystem::create_directories(config.dataDir, ec);
    if (ec) {
        spdlog::error("Cannot create data directory {}: {}", config.dataDir.string(),
                      ec.message());
        return 1;
    }

    auto store = conduit::auth::DeviceStore::open(config.databasePath().string());
    if (!store) {
        spdlog::error("Failed to open device database {}: {}", config.databasePath().string(),
                      store.error().message);
        return 1;
    }
    spdlog::info("Device database: {}", config.databasePath().string());

    try {
        // Outlives the io_context: coroutine frames destroyed with it release their entries.
        conduit::exec::CancellationRegistry registry;
        conduit::exec::RequestLifecycleManager lifecycle(registry);
        boost::asio::io_context ioc{1};

        conduit::auth::DeviceAuthorizer authorizer(ioc.get_executor(), *store.value(),
                                                   conduit::auth::TokenSigner(config.jwtSecret),
                                                   config.auth);
        conduit::http::HttpServer server(ioc, config, authorizer, lifecycle);

        if (auto started = server.start(); !started) {
            spdlog::error("Failed to start server: {}", started.error().message);
            return 1;
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        boost::asio::steady_timer drain(ioc);
        const auto drainDeadline = std::chrono::seconds(5);
        auto drainStarted = std::chrono::steady_clock::now();
        bool stopping = false;

        // Wait for in-flight requests to reach their terminal event, then release the
        // signal wait so ioc.run() can return.
        std::function<void(const boost::system::error_code&)> onDrainTick;
        onDrainTick = [&](const boost::system::error_code& tickEc) {
            if (tickEc)
                return;
            if (registry.size() == 0) {
                signals.cancel();
                return;
            }
            if (std::chrono::steady_clock::now() - drainStarted > drainDeadline) {
                spdlog::warn("{} request(s) still running after {}s; forcing stop",
                             registry.size(), drainDeadline.count());
                ioc.stop();
                return;
            }
            drain.expires_after(std::chrono::milliseconds(100));
            drain.async_wait(onDrainTick);
        };

        std::function<void(const boost::system::error_code&, int)> onSignal;
        onSignal = [&](const boost::system::error_code& sigEc, int signo) {
            if (sigEc)
                return;
            if (stopping) {
                spdlog::warn("Second signal ({}); stopping immediately", signo);
                ioc.stop();
                return;
            }
            stopping = true;
            spdlog::info("Received signal {}; shutting down", signo);
            server.stop();
            authorizer.shutdown();
            for (const auto& id : registry.activeIds())
                lifecycle.cancel(id);
            signals.async_wait(onSignal);
            drainStarted = std::chrono::steady_clock::now();
            onDrainTick({});
        };
        signals.async_wait(onSignal);

        ioc.run();
        spdlog::info("Server stopped");
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
}
