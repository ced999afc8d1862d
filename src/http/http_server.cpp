#include <conduit/core/uuid.h>
#include <conduit/exec/path_resolver.h>
#include <conduit/http/auth_gate.h>
#include <conduit/http/http_server.h>
#include <conduit/stream/ndjson_writer.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>

using nlohmann::json;

namespace conduit::http {

namespace {

constexpr std::size_t kBodyLimit = 1024 * 1024;
constexpr auto kMaintenanceInterval = std::chrono::seconds(60);

std::string_view toStd(beast::string_view s) {
    return std::string_view(s.data(), s.size());
}

std::string header(const Request& req, beast::string_view name) {
    auto v = req[name];
    return std::string(v.data(), v.size());
}

std::string header(const Request& req, bhttp::field name) {
    auto v = req[name];
    return std::string(v.data(), v.size());
}

void setCors(Response& res) {
    res.set(bhttp::field::access_control_allow_origin, "*");
    res.set(bhttp::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
    res.set(bhttp::field::access_control_allow_headers, "Content-Type, Authorization");
}

Response errorResponse(unsigned status, const std::string& message, unsigned version) {
    return jsonResponse(status, json{{"error", message}}, version);
}

Response errorResponse(const Error& error, unsigned version) {
    return errorResponse(httpStatusFor(error.code), error.message, version);
}

std::optional<json> parseBody(const Request& req) {
    auto body = json::parse(req.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object())
        return std::nullopt;
    return body;
}

std::optional<std::string> stringField(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::string> nonEmptyField(const json& body, const char* key) {
    auto v = stringField(body, key);
    if (!v || v->empty())
        return std::nullopt;
    return v;
}

json timeOrNull(const std::optional<TimePoint>& tp) {
    if (!tp)
        return nullptr;
    return core::toIso8601(*tp);
}

/// Remainder of @p path after @p prefix, when non-empty and free of further slashes.
std::optional<std::string> pathParam(const std::string& path, std::string_view prefix) {
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;
    std::string rest = path.substr(prefix.size());
    if (rest.find('/') != std::string::npos)
        return std::nullopt;
    return rest;
}

boost::asio::awaitable<void> writeResponse(tcp::socket& socket, Response res) {
    boost::system::error_code ec;
    co_await bhttp::async_write(socket, res,
                                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        spdlog::debug("[HTTP] response write failed: {}", ec.message());
}

void logSpawnFailure(const char* what, std::exception_ptr e) {
    if (!e)
        return;
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        spdlog::error("[HTTP] {} terminated: {}", what, ex.what());
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

Response jsonResponse(unsigned status, const json& body, unsigned version) {
    Response res{static_cast<bhttp::status>(status), version};
    res.set(bhttp::field::server, "conduit");
    res.set(bhttp::field::content_type, "application/json");
    setCors(res);
    res.keep_alive(false);
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

std::string requestPath(std::string_view target) {
    auto path = target.substr(0, target.find('?'));
    std::string out;
    out.reserve(path.size());
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '%' && i + 2 < path.size()) {
            int hi = hexValue(path[i + 1]);
            int lo = hexValue(path[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(path[i]);
    }
    return out;
}

HttpServer::HttpServer(boost::asio::io_context& ioc, const config::ServerConfig& config,
                       auth::DeviceAuthorizer& authorizer,
                       exec::RequestLifecycleManager& lifecycle)
    : ioc_(ioc), config_(config), authorizer_(authorizer), lifecycle_(lifecycle),
      writeLimiter_(config.rateLimit.writeMax, config.rateLimit.writeWindow),
      readLimiter_(config.rateLimit.readMax, config.rateLimit.readWindow), acceptor_(ioc),
      maintenance_(ioc), compatLayer_(exec::detectCompatLayer(config.compatLayer)),
      assistantExecutable_(exec::locateExecutable(config.assistantExecutable)) {}

Result<void> HttpServer::start() {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.host, ec);
    if (ec)
        return Error{ErrorCode::ConfigurationFailure,
                     "Invalid bind address '" + config_.host + "': " + ec.message()};
    const tcp::endpoint ep{address, config_.port};

    acceptor_.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "set reuse_address failed: " + ec.message()};
    acceptor_.bind(ep, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "bind " + config_.host + ":" +
                                                  std::to_string(config_.port) +
                                                  " failed: " + ec.message()};
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};

    running_ = true;
    boost::asio::co_spawn(ioc_, acceptLoop(),
                          [](std::exception_ptr e) { logSpawnFailure("accept loop", e); });
    boost::asio::co_spawn(ioc_, maintenanceLoop(),
                          [](std::exception_ptr e) { logSpawnFailure("maintenance", e); });

    spdlog::info("[HTTP] listening on {}:{} (compat layer: {}, assistant: {})", config_.host,
                 localPort(), compatLayer_ ? "yes" : "no", assistantExecutable_);
    return {};
}

void HttpServer::stop() {
    if (!running_)
        return;
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
    maintenance_.cancel();
    spdlog::info("[HTTP] stopped accepting connections");
}

std::uint16_t HttpServer::localPort() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

boost::asio::awaitable<void> HttpServer::acceptLoop() {
    while (running_) {
        tcp::socket socket{ioc_};
        boost::system::error_code ec;
        co_await acceptor_.async_accept(socket,
                                        boost::asio::redirect_error(boost::asio::use_awaitable,
                                                                    ec));
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !running_)
                break;
            spdlog::warn("[HTTP] accept error: {}", ec.message());
            continue;
        }
        boost::asio::co_spawn(ioc_, session(std::move(socket)),
                              [](std::exception_ptr e) { logSpawnFailure("session", e); });
    }
}

boost::asio::awaitable<void> HttpServer::maintenanceLoop() {
    while (running_) {
        boost::system::error_code ec;
        maintenance_.expires_after(kMaintenanceInterval);
        co_await maintenance_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || !running_)
            break;
        runMaintenance();
    }
}

void HttpServer::runMaintenance() {
    auto now = std::chrono::steady_clock::now();
    auto sweptWrite = writeLimiter_.sweep(now);
    auto sweptRead = readLimiter_.sweep(now);
    if (sweptWrite + sweptRead > 0)
        spdlog::debug("[HTTP] rate-limit sweep dropped {} windows", sweptWrite + sweptRead);

    auto purged = authorizer_.purgeExpired(std::chrono::system_clock::now());
    if (!purged) {
        spdlog::warn("[HTTP] registration purge failed: {}", purged.error().message);
    } else if (purged.value() > 0) {
        spdlog::info("[HTTP] purged {} expired device registrations", purged.value());
    }
}

exec::AdapterOptions HttpServer::adapterOptions() const {
    exec::AdapterOptions options;
    options.compatLayer = compatLayer_;
    options.terminationGrace = config_.terminationGrace;
    options.debug = config_.debug;
    return options;
}

boost::asio::awaitable<void> HttpServer::session(tcp::socket socket) {
    beast::flat_buffer buffer;
    boost::system::error_code ec;
    bhttp::request_parser<bhttp::string_body> parser;
    parser.body_limit(kBodyLimit);
    co_await bhttp::async_read(socket, buffer, parser,
                               boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[HTTP] read error: {}", ec.message());
        co_return;
    }
    Request req = parser.release();

    std::string peer;
    if (auto ep = socket.remote_endpoint(ec); !ec)
        peer = ep.address().to_string();
    const std::string key = auth::clientKey(header(req, "X-Forwarded-For"),
                                            header(req, "X-Real-IP"), peer,
                                            config_.trustedProxies);
    const std::string path = requestPath(toStd(req.target()));
    spdlog::debug("[HTTP] {} {} from {}", std::string(toStd(req.method_string())), path, key);

    if (req.method() == bhttp::verb::options) {
        Response res{bhttp::status::no_content, req.version()};
        setCors(res);
        res.set(bhttp::field::access_control_max_age, "86400");
        res.keep_alive(false);
        res.prepare_payload();
        co_await writeResponse(socket, std::move(res));
    } else {
        const std::string authorization = header(req, bhttp::field::authorization);
        auto gate = evaluateGate(GateRequest{path, key, authorization},
                                 config_.allowLocalhost, [this](const std::string& token) {
                                     return authorizer_.validateToken(token);
                                 });

        if (!gate.allowed()) {
            const char* message = gate.verdict == GateVerdict::InvalidToken
                                      ? "Invalid or expired token"
                                      : "Unauthorized";
            co_await writeResponse(socket, errorResponse(401, message, req.version()));
        } else if (req.method() == bhttp::verb::post &&
                   (path == "/api/chat" || path == "/api/terminal/execute")) {
            if (auto limited = checkRateLimit(writeLimiter_, req, key)) {
                co_await writeResponse(socket, std::move(*limited));
            } else if (path == "/api/chat") {
                co_await handleChat(socket, req);
            } else {
                co_await handleExecute(socket, req);
            }
        } else {
            auto res = co_await dispatch(req, key);
            co_await writeResponse(socket, std::move(res));
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

boost::asio::awaitable<Response> HttpServer::dispatch(const Request& req,
                                                      const std::string& clientKey) {
    const std::string path = requestPath(toStd(req.target()));
    const auto method = req.method();
    const unsigned version = req.version();

    try {
        if (method == bhttp::verb::get && path == "/api/terminal/shells")
            co_return handleShells(req);
        if (method == bhttp::verb::get && path == "/api/terminal/info")
            co_return handleSystemInfo(req);
        if (method == bhttp::verb::post && path == "/api/terminal/validate-path")
            co_return handleValidatePath(req);
        if (method == bhttp::verb::post) {
            if (auto id = pathParam(path, "/api/abort/"))
                co_return handleCancel(req, *id);
            if (auto id = pathParam(path, "/api/terminal/abort/"))
                co_return handleCancel(req, *id);
        }

        if (method == bhttp::verb::post && path == "/api/auth/register") {
            if (auto limited = checkRateLimit(writeLimiter_, req, clientKey))
                co_return std::move(*limited);
            co_return handleRegister(req, clientKey);
        }
        if (method == bhttp::verb::post && path == "/api/auth/verify") {
            if (auto limited = checkRateLimit(writeLimiter_, req, clientKey))
                co_return std::move(*limited);
            co_return co_await handleVerify(req);
        }
        if (method == bhttp::verb::post && path == "/api/auth/authorize") {
            if (auto limited = checkRateLimit(writeLimiter_, req, clientKey))
                co_return std::move(*limited);
            co_return handleAuthorize(req);
        }
        if (method == bhttp::verb::get && path == "/api/auth/devices") {
            if (auto limited = checkRateLimit(readLimiter_, req, clientKey))
                co_return std::move(*limited);
            co_return handleListDevices(req);
        }
        if (method == bhttp::verb::delete_) {
            if (auto id = pathParam(path, "/api/auth/devices/")) {
                if (auto limited = checkRateLimit(writeLimiter_, req, clientKey))
                    co_return std::move(*limited);
                co_return handleRevoke(req, *id);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[HTTP] {} {} failed: {}", std::string(toStd(req.method_string())), path,
                      e.what());
        co_return errorResponse(500, "Internal server error", version);
    }

    co_return errorResponse(404, "Not found", version);
}

std::optional<Response> HttpServer::checkRateLimit(auth::FixedWindowRateLimiter& limiter,
                                                   const Request& req,
                                                   const std::string& clientKey) {
    auto decision = limiter.allow(clientKey);
    if (decision.allowed)
        return std::nullopt;
    spdlog::warn("[HTTP] rate limit hit by {} on {}", clientKey,
                 std::string(toStd(req.target())));
    auto res = errorResponse(429, "Too many requests", req.version());
    res.set(bhttp::field::retry_after, std::to_string(decision.retryAfter.count()));
    return res;
}

boost::asio::awaitable<void> HttpServer::handleChat(tcp::socket& socket, const Request& req) {
    auto body = parseBody(req);
    if (!body) {
        co_await writeResponse(socket, errorResponse(400, "Invalid JSON body", req.version()));
        co_return;
    }
    auto message = nonEmptyField(*body, "message");
    auto requestId = nonEmptyField(*body, "requestId");
    if (!message || !requestId) {
        co_await writeResponse(
            socket, errorResponse(400, "message and requestId are required", req.version()));
        co_return;
    }

    exec::AssistantRequest request;
    request.prompt = *message;
    request.sessionId = nonEmptyField(*body, "sessionId");
    request.workingDirectory = nonEmptyField(*body, "workingDirectory");
    if (auto tools = body->find("allowedTools"); tools != body->end() && tools->is_array()) {
        for (const auto& t : *tools) {
            if (t.is_string())
                request.allowedTools.push_back(t.get<std::string>());
        }
    }
    if (auto thinking = body->find("thinking"); thinking != body->end() && thinking->is_object()) {
        auto budget = thinking->find("budget_tokens");
        if (thinking->value("type", std::string{}) == "enabled" && budget != thinking->end() &&
            budget->is_number_integer() && budget->get<int>() > 0) {
            request.thinkingBudget = budget->get<int>();
        }
    }

    auto adapter = std::make_unique<exec::AssistantQueryAdapter>(
        std::move(request), assistantExecutable_, adapterOptions());
    co_await runStream(socket, req, *requestId, std::move(adapter));
}

boost::asio::awaitable<void> HttpServer::handleExecute(tcp::socket& socket, const Request& req) {
    auto body = parseBody(req);
    if (!body) {
        co_await writeResponse(socket, errorResponse(400, "Invalid JSON body", req.version()));
        co_return;
    }
    auto command = nonEmptyField(*body, "command");
    auto requestId = nonEmptyField(*body, "requestId");
    if (!command || !requestId) {
        co_await writeResponse(
            socket, errorResponse(400, "command and requestId are required", req.version()));
        co_return;
    }

    exec::ShellRequest request;
    request.command = *command;
    if (auto shell = nonEmptyField(*body, "shell"))
        request.shell = *shell;
    request.workingDirectory = nonEmptyField(*body, "workingDirectory");

    auto adapter =
        std::make_unique<exec::ShellCommandAdapter>(std::move(request), adapterOptions());
    co_await runStream(socket, req, *requestId, std::move(adapter));
}

boost::asio::awaitable<void>
HttpServer::runStream(tcp::socket& socket, const Request& req, const std::string& requestId,
                      std::unique_ptr<exec::ProcessAdapter> adapter) {
    auto handle = lifecycle_.begin(requestId);
    if (!handle) {
        co_await writeResponse(socket, errorResponse(handle.error(), req.version()));
        co_return;
    }

    spdlog::info("[HTTP] {} stream '{}' started", adapter->kind(), requestId);
    stream::NdjsonStreamWriter<tcp::socket> writer(socket);
    boost::asio::co_spawn(socket.get_executor(), writer.run(),
                          [](std::exception_ptr e) { logSpawnFailure("stream writer", e); });

    auto state = co_await lifecycle_.run(std::move(handle).value(), *adapter, writer);
    co_await writer.waitFinished();
    spdlog::debug("[HTTP] stream '{}' closed ({}, {} records{})", requestId,
                  exec::toString(state), writer.recordsWritten(),
                  writer.disconnected() ? ", client gone" : "");
}

Response HttpServer::handleCancel(const Request& req, const std::string& requestId) {
    if (!lifecycle_.cancel(requestId))
        return errorResponse(404, "Request not found or already completed", req.version());
    spdlog::info("[HTTP] cancellation requested for '{}'", requestId);
    return jsonResponse(200, json{{"success", true}, {"message", "Request aborted successfully"}},
                        req.version());
}

Response HttpServer::handleShells(const Request& req) {
    auto info = exec::querySystemInfo(compatLayer_);
    return jsonResponse(200,
                        json{{"shells", exec::supportedShells()},
                             {"platform", info.platform},
                             {"default", exec::defaultShell()}},
                        req.version());
}

Response HttpServer::handleSystemInfo(const Request& req) {
    auto info = exec::querySystemInfo(compatLayer_);
    return jsonResponse(200,
                        json{{"username", info.username},
                             {"hostname", info.hostname},
                             {"platform", info.platform},
                             {"homeDirectory", info.homeDirectory},
                             {"currentWorkingDirectory", info.currentWorkingDirectory},
                             {"isWSL", info.isCompatLayer}},
                        req.version());
}

Response HttpServer::handleValidatePath(const Request& req) {
    auto body = parseBody(req);
    std::optional<std::string> path;
    if (body)
        path = nonEmptyField(*body, "path");
    if (!path) {
        return jsonResponse(400, json{{"isValid", false}, {"message", "Path is required"}},
                            req.version());
    }
    auto result = exec::validateDirectory(*path);
    return jsonResponse(200, json{{"isValid", result.isValid}, {"message", result.message}},
                        req.version());
}

Response HttpServer::handleRegister(const Request& req, const std::string& clientKey) {
    auto body = parseBody(req);
    if (!body)
        return errorResponse(400, "Invalid JSON body", req.version());
    auto name = nonEmptyField(*body, "deviceName");
    if (!name)
        return errorResponse(400, "deviceName is required", req.version());
    auto type = stringField(*body, "deviceType").value_or("desktop");
    auto userAgent = nonEmptyField(*body, "userAgent").value_or(header(req, bhttp::field::user_agent));

    auto registration = authorizer_.registerDevice(*name, auth::parseDeviceClass(type),
                                                   userAgent, clientKey);
    if (!registration)
        return errorResponse(registration.error(), req.version());

    const auto& r = registration.value();
    return jsonResponse(200,
                        json{{"deviceId", r.deviceId},
                             {"verificationCode", r.verificationCode},
                             {"status", "pending"},
                             {"expiresAt", core::toIso8601(r.expiresAt)}},
                        req.version());
}

boost::asio::awaitable<Response> HttpServer::handleVerify(const Request& req) {
    auto body = parseBody(req);
    if (!body)
        co_return errorResponse(400, "Invalid JSON body", req.version());
    auto deviceId = nonEmptyField(*body, "deviceId");
    auto code = nonEmptyField(*body, "verificationCode");
    if (!deviceId || !code)
        co_return errorResponse(400, "deviceId and verificationCode are required",
                                req.version());

    auto outcome = co_await authorizer_.verify(*deviceId, *code);
    if (!outcome)
        co_return errorResponse(outcome.error(), req.version());

    const auto& o = outcome.value();
    json res{{"deviceId", o.deviceId}, {"status", auth::toString(o.status)}};
    if (o.authToken)
        res["authToken"] = *o.authToken;
    if (o.expiresAt)
        res["expiresAt"] = core::toIso8601(*o.expiresAt);
    co_return jsonResponse(200, res, req.version());
}

Response HttpServer::handleAuthorize(const Request& req) {
    auto body = parseBody(req);
    if (!body)
        return errorResponse(400, "Invalid JSON body", req.version());
    auto deviceId = nonEmptyField(*body, "deviceId");
    auto action = nonEmptyField(*body, "action");
    if (!deviceId || !action || (*action != "approve" && *action != "reject"))
        return errorResponse(400, "deviceId and action (approve|reject) are required",
                             req.version());

    const auto decision =
        *action == "approve" ? auth::ApprovalDecision::Approve : auth::ApprovalDecision::Reject;
    bool resolved = authorizer_.authorize(*deviceId, decision);
    return jsonResponse(200, json{{"success", true}, {"resolved", resolved}}, req.version());
}

Response HttpServer::handleListDevices(const Request& req) {
    auto devices = authorizer_.listDevices();
    if (!devices)
        return errorResponse(devices.error(), req.version());

    json list = json::array();
    for (const auto& d : devices.value()) {
        const auto& r = d.record;
        list.push_back(json{{"id", r.deviceId},
                            {"name", r.deviceName},
                            {"type", auth::toString(r.deviceClass)},
                            {"status", auth::toString(r.status)},
                            {"lastActiveAt", timeOrNull(r.lastActiveAt)},
                            {"ipAddress", r.clientIp},
                            {"createdAt", core::toIso8601(r.createdAt)},
                            {"awaitingDecision", d.awaitingDecision}});
    }
    return jsonResponse(200, json{{"devices", list}}, req.version());
}

Response HttpServer::handleRevoke(const Request& req, const std::string& deviceId) {
    auto revoked = authorizer_.revoke(deviceId);
    if (!revoked)
        return errorResponse(revoked.error(), req.version());
    return jsonResponse(200, json{{"success", true}, {"message", "Device revoked"}},
                        req.version());
}

} // namespace conduit::http
