#pragma once

#include <conduit/auth/device_authorizer.h>
#include <conduit/auth/rate_limiter.h>
#include <conduit/config/server_config.h>
#include <conduit/exec/process_adapter.h>
#include <conduit/exec/request_lifecycle.h>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace conduit::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using Request = bhttp::request<bhttp::string_body>;
using Response = bhttp::response<bhttp::string_body>;

/// JSON response with the CORS headers every reply carries.
Response jsonResponse(unsigned status, const nlohmann::json& body, unsigned version = 11);

/// Path component of a request target (query string removed, percent-decoded).
std::string requestPath(std::string_view target);

/**
 * @brief HTTP/1.1 front end: streaming endpoints, cancellation and device pairing.
 *
 * One coroutine per connection on the server's io_context; each connection serves one
 * request and is closed afterwards. Streaming routes answer with an NDJSON body that ends
 * with exactly one terminal record. A maintenance timer sweeps rate-limit windows and
 * purges lapsed registrations.
 */
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const config::ServerConfig& config,
               auth::DeviceAuthorizer& authorizer, exec::RequestLifecycleManager& lifecycle);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start accepting. Port 0 picks an ephemeral port.
    Result<void> start();

    /// Stop accepting and cancel the maintenance timer. In-flight requests finish.
    void stop();

    std::uint16_t localPort() const;

    /**
     * Route a request that does not stream. Streaming routes and CORS preflight are
     * handled by the connection coroutine before this is reached.
     */
    boost::asio::awaitable<Response> dispatch(const Request& req, const std::string& clientKey);

    /// Runs once per maintenance tick; exposed for tests.
    void runMaintenance();

private:
    boost::asio::awaitable<void> acceptLoop();
    boost::asio::awaitable<void> maintenanceLoop();
    boost::asio::awaitable<void> session(tcp::socket socket);

    boost::asio::awaitable<void> handleChat(tcp::socket& socket, const Request& req);
    boost::asio::awaitable<void> handleExecute(tcp::socket& socket, const Request& req);
    boost::asio::awaitable<void> runStream(tcp::socket& socket, const Request& req,
                                           const std::string& requestId,
                                           std::unique_ptr<exec::ProcessAdapter> adapter);

    Response handleCancel(const Request& req, const std::string& requestId);
    Response handleShells(const Request& req);
    Response handleSystemInfo(const Request& req);
    Response handleValidatePath(const Request& req);
    Response handleRegister(const Request& req, const std::string& clientKey);
    boost::asio::awaitable<Response> handleVerify(const Request& req);
    Response handleAuthorize(const Request& req);
    Response handleListDevices(const Request& req);
    Response handleRevoke(const Request& req, const std::string& deviceId);

    std::optional<Response> checkRateLimit(auth::FixedWindowRateLimiter& limiter,
                                           const Request& req, const std::string& clientKey);

    exec::AdapterOptions adapterOptions() const;

    boost::asio::io_context& ioc_;
    config::ServerConfig config_;
    auth::DeviceAuthorizer& authorizer_;
    exec::RequestLifecycleManager& lifecycle_;
    auth::FixedWindowRateLimiter writeLimiter_;
    auth::FixedWindowRateLimiter readLimiter_;
    tcp::acceptor acceptor_;
    boost::asio::steady_timer maintenance_;
    bool compatLayer_{false};
    std::string assistantExecutable_;
    bool running_{false};
};

} // namespace conduit::http
