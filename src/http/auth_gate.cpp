#include <conduit/http/auth_gate.h>

#include <boost/algorithm/string.hpp>
#include <boost/asio/ip/address.hpp>
#include <spdlog/spdlog.h>

#include <array>

namespace conduit::http {

namespace {

constexpr std::array<std::string_view, 4> kPublicPrefixes = {
    "/api/auth/register",
    "/api/auth/verify",
    "/api/auth/authorize",
    "/api/auth/devices",
};

} // namespace

bool isPublicPath(std::string_view path) {
    for (auto prefix : kPublicPrefixes) {
        if (path.substr(0, prefix.size()) != prefix)
            continue;
        // Exact match or a sub-path ("/api/auth/devices/<id>"), not "/api/auth/devicesX".
        if (path.size() == prefix.size() || path[prefix.size()] == '/' ||
            path[prefix.size()] == '?')
            return true;
    }
    return false;
}

bool isLoopbackAddress(std::string_view address) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(std::string(address), ec);
    if (ec)
        return false;
    if (addr.is_v6() && addr.to_v6().is_v4_mapped())
        return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, addr.to_v6())
            .is_loopback();
    return addr.is_loopback();
}

std::optional<std::string> bearerToken(std::string_view authorization) {
    std::string value(authorization);
    boost::algorithm::trim(value);
    constexpr std::string_view kScheme = "bearer ";
    if (value.size() <= kScheme.size() ||
        !boost::algorithm::iequals(value.substr(0, kScheme.size()), kScheme))
        return std::nullopt;
    std::string token = value.substr(kScheme.size());
    boost::algorithm::trim(token);
    if (token.empty())
        return std::nullopt;
    return token;
}

GateDecision evaluateGate(const GateRequest& request, bool allowLocalhost,
                          const TokenValidator& validate) {
    if (isPublicPath(request.path))
        return GateDecision{GateVerdict::Public, {}};
    if (allowLocalhost && isLoopbackAddress(request.clientAddress))
        return GateDecision{GateVerdict::LocalBypass, {}};

    auto token = bearerToken(request.authorization);
    if (!token)
        return GateDecision{GateVerdict::MissingToken, {}};

    auto deviceId = validate(*token);
    if (!deviceId) {
        spdlog::debug("[AuthGate] token rejected for {}: {}", request.path,
                      deviceId.error().message);
        return GateDecision{GateVerdict::InvalidToken, {}};
    }
    return GateDecision{GateVerdict::Authorized, std::move(deviceId).value()};
}

unsigned httpStatusFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return 200;
        case ErrorCode::InvalidCode:
        case ErrorCode::InvalidArgument:
            return 400;
        case ErrorCode::Unauthorized:
        case ErrorCode::Expired:
            return 401;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::Conflict:
            return 409;
        case ErrorCode::RateLimited:
            return 429;
        default:
            return 500;
    }
}

} // namespace conduit::http
