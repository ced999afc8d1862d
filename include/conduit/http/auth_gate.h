#pragma once

#include <conduit/core/types.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::http {

/// Device pairing endpoints; reachable without a bearer token.
bool isPublicPath(std::string_view path);

/// 127.0.0.0/8, ::1 or an IPv4-mapped loopback address. Unparseable input is not local.
bool isLoopbackAddress(std::string_view address);

/// Token from an "Authorization: Bearer <token>" header value.
std::optional<std::string> bearerToken(std::string_view authorization);

enum class GateVerdict { Public, LocalBypass, Authorized, MissingToken, InvalidToken };

struct GateRequest {
    std::string_view path;
    std::string_view clientAddress; ///< connection peer, or the forwarded client behind a trusted proxy
    std::string_view authorization;
};

struct GateDecision {
    GateVerdict verdict{GateVerdict::MissingToken};
    std::string deviceId;

    bool allowed() const noexcept {
        return verdict == GateVerdict::Public || verdict == GateVerdict::LocalBypass ||
               verdict == GateVerdict::Authorized;
    }
};

using TokenValidator = std::function<Result<std::string>(const std::string& token)>;

/**
 * @brief Decide whether a request may reach its handler.
 *
 * Public paths always pass. Requests from a loopback client address pass when
 * @p allowLocalhost; Host and Origin headers play no part. Everything else needs a bearer
 * token accepted by @p validate.
 */
GateDecision evaluateGate(const GateRequest& request, bool allowLocalhost,
                          const TokenValidator& validate);

/// HTTP status for an error surfaced by a request handler.
unsigned httpStatusFor(ErrorCode code) noexcept;

} // namespace conduit::http
