#pragma once

#include <conduit/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace conduit::auth {

struct TokenClaims {
    std::string deviceId;
    TimePoint issuedAt{};
    TimePoint expiresAt{};
};

/**
 * @brief HS256 JSON Web Tokens bound to a device id.
 *
 * Claims: {"deviceId", "iat", "exp"} (seconds since epoch). verify() checks the header, the
 * signature in constant time and the expiry; it does not consult the device store.
 */
class TokenSigner {
public:
    explicit TokenSigner(std::string secret);

    std::string issue(const std::string& deviceId, TimePoint issuedAt, TimePoint expiresAt) const;

    /// Unauthorized for malformed or forged tokens, Expired once exp has passed.
    Result<TokenClaims> verify(std::string_view token, TimePoint now) const;

private:
    std::string sign(std::string_view signingInput) const;

    std::string secret_;
};

std::string base64UrlEncode(std::string_view data);
Result<std::string> base64UrlDecode(std::string_view data);

/// Cryptographically secure random bytes (OpenSSL RAND_bytes).
Result<std::string> secureRandomBytes(std::size_t count);

/// Hex-encoded random secret suitable for TokenSigner.
Result<std::string> generateSecret(std::size_t bytes = 32);

/// Fixed-length numeric code, uniformly distributed, leading zeros kept.
Result<std::string> generateVerificationCode(std::size_t digits = 6);

} // namespace conduit::auth
