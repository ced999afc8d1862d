#include <conduit/auth/token_signer.h>
#include <conduit/core/uuid.h>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <vector>

using nlohmann::json;

namespace conduit::auth {

namespace {

constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";

} // namespace

std::string base64UrlEncode(std::string_view data) {
    if (data.empty())
        return {};
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    std::string s(reinterpret_cast<char*>(out.data()), static_cast<size_t>(n));
    while (!s.empty() && s.back() == '=')
        s.pop_back();
    for (auto& c : s) {
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
    }
    return s;
}

Result<std::string> base64UrlDecode(std::string_view data) {
    std::string s;
    s.reserve(data.size() + 3);
    for (char c : data) {
        if (c == '-')
            s.push_back('+');
        else if (c == '_')
            s.push_back('/');
        else if (c == '+' || c == '/' || c == '=')
            return Error{ErrorCode::InvalidArgument, "Invalid base64url character"};
        else
            s.push_back(c);
    }
    if (s.size() % 4 == 1)
        return Error{ErrorCode::InvalidArgument, "Invalid base64url length"};
    std::size_t padding = (4 - s.size() % 4) % 4;
    s.append(padding, '=');
    if (s.empty())
        return std::string{};

    std::vector<unsigned char> out(s.size() / 4 * 3 + 1);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0)
        return Error{ErrorCode::InvalidArgument, "Invalid base64url data"};
    // EVP_DecodeBlock counts padding bytes as zero output.
    return std::string(reinterpret_cast<char*>(out.data()), static_cast<size_t>(n) - padding);
}

Result<std::string> secureRandomBytes(std::size_t count) {
    std::string out(count, '\0');
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        return Error{ErrorCode::InternalError, "RAND_bytes failed"};
    }
    return out;
}

Result<std::string> generateSecret(std::size_t bytes) {
    auto raw = secureRandomBytes(bytes);
    if (!raw)
        return raw.error();
    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes * 2);
    for (unsigned char c : raw.value()) {
        hex.push_back(kHex[c >> 4]);
        hex.push_back(kHex[c & 0x0F]);
    }
    return hex;
}

Result<std::string> generateVerificationCode(std::size_t digits) {
    std::string code;
    code.reserve(digits);
    while (code.size() < digits) {
        auto raw = secureRandomBytes(16);
        if (!raw)
            return raw.error();
        for (unsigned char c : raw.value()) {
            // Reject 250..255 so every digit is equally likely.
            if (c >= 250)
                continue;
            code.push_back(static_cast<char>('0' + c % 10));
            if (code.size() == digits)
                break;
        }
    }
    return code;
}

TokenSigner::TokenSigner(std::string secret) : secret_(std::move(secret)) {}

std::string TokenSigner::sign(std::string_view signingInput) const {
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int macLen = 0;
    HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(signingInput.data()), signingInput.size(),
         mac.data(), &macLen);
    return base64UrlEncode(
        std::string_view(reinterpret_cast<const char*>(mac.data()), macLen));
}

std::string TokenSigner::issue(const std::string& deviceId, TimePoint issuedAt,
                               TimePoint expiresAt) const {
    json claims = {{"deviceId", deviceId},
                   {"iat", core::toUnixSeconds(issuedAt)},
                   {"exp", core::toUnixSeconds(expiresAt)}};
    std::string input = base64UrlEncode(kHeader) + "." + base64UrlEncode(claims.dump());
    std::string signature = sign(input);
    return input + "." + signature;
}

Result<TokenClaims> TokenSigner::verify(std::string_view token, TimePoint now) const {
    auto firstDot = token.find('.');
    auto lastDot = token.rfind('.');
    if (firstDot == std::string_view::npos || firstDot == lastDot)
        return Error{ErrorCode::Unauthorized, "Malformed token"};

    auto signingInput = token.substr(0, lastDot);
    auto signature = token.substr(lastDot + 1);
    const std::string expected = sign(signingInput);
    if (expected.size() != signature.size() ||
        CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) != 0) {
        return Error{ErrorCode::Unauthorized, "Invalid token signature"};
    }

    auto header = base64UrlDecode(token.substr(0, firstDot));
    auto payload = base64UrlDecode(token.substr(firstDot + 1, lastDot - firstDot - 1));
    if (!header || !payload)
        return Error{ErrorCode::Unauthorized, "Malformed token"};

    auto h = json::parse(header.value(), nullptr, false);
    if (h.is_discarded() || !h.is_object() || h.value("alg", std::string{}) != "HS256")
        return Error{ErrorCode::Unauthorized, "Unsupported token algorithm"};

    auto p = json::parse(payload.value(), nullptr, false);
    if (p.is_discarded() || !p.is_object() || !p.contains("deviceId") ||
        !p["deviceId"].is_string() || !p.contains("exp") || !p["exp"].is_number_integer()) {
        return Error{ErrorCode::Unauthorized, "Malformed token claims"};
    }

    TokenClaims claims;
    claims.deviceId = p["deviceId"].get<std::string>();
    claims.expiresAt = core::fromUnixSeconds(p["exp"].get<int64_t>());
    if (p.contains("iat") && p["iat"].is_number_integer())
        claims.issuedAt = core::fromUnixSeconds(p["iat"].get<int64_t>());
    if (claims.expiresAt <= now)
        return Error{ErrorCode::Expired, "Token expired"};
    return claims;
}

} // namespace conduit::auth
