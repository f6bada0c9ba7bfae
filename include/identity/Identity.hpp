#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace canopy::identity {

using UserId = uint64_t;

enum class AuthMethod : uint8_t { Native, OIDC };

// An already-authenticated principal. Nothing in this library re-verifies it.
struct Identity {
    UserId user_id{};
    AuthMethod auth_method{AuthMethod::Native};
    std::optional<std::string> provider{}; // set for OIDC sessions only
    std::time_t session_issued_at{};

    [[nodiscard]] static Identity native(UserId userId, std::time_t issuedAt = 0);
    [[nodiscard]] static Identity oidc(UserId userId, std::string provider, std::time_t issuedAt = 0);

    // Builds an identity from the claims of a JWT the authentication boundary
    // has already verified: "sub" (numeric user id), "iat", and either
    // "auth_method": "oidc" with "idp", or an "iss" other than the native issuer.
    [[nodiscard]] static Identity fromVerifiedToken(const std::string& token,
                                                    const std::string& nativeIssuer = "canopy");
};

std::string to_string(AuthMethod method);
std::string to_string(const Identity& identity);

void to_json(nlohmann::json& j, const Identity& identity);
void from_json(const nlohmann::json& j, Identity& identity);

}
