#include "identity/Identity.hpp"
#include "ids/Snowflake.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <jwt-cpp/jwt.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using namespace canopy::identity;
using namespace canopy::log;

Identity Identity::native(const UserId userId, const std::time_t issuedAt) {
    return {.user_id = userId, .auth_method = AuthMethod::Native, .provider = std::nullopt, .session_issued_at = issuedAt};
}

Identity Identity::oidc(const UserId userId, std::string provider, const std::time_t issuedAt) {
    if (provider.empty()) throw std::invalid_argument("OIDC identity requires a provider");
    return {.user_id = userId, .auth_method = AuthMethod::OIDC, .provider = std::move(provider), .session_issued_at = issuedAt};
}

Identity Identity::fromVerifiedToken(const std::string& token, const std::string& nativeIssuer) {
    const auto decoded = jwt::decode(token);

    if (!decoded.has_subject()) {
        Registry::auth()->warn("[Identity::fromVerifiedToken] Token carries no subject claim");
        throw std::invalid_argument("Token has no subject");
    }
    if (!decoded.has_issued_at()) {
        Registry::auth()->warn("[Identity::fromVerifiedToken] Token for '{}' carries no iat claim", decoded.get_subject());
        throw std::invalid_argument("Token has no issued-at time");
    }

    const auto userId = ids::parseSnowflake(decoded.get_subject());
    const auto issuedAt = std::chrono::system_clock::to_time_t(decoded.get_issued_at());
    const auto issuer = decoded.has_issuer() ? decoded.get_issuer() : std::string{};

    if (decoded.has_payload_claim("auth_method")) {
        const auto method = decoded.get_payload_claim("auth_method").as_string();
        if (method == "native") return native(userId, issuedAt);
        if (method == "oidc") {
            const auto provider = decoded.has_payload_claim("idp")
                                      ? decoded.get_payload_claim("idp").as_string()
                                      : issuer;
            return oidc(userId, provider, issuedAt);
        }
        Registry::auth()->warn("[Identity::fromVerifiedToken] Unknown auth_method '{}' for user {}", method, userId);
        throw std::invalid_argument("Unknown auth_method claim: " + method);
    }

    if (issuer.empty() || issuer == nativeIssuer) return native(userId, issuedAt);
    return oidc(userId, issuer, issuedAt);
}

std::string canopy::identity::to_string(const AuthMethod method) {
    switch (method) {
        case AuthMethod::Native: return "native";
        case AuthMethod::OIDC: return "oidc";
    }
    throw std::invalid_argument("Unknown auth method");
}

std::string canopy::identity::to_string(const Identity& identity) {
    std::ostringstream ss;
    ss << "user:" << identity.user_id << " (" << to_string(identity.auth_method);
    if (identity.provider) ss << ":" << *identity.provider;
    ss << ")";
    return ss.str();
}

void canopy::identity::to_json(nlohmann::json& j, const Identity& identity) {
    j = {
        {"user_id", identity.user_id},
        {"auth_method", to_string(identity.auth_method)},
        {"session_issued_at", util::timestampToString(identity.session_issued_at)}
    };
    if (identity.provider) j["provider"] = *identity.provider;
}

void canopy::identity::from_json(const nlohmann::json& j, Identity& identity) {
    identity.user_id = j.at("user_id").get<UserId>();
    const auto method = j.at("auth_method").get<std::string>();
    if (method == "native") identity.auth_method = AuthMethod::Native;
    else if (method == "oidc") identity.auth_method = AuthMethod::OIDC;
    else throw std::invalid_argument("Unknown auth_method: " + method);
    identity.provider = j.contains("provider") ? std::make_optional(j.at("provider").get<std::string>()) : std::nullopt;
    identity.session_issued_at = util::parseTimestampFromString(j.at("session_issued_at").get<std::string>());
}
