#include <gtest/gtest.h>
#include "identity/Identity.hpp"

#include <jwt-cpp/jwt.h>
#include <nlohmann/json.hpp>

using namespace canopy::identity;

namespace {

const auto ISSUED = std::chrono::system_clock::from_time_t(1700000000);

auto baseToken() {
    return jwt::create().set_type("JWT").set_subject("42").set_issued_at(ISSUED);
}

}

TEST(IdentityTest, NativeIssuerYieldsNativeIdentity) {
    const auto token = baseToken().set_issuer("canopy").sign(jwt::algorithm::hs256{"test-secret"});
    const auto id = Identity::fromVerifiedToken(token);
    EXPECT_EQ(id.user_id, 42u);
    EXPECT_EQ(id.auth_method, AuthMethod::Native);
    EXPECT_FALSE(id.provider.has_value());
    EXPECT_EQ(id.session_issued_at, 1700000000);
}

TEST(IdentityTest, MissingIssuerIsNative) {
    const auto token = baseToken().sign(jwt::algorithm::hs256{"test-secret"});
    EXPECT_EQ(Identity::fromVerifiedToken(token).auth_method, AuthMethod::Native);
}

TEST(IdentityTest, ForeignIssuerYieldsOidcIdentity) {
    const auto token = baseToken().set_issuer("https://accounts.example.com").sign(jwt::algorithm::hs256{"k"});
    const auto id = Identity::fromVerifiedToken(token);
    EXPECT_EQ(id.auth_method, AuthMethod::OIDC);
    EXPECT_EQ(id.provider, "https://accounts.example.com");
}

TEST(IdentityTest, ExplicitAuthMethodClaimWins) {
    const auto token = baseToken()
                           .set_issuer("canopy")
                           .set_payload_claim("auth_method", jwt::claim(std::string("oidc")))
                           .set_payload_claim("idp", jwt::claim(std::string("github")))
                           .sign(jwt::algorithm::hs256{"k"});
    const auto id = Identity::fromVerifiedToken(token);
    EXPECT_EQ(id.auth_method, AuthMethod::OIDC);
    EXPECT_EQ(id.provider, "github");
}

TEST(IdentityTest, MalformedClaimsAreRejected) {
    const auto noSubject = jwt::create().set_issued_at(ISSUED).sign(jwt::algorithm::hs256{"k"});
    EXPECT_THROW((void)Identity::fromVerifiedToken(noSubject), std::invalid_argument);

    const auto noIat = jwt::create().set_subject("42").sign(jwt::algorithm::hs256{"k"});
    EXPECT_THROW((void)Identity::fromVerifiedToken(noIat), std::invalid_argument);

    const auto textSubject = jwt::create().set_subject("alice").set_issued_at(ISSUED)
                                 .sign(jwt::algorithm::hs256{"k"});
    EXPECT_THROW((void)Identity::fromVerifiedToken(textSubject), std::invalid_argument);

    const auto unknownMethod = baseToken()
                                   .set_payload_claim("auth_method", jwt::claim(std::string("smoke-signal")))
                                   .sign(jwt::algorithm::hs256{"k"});
    EXPECT_THROW((void)Identity::fromVerifiedToken(unknownMethod), std::invalid_argument);
}

TEST(IdentityTest, OidcRequiresProvider) {
    EXPECT_THROW((void)Identity::oidc(1, ""), std::invalid_argument);
}

TEST(IdentityTest, JsonRoundTripKeepsProvider) {
    const auto original = Identity::oidc(7, "google", 1700000000);
    const nlohmann::json j = original;
    EXPECT_EQ(j.at("auth_method"), "oidc");

    const auto back = j.get<Identity>();
    EXPECT_EQ(back.user_id, 7u);
    EXPECT_EQ(back.provider, "google");
    EXPECT_EQ(back.session_issued_at, 1700000000);
    EXPECT_EQ(to_string(back), "user:7 (oidc:google)");
}
