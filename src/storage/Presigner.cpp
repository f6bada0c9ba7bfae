#include "storage/Presigner.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <map>
#include <sstream>
#include <stdexcept>

using namespace canopy::storage;
using namespace canopy::util;

namespace {

constexpr const auto* ALGORITHM = "AWS4-HMAC-SHA256";
constexpr const auto* SERVICE = "s3";
constexpr const auto* UNSIGNED_PAYLOAD = "UNSIGNED-PAYLOAD";

}

Presigner::Presigner(config::StorageConfig cnf, Clock clock)
    : cnf_(std::move(cnf)), clock_(clock ? std::move(clock) : Clock(util::now)) {
    auto endpoint = cnf_.endpoint;
    if (const auto pos = endpoint.find("://"); pos != std::string::npos) {
        scheme_ = endpoint.substr(0, pos);
        endpoint = endpoint.substr(pos + 3);
    } else scheme_ = "https";

    while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
    if (endpoint.empty()) throw std::invalid_argument("Storage endpoint has no host: " + cnf_.endpoint);
    if (endpoint.find('/') != std::string::npos)
        throw std::invalid_argument("Storage endpoint must not carry a path: " + cnf_.endpoint);
    endpointHost_ = endpoint;

    if (cnf_.bucket.empty()) throw std::invalid_argument("Storage bucket is not configured");
}

std::string Presigner::objectKey(const ids::Snowflake nodeId) const {
    auto prefix = cnf_.key_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    if (prefix.empty()) return std::to_string(nodeId);
    return prefix + "/" + std::to_string(nodeId);
}

std::string Presigner::host_() const {
    return cnf_.path_style ? endpointHost_ : cnf_.bucket + "." + endpointHost_;
}

std::string Presigner::canonicalPath_(const std::string& key) const {
    const auto encodedKey = uriEncode(key, false);
    return cnf_.path_style ? "/" + uriEncode(cnf_.bucket) + "/" + encodedKey : "/" + encodedKey;
}

ScopedStorageGrant Presigner::issue(const ids::Snowflake nodeId, const Operation op) const {
    ScopedStorageGrant grant;
    grant.node_id = nodeId;
    grant.object_key = objectKey(nodeId);
    grant.operation = op;
    grant.method = httpMethod(op);
    grant.issued_at = clock_();
    grant.expires_at = grant.issued_at + cnf_.presign_ttl.count();
    grant.url = presign(grant.method, grant.object_key, cnf_.presign_ttl, grant.issued_at);

    log::Registry::storage()->debug("[Presigner] Issued {} reference for {} until {}",
                                    to_string(op), grant.object_key, timestampToString(grant.expires_at));
    return grant;
}

std::string Presigner::presign(const std::string& method, const std::string& key,
                               const std::chrono::seconds ttl, const std::time_t at) const {
    if (cnf_.access_key.empty() || cnf_.secret_access_key.empty()) {
        log::Registry::storage()->error("[Presigner] Refusing to sign {}: storage credentials are not configured", key);
        throw std::runtime_error("Storage credentials are not configured");
    }
    if (ttl.count() <= 0 || ttl > MAX_TTL)
        throw std::invalid_argument("Presign TTL must be within 1.." + std::to_string(MAX_TTL.count()) + " seconds");
    if (key.empty()) throw std::invalid_argument("Cannot presign an empty object key");

    const auto amzTs = amzTimestamp(at);
    const auto date = amzDate(at);
    const auto scope = date + "/" + cnf_.region + "/" + SERVICE + "/aws4_request";
    const auto host = host_();
    const auto path = canonicalPath_(key);

    const std::map<std::string, std::string> params{
        {"X-Amz-Algorithm", ALGORITHM},
        {"X-Amz-Credential", cnf_.access_key + "/" + scope},
        {"X-Amz-Date", amzTs},
        {"X-Amz-Expires", std::to_string(ttl.count())},
        {"X-Amz-SignedHeaders", "host"},
    };
    const auto query = canonicalQueryString(params);

    std::ostringstream canonical;
    canonical << method << "\n"
              << path << "\n"
              << query << "\n"
              << "host:" << host << "\n\n"
              << "host\n"
              << UNSIGNED_PAYLOAD;

    std::ostringstream toSign;
    toSign << ALGORITHM << "\n" << amzTs << "\n" << scope << "\n" << sha256Hex(canonical.str());

    const auto signingKey = deriveSigningKey(cnf_.secret_access_key, date, cnf_.region, SERVICE);
    const auto signature = hmacSha256Hex(signingKey, toSign.str());

    return scheme_ + "://" + host + path + "?" + query + "&X-Amz-Signature=" + signature;
}
