#include "util/s3Helpers.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace canopy::util {

std::string toHex(const std::string& raw) {
    std::ostringstream oss;
    for (const unsigned char c : raw) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(std::string(reinterpret_cast<char*>(hash), SHA256_DIGEST_LENGTH));
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len))
        throw std::runtime_error("HMAC-SHA256 failed");
    return {reinterpret_cast<char*>(digest), len};
}

std::string hmacSha256Hex(const std::string& key, const std::string& data) {
    return toHex(hmacSha256Raw(key, data));
}

std::string uriEncode(const std::string& in, const bool encodeSlash) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (const unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash))
            out << c;
        else
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}

std::string canonicalQueryString(const std::map<std::string, std::string>& params) {
    std::map<std::string, std::string> encoded;
    for (const auto& [k, v] : params) encoded.emplace(uriEncode(k), uriEncode(v));

    std::string out;
    for (const auto& [k, v] : encoded) {
        if (!out.empty()) out += '&';
        out += k + '=' + v;
    }
    return out;
}

std::string deriveSigningKey(const std::string& secret, const std::string& date,
                             const std::string& region, const std::string& service) {
    const auto kDate = hmacSha256Raw("AWS4" + secret, date);
    const auto kRegion = hmacSha256Raw(kDate, region);
    const auto kService = hmacSha256Raw(kRegion, service);
    return hmacSha256Raw(kService, "aws4_request");
}

}
