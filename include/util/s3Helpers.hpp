#pragma once

#include <map>
#include <string>

namespace canopy::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256Hex(const std::string& key, const std::string& data);
std::string toHex(const std::string& raw);

// RFC 3986 unreserved characters pass through; everything else becomes %XX.
std::string uriEncode(const std::string& in, bool encodeSlash = true);

// Sorted, encoded "k=v&k=v" as SigV4 expects it.
std::string canonicalQueryString(const std::map<std::string, std::string>& params);

// kSecret -> kDate -> kRegion -> kService -> "aws4_request"
std::string deriveSigningKey(const std::string& secret, const std::string& date,
                             const std::string& region, const std::string& service);

}
