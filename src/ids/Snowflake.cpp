#include "ids/Snowflake.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace canopy::ids {

void to_json(nlohmann::json& j, const SnowflakeParts& parts) {
    j = {
        {"timestamp_ms", parts.timestamp_ms},
        {"unix_ms", parts.unixMillis()},
        {"generator_id", parts.generator_id},
        {"sequence", parts.sequence}
    };
}

std::string to_string(const SnowflakeParts& parts) {
    std::ostringstream ss;
    ss << util::timestampToString(static_cast<std::time_t>(parts.unixMillis() / 1000))
       << " +" << parts.unixMillis() % 1000 << "ms"
       << " gen=" << parts.generator_id
       << " seq=" << parts.sequence;
    return ss.str();
}

Snowflake parseSnowflake(const std::string& str) {
    Snowflake id{};
    const auto* end = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, id);
    if (str.empty() || ec != std::errc() || ptr != end)
        throw std::invalid_argument("Not a valid id: '" + str + "'");
    return id;
}

}
