#include "util/parse.hpp"

#include <charconv>
#include <stdexcept>

namespace canopy::util {

uint32_t parseCount(const std::string& str, const uint32_t max) {
    uint32_t value{};
    const auto* end = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (str.empty() || ec != std::errc() || ptr != end)
        throw std::invalid_argument("Not a valid count: '" + str + "'");
    if (value > max)
        throw std::out_of_range("Count " + str + " exceeds the limit of " + std::to_string(max));
    return value;
}

}
