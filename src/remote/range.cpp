#include "dm/remote/service.hpp"

#include <cctype>
#include <limits>

namespace dm::remote {

std::string make_range_value(std::uint64_t offset) {
    return "bytes=" + std::to_string(offset) + "-";
}

std::optional<std::uint64_t> parse_range_value(const std::string& value) {
    static const std::string prefix = "bytes=";
    if (value.compare(0, prefix.size(), prefix) != 0 || value.size() < prefix.size() + 2 || value.back() != '-') {
        return std::nullopt;
    }

    const std::string digits = value.substr(prefix.size(), value.size() - prefix.size() - 1);
    std::uint64_t offset = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (offset > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        offset = offset * 10 + digit;
    }
    return offset;
}

} // namespace dm::remote
