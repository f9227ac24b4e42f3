#include "lfsplit/size_parser.hpp"

#include "lfsplit/errors.hpp"

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace lfsplit {

namespace {

std::string trim(const std::string &text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::uint64_t unit_multiplier(char suffix) {
    switch (suffix) {
    case 'K':
    case 'k':
        return kKiB;
    case 'M':
    case 'm':
        return kMiB;
    case 'G':
    case 'g':
        return kGiB;
    default:
        return 0;
    }
}

} // namespace

std::uint64_t parse_size(const std::string &text) {
    const std::string value = trim(text);
    if (value.empty()) {
        throw InvalidSizeError("empty size string");
    }

    std::string digits = value;
    std::uint64_t multiplier = 1;
    if (!std::isdigit(static_cast<unsigned char>(value.back()))) {
        multiplier = unit_multiplier(value.back());
        if (multiplier == 0) {
            throw InvalidSizeError("unknown size suffix in '" + value + "'");
        }
        digits = value.substr(0, value.size() - 1);
    }
    if (digits.empty()) {
        throw InvalidSizeError("size has no numeric part: '" + value + "'");
    }

    std::uint64_t count = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidSizeError("invalid size: '" + value + "'");
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (count > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw InvalidSizeError("size overflows 64 bits: '" + value + "'");
        }
        count = count * 10 + digit;
    }
    if (count > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw InvalidSizeError("size overflows 64 bits: '" + value + "'");
    }
    return count * multiplier;
}

std::string format_megabytes(std::uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / static_cast<double>(kMiB)
        << "MB";
    return oss.str();
}

} // namespace lfsplit
