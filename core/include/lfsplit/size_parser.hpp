#pragma once

#include <cstdint>
#include <string>

namespace lfsplit {

constexpr std::uint64_t kKiB = 1024u;
constexpr std::uint64_t kMiB = 1024u * kKiB;
constexpr std::uint64_t kGiB = 1024u * kMiB;

// Parses "100M", "1G", "512k" or a bare byte count. Units are 1024-based.
// Throws InvalidSizeError when the text is not a size.
std::uint64_t parse_size(const std::string &text);

// "12.3MB", used in progress lines.
std::string format_megabytes(std::uint64_t bytes);

} // namespace lfsplit
