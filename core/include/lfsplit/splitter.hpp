#pragma once

#include "lfsplit/split_record.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lfsplit {

// Room left under the size limit for each chunk.
constexpr std::uint64_t kChunkHeadroomBytes = 1024u * 1024u;

class Splitter {
  public:
    // Chunks are limit - kChunkHeadroomBytes long; throws ConfigError if that is not positive.
    Splitter(std::filesystem::path root, std::uint64_t chunk_limit_bytes);

    // Writes <prefix>_split_<NNN> chunk files into root. On failure every chunk
    // written by this call is removed and SplitIOError is thrown.
    SplitRecord split(const std::string &path) const;

    std::uint64_t chunk_size_bytes() const noexcept;

  private:
    std::filesystem::path root_;
    std::uint64_t chunk_size_bytes_;
};

} // namespace lfsplit
