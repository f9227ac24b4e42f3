#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lfsplit {

// Provenance of one split. chunk_paths are in index order; concatenating them
// reproduces the original as it was when the record was made.
struct SplitRecord {
    std::string original_path;
    std::uint64_t original_size{0};
    std::string chunk_prefix;
    std::vector<std::string> chunk_paths;
    std::uint32_t chunk_count{0};
    // CRC-32 hex per chunk. Empty for stores written without checksums.
    std::vector<std::string> chunk_checksums;
};

// Keyed by original_path exactly as it was seen at split time.
using TrackerStore = std::map<std::string, SplitRecord>;

} // namespace lfsplit
