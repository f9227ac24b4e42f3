#pragma once

#include "lfsplit/split_record.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lfsplit {

struct RecordStatus {
    std::string original_path;
    std::size_t chunk_count{0};
    std::size_t chunks_present{0};
    bool original_present{false};
};

struct StatusReport {
    std::vector<RecordStatus> records;
};

struct ChunkProblem {
    std::string original_path;
    std::string chunk_path;
};

struct VerifyReport {
    std::vector<ChunkProblem> missing;
    std::vector<ChunkProblem> corrupt;

    bool ok() const noexcept { return missing.empty() && corrupt.empty(); }
};

class Inspector {
  public:
    explicit Inspector(std::filesystem::path root);

    StatusReport status(const TrackerStore &store) const;

    // Checks chunk presence and, for records that carry checksums, chunk contents.
    VerifyReport verify(const TrackerStore &store) const;

  private:
    std::filesystem::path root_;
};

} // namespace lfsplit
