#pragma once

#include "lfsplit/split_record.hpp"

#include <filesystem>

namespace lfsplit {

enum class MergeOutcome {
    Merged,
    // The original was already on disk with the recorded size; only the chunks were removed.
    AlreadyPresent,
};

class Merger {
  public:
    explicit Merger(std::filesystem::path root);

    // Rebuilds record.original_path from its chunks and removes the chunks.
    // Throws MissingChunksError, SizeMismatchError or MergeIOError; the store is never touched.
    MergeOutcome merge(const SplitRecord &record) const;

  private:
    void remove_chunks(const SplitRecord &record) const;

    std::filesystem::path root_;
};

} // namespace lfsplit
