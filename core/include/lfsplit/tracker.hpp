#pragma once

#include "lfsplit/split_record.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lfsplit {

enum class SplitState {
    NotSplit,
    SplitValid,
    SplitStale,
};

struct SplitCheck {
    SplitState state{SplitState::NotSplit};
    // The stored record, when there is one. For NotSplit it is set only when the
    // record exists but some of its chunks are gone.
    std::optional<SplitRecord> record;
};

// Owns the persisted store file. Paths in records are resolved against root.
class Tracker {
  public:
    Tracker(std::filesystem::path root, std::filesystem::path store_file);

    // Empty store when the file is absent or unreadable; corruption is logged.
    TrackerStore load() const;

    TrackerStore load_strict() const;

    SplitCheck check_already_split(const TrackerStore &store, const std::string &path) const;

    // Union of store and new_records (new wins on equal keys), written atomically.
    // Throws StoreWriteError if the store cannot be persisted.
    TrackerStore merge(TrackerStore store, const TrackerStore &new_records) const;

    std::vector<std::string> all_chunk_paths(const TrackerStore &store) const;

    bool remove_store() const;

    const std::filesystem::path &store_file() const noexcept;

    const std::filesystem::path &root() const noexcept;

  private:
    void persist(const TrackerStore &store) const;

    std::filesystem::path root_;
    std::filesystem::path store_file_;
};

} // namespace lfsplit
