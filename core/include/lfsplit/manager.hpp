#pragma once

#include "lfsplit/cleaner.hpp"
#include "lfsplit/config.hpp"
#include "lfsplit/ignore_list.hpp"
#include "lfsplit/inspector.hpp"
#include "lfsplit/tracker.hpp"

#include <cstddef>

namespace lfsplit {

struct BuildSummary {
    std::size_t found{0};
    std::size_t skipped{0};
    std::size_t split{0};
    std::size_t failed{0};
    std::size_t ignored_added{0};
};

struct MergeSummary {
    std::size_t merged{0};
    std::size_t already_present{0};
    // Records whose chunks are gone and whose original is back at its recorded size.
    std::size_t up_to_date{0};
    std::size_t failed{0};
};

// The workflows behind the command-line commands. Per-file failures are logged
// and counted; only store persistence and configuration errors propagate.
class Manager {
  public:
    explicit Manager(Config config);

    BuildSummary build() const;

    MergeSummary merge_all() const;

    CleanSummary clean() const;

    StatusReport status() const;

    VerifyReport verify() const;

    const Tracker &tracker() const noexcept;

    const IgnoreList &ignore_list() const noexcept;

  private:
    void discard_chunks(const SplitRecord &record, const char *reason) const;

    Config config_;
    Tracker tracker_;
    IgnoreList ignore_list_;
};

} // namespace lfsplit
