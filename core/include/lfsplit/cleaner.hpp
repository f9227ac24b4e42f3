#pragma once

#include "lfsplit/tracker.hpp"

#include <cstddef>

namespace lfsplit {

struct CleanSummary {
    std::size_t chunks_removed{0};
    bool store_removed{false};
};

class Cleaner {
  public:
    explicit Cleaner(const Tracker &tracker);

    // Removes every chunk the store knows about, then the store itself.
    CleanSummary clean() const;

  private:
    const Tracker &tracker_;
};

} // namespace lfsplit
