#include "lfsplit/cleaner.hpp"

#include "lfsplit/logger.hpp"

#include <system_error>

namespace lfsplit {

Cleaner::Cleaner(const Tracker &tracker) : tracker_(tracker) {}

CleanSummary Cleaner::clean() const {
    CleanSummary summary;
    const auto chunks = tracker_.all_chunk_paths(tracker_.load());
    for (const auto &chunk : chunks) {
        std::error_code ec;
        if (std::filesystem::remove(tracker_.root() / chunk, ec)) {
            Logger::info("Removed split file: " + chunk);
            ++summary.chunks_removed;
        } else if (ec) {
            Logger::warning("could not remove " + chunk + ": " + ec.message());
        }
    }
    if (summary.chunks_removed > 0) {
        Logger::info("Cleaned " + std::to_string(summary.chunks_removed) + " split files");
    } else {
        Logger::info("No split files to clean");
    }

    summary.store_removed = tracker_.remove_store();
    if (summary.store_removed) {
        Logger::info("Removed " + tracker_.store_file().string());
    }
    return summary;
}

} // namespace lfsplit
