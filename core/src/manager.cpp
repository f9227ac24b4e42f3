#include "lfsplit/manager.hpp"

#include "lfsplit/chunk_naming.hpp"
#include "lfsplit/errors.hpp"
#include "lfsplit/file_scanner.hpp"
#include "lfsplit/logger.hpp"
#include "lfsplit/merger.hpp"
#include "lfsplit/splitter.hpp"
#include "lfsplit/worker_pool.hpp"

#include <map>
#include <mutex>
#include <set>
#include <system_error>

namespace lfsplit {

namespace {

bool has_chunk_on_disk(const std::filesystem::path &root, const SplitRecord &record) {
    for (const auto &chunk : record.chunk_paths) {
        if (std::filesystem::exists(root / chunk)) {
            return true;
        }
    }
    return false;
}

bool is_restored(const std::filesystem::path &root, const SplitRecord &record) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(root / record.original_path, ec);
    return !ec && size == record.original_size;
}

} // namespace

Manager::Manager(Config config)
    : config_(std::move(config)), tracker_(config_.root, config_.split_info),
      ignore_list_(config_.root, config_.ignore_file) {}

BuildSummary Manager::build() const {
    BuildSummary summary;
    const Splitter splitter(config_.root, config_.size_limit_bytes);

    Logger::info("Finding files larger than " + std::to_string(config_.size_limit_bytes / (1024 * 1024)) +
                 "MB...");
    const auto scanned = FileScanner(config_.size_limit_bytes).find_large_files(config_.root);

    const TrackerStore store = tracker_.load();
    // Chunks of earlier splits can exceed a lowered limit; they are never originals.
    std::set<std::string> tracked_chunks;
    for (const auto &entry : store) {
        tracked_chunks.insert(entry.second.chunk_paths.begin(), entry.second.chunk_paths.end());
    }
    std::vector<std::string> large_files;
    for (const auto &path : scanned) {
        if (tracked_chunks.count(path) == 0) {
            large_files.push_back(path);
        }
    }

    summary.found = large_files.size();
    if (large_files.empty()) {
        Logger::info("No files larger than size limit found");
        return summary;
    }
    Logger::info("Found " + std::to_string(large_files.size()) + " large files");

    // Tracked files keep their chunk prefix. A newcomer flattening to the same
    // prefix is rejected before anything is deleted.
    std::map<std::string, std::string> prefix_owner;
    for (const auto &entry : store) {
        prefix_owner.emplace(chunk_prefix(entry.first), entry.first);
    }

    std::vector<std::string> accepted;
    for (const auto &path : large_files) {
        const auto check = tracker_.check_already_split(store, path);
        if (check.state == SplitState::SplitValid) {
            Logger::info("File " + path + " already split into " + std::to_string(check.record->chunk_count) +
                         " parts, skipping");
            ++summary.skipped;
            continue;
        }

        const auto owner = prefix_owner.emplace(chunk_prefix(path), path);
        if (!owner.second && owner.first->second != path) {
            Logger::error("cannot split " + path + ": split file prefix " + owner.first->first +
                          " already belongs to " + owner.first->second);
            ++summary.failed;
            continue;
        }

        if (check.state == SplitState::SplitStale) {
            discard_chunks(*check.record, "outdated");
        } else if (check.record) {
            discard_chunks(*check.record, "incomplete");
        }
        accepted.push_back(path);
    }
    if (summary.skipped > 0) {
        Logger::info("Skipped " + std::to_string(summary.skipped) + " files that are already split");
    }
    if (accepted.empty()) {
        Logger::info("No new files need to be split");
        return summary;
    }

    Logger::info("Processing " + std::to_string(accepted.size()) + " new files for splitting");
    TrackerStore new_records;
    std::mutex results_mutex;
    {
        WorkerPool pool(config_.jobs);
        for (const auto &path : accepted) {
            pool.submit([&, path] {
                try {
                    auto record = splitter.split(path);
                    std::lock_guard<std::mutex> lock(results_mutex);
                    new_records.emplace(path, std::move(record));
                } catch (const std::exception &err) {
                    Logger::error(err.what());
                    std::lock_guard<std::mutex> lock(results_mutex);
                    ++summary.failed;
                }
            });
        }
        pool.wait_for_completion();
    }

    summary.split = new_records.size();
    if (new_records.empty()) {
        Logger::info("No files were split");
        return summary;
    }

    tracker_.merge(store, new_records);

    std::vector<std::string> originals;
    originals.reserve(new_records.size());
    for (const auto &entry : new_records) {
        originals.push_back(entry.first);
    }
    summary.ignored_added = ignore_list_.add_paths(originals);

    Logger::info("Build completed successfully. Split " + std::to_string(summary.split) + " new files, " +
                 std::to_string(originals.size()) + " files added to " +
                 ignore_list_.file().filename().string());
    return summary;
}

MergeSummary Manager::merge_all() const {
    MergeSummary summary;
    const TrackerStore store = tracker_.load();
    if (store.empty()) {
        Logger::info("No split file information found");
        return summary;
    }
    Logger::info("Found split information for " + std::to_string(store.size()) + " files");

    const Merger merger(config_.root);
    std::mutex results_mutex;
    {
        WorkerPool pool(config_.jobs);
        for (const auto &entry : store) {
            const SplitRecord *record = &entry.second;
            if (!has_chunk_on_disk(config_.root, *record) && is_restored(config_.root, *record)) {
                Logger::info(record->original_path + " is already merged, nothing to do");
                ++summary.up_to_date;
                continue;
            }
            pool.submit([&, record] {
                try {
                    const auto outcome = merger.merge(*record);
                    std::lock_guard<std::mutex> lock(results_mutex);
                    if (outcome == MergeOutcome::Merged) {
                        ++summary.merged;
                    } else {
                        ++summary.already_present;
                    }
                } catch (const std::exception &err) {
                    Logger::error(err.what());
                    std::lock_guard<std::mutex> lock(results_mutex);
                    ++summary.failed;
                }
            });
        }
        pool.wait_for_completion();
    }

    const auto restored = summary.merged + summary.already_present;
    if (restored > 0) {
        Logger::info("Successfully merged " + std::to_string(restored) + " files");
        Logger::info("Note: " + ignore_list_.file().filename().string() + " and " +
                     tracker_.store_file().filename().string() + " were not modified");
    } else if (summary.failed == 0 && summary.up_to_date > 0) {
        Logger::info("All files are already merged");
    } else {
        Logger::info("No files were merged");
    }
    return summary;
}

CleanSummary Manager::clean() const { return Cleaner(tracker_).clean(); }

StatusReport Manager::status() const { return Inspector(config_.root).status(tracker_.load()); }

VerifyReport Manager::verify() const { return Inspector(config_.root).verify(tracker_.load()); }

const Tracker &Manager::tracker() const noexcept { return tracker_; }

const IgnoreList &Manager::ignore_list() const noexcept { return ignore_list_; }

void Manager::discard_chunks(const SplitRecord &record, const char *reason) const {
    for (const auto &chunk : record.chunk_paths) {
        std::error_code ec;
        if (std::filesystem::remove(config_.root / chunk, ec)) {
            Logger::info(std::string("Removed ") + reason + " split file: " + chunk);
        } else if (ec) {
            Logger::warning("could not remove " + chunk + ": " + ec.message());
        }
    }
}

} // namespace lfsplit
