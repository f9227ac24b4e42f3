#include "lfsplit/inspector.hpp"

#include "lfsplit/checksum.hpp"
#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"

namespace lfsplit {

Inspector::Inspector(std::filesystem::path root) : root_(std::move(root)) {}

StatusReport Inspector::status(const TrackerStore &store) const {
    StatusReport report;
    for (const auto &entry : store) {
        const SplitRecord &record = entry.second;
        RecordStatus status;
        status.original_path = entry.first;
        status.chunk_count = record.chunk_count;
        status.original_present = std::filesystem::exists(root_ / entry.first);
        for (const auto &chunk : record.chunk_paths) {
            if (std::filesystem::exists(root_ / chunk)) {
                ++status.chunks_present;
            }
        }
        report.records.push_back(std::move(status));
    }
    return report;
}

VerifyReport Inspector::verify(const TrackerStore &store) const {
    VerifyReport report;
    for (const auto &entry : store) {
        const SplitRecord &record = entry.second;
        const bool has_checksums = record.chunk_checksums.size() == record.chunk_paths.size();
        for (std::size_t i = 0; i < record.chunk_paths.size(); ++i) {
            const auto &chunk = record.chunk_paths[i];
            if (!std::filesystem::exists(root_ / chunk)) {
                report.missing.push_back({entry.first, chunk});
                continue;
            }
            if (!has_checksums) {
                continue;
            }
            try {
                if (Checksum::file_crc32_hex(root_ / chunk) != record.chunk_checksums[i]) {
                    report.corrupt.push_back({entry.first, chunk});
                }
            } catch (const Error &err) {
                Logger::warning(err.what());
                report.corrupt.push_back({entry.first, chunk});
            }
        }
    }
    return report;
}

} // namespace lfsplit
