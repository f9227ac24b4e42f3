#include "lfsplit/merger.hpp"

#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"
#include "lfsplit/size_parser.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace lfsplit {

namespace {

constexpr std::size_t kMergeBufferSize = 1024 * 1024;

void discard_partial(const std::filesystem::path &target) {
    std::error_code ec;
    std::filesystem::remove(target, ec);
    if (ec) {
        Logger::warning("could not remove " + target.string() + ": " + ec.message());
    }
}

} // namespace

Merger::Merger(std::filesystem::path root) : root_(std::move(root)) {}

MergeOutcome Merger::merge(const SplitRecord &record) const {
    const auto &original = record.original_path;
    const auto target = root_ / original;
    Logger::info("Merging " + original + "...");

    std::vector<std::string> missing;
    for (const auto &chunk : record.chunk_paths) {
        if (!std::filesystem::exists(root_ / chunk)) {
            missing.push_back(chunk);
        }
    }
    if (!missing.empty()) {
        throw MissingChunksError(original, std::move(missing));
    }

    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        const auto current_size = std::filesystem::file_size(target, ec);
        if (!ec && current_size == record.original_size) {
            Logger::info("Original file " + original + " already exists with correct size, skipping merge");
            remove_chunks(record);
            return MergeOutcome::AlreadyPresent;
        }
        std::ostringstream oss;
        oss << "original file " << original << " exists but size mismatch: expected " << record.original_size
            << ", got ";
        if (ec) {
            oss << "unreadable";
        } else {
            oss << current_size;
        }
        oss << "; recreating it from split files";
        Logger::warning(oss.str());
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw MergeIOError("failed to create directory for " + original + ": " + ec.message());
    }
    {
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw MergeIOError("failed to open " + original + " for writing");
        }
        std::vector<char> buffer(kMergeBufferSize);
        for (const auto &chunk : record.chunk_paths) {
            std::ifstream input(root_ / chunk, std::ios::binary);
            if (!input) {
                output.close();
                discard_partial(target);
                throw MergeIOError("failed to open split file " + chunk);
            }
            while (input) {
                input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto read = input.gcount();
                if (read <= 0) {
                    break;
                }
                output.write(buffer.data(), read);
                if (!output) {
                    output.close();
                    discard_partial(target);
                    throw MergeIOError("failed to write " + original);
                }
            }
            if (input.bad()) {
                output.close();
                discard_partial(target);
                throw MergeIOError("failed to read split file " + chunk);
            }
        }
        output.close();
        if (!output) {
            discard_partial(target);
            throw MergeIOError("failed to close " + original);
        }
    }

    const auto merged_size = std::filesystem::file_size(target, ec);
    if (ec || merged_size != record.original_size) {
        discard_partial(target);
        throw SizeMismatchError(original, record.original_size, ec ? 0 : merged_size);
    }

    Logger::info("Successfully merged " + original + " (" + format_megabytes(merged_size) + ")");
    remove_chunks(record);
    return MergeOutcome::Merged;
}

void Merger::remove_chunks(const SplitRecord &record) const {
    for (const auto &chunk : record.chunk_paths) {
        std::error_code ec;
        if (std::filesystem::remove(root_ / chunk, ec)) {
            Logger::info("Removed " + chunk);
        } else if (ec) {
            Logger::warning("could not remove " + chunk + ": " + ec.message());
        }
    }
}

} // namespace lfsplit
