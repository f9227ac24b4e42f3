#include "lfsplit/splitter.hpp"

#include "lfsplit/checksum.hpp"
#include "lfsplit/chunk_naming.hpp"
#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"
#include "lfsplit/size_parser.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace lfsplit {

namespace {

constexpr std::size_t kCopyBufferSize = 4 * 1024 * 1024;

void remove_written(const std::filesystem::path &root, const std::vector<std::string> &chunks) {
    for (const auto &chunk : chunks) {
        std::error_code ec;
        std::filesystem::remove(root / chunk, ec);
        if (ec) {
            Logger::warning("could not remove partial split file " + chunk + ": " + ec.message());
        }
    }
}

} // namespace

Splitter::Splitter(std::filesystem::path root, std::uint64_t chunk_limit_bytes) : root_(std::move(root)) {
    if (chunk_limit_bytes <= kChunkHeadroomBytes) {
        throw ConfigError("size limit must be larger than " + std::to_string(kChunkHeadroomBytes) +
                          " bytes, got " + std::to_string(chunk_limit_bytes));
    }
    chunk_size_bytes_ = chunk_limit_bytes - kChunkHeadroomBytes;
}

SplitRecord Splitter::split(const std::string &path) const {
    Logger::info("Splitting " + path + "...");
    const auto source_path = root_ / path;

    SplitRecord record;
    record.original_path = path;
    record.chunk_prefix = chunk_prefix(path);

    // Every chunk that reaches the disk is recorded before it is written so that
    // a failure part way through a chunk still cleans it up.
    std::vector<std::string> written;
    try {
        std::ifstream input(source_path, std::ios::binary);
        if (!input) {
            throw SplitIOError("failed to open " + path + " for reading");
        }

        std::vector<char> buffer(static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_bytes_, kCopyBufferSize)));
        for (std::size_t index = 0;; ++index) {
            input.read(buffer.data(), static_cast<std::streamsize>(
                                          std::min<std::uint64_t>(buffer.size(), chunk_size_bytes_)));
            auto read = input.gcount();
            if (input.bad()) {
                throw SplitIOError("failed to read " + path);
            }
            if (read <= 0) {
                break;
            }

            const auto chunk = chunk_name(record.chunk_prefix, index);
            if (std::filesystem::exists(root_ / chunk) && !std::filesystem::is_regular_file(root_ / chunk)) {
                throw SplitIOError("cannot write split file " + chunk + ": not a regular file");
            }
            written.push_back(chunk);
            std::ofstream output(root_ / chunk, std::ios::binary | std::ios::trunc);
            if (!output) {
                throw SplitIOError("failed to create split file " + chunk);
            }

            Checksum::Crc32Accumulator crc;
            std::uint64_t chunk_bytes = 0;
            while (read > 0) {
                output.write(buffer.data(), read);
                if (!output) {
                    throw SplitIOError("failed to write split file " + chunk);
                }
                crc.update(buffer.data(), static_cast<std::size_t>(read));
                chunk_bytes += static_cast<std::uint64_t>(read);

                const auto remaining = chunk_size_bytes_ - chunk_bytes;
                if (remaining == 0) {
                    break;
                }
                input.read(buffer.data(), static_cast<std::streamsize>(
                                              std::min<std::uint64_t>(buffer.size(), remaining)));
                read = input.gcount();
                if (input.bad()) {
                    throw SplitIOError("failed to read " + path);
                }
            }
            output.close();
            if (!output) {
                throw SplitIOError("failed to close split file " + chunk);
            }

            record.chunk_paths.push_back(chunk);
            record.chunk_checksums.push_back(crc.hex());
            Logger::info("  Created " + chunk + ": " + format_megabytes(chunk_bytes));
            if (input.eof()) {
                break;
            }
        }

        std::error_code ec;
        record.original_size = std::filesystem::file_size(source_path, ec);
        if (ec) {
            throw SplitIOError("failed to stat " + path + ": " + ec.message());
        }
    } catch (const SplitIOError &) {
        remove_written(root_, written);
        throw;
    } catch (const std::exception &err) {
        remove_written(root_, written);
        throw SplitIOError("error splitting " + path + ": " + err.what());
    }

    record.chunk_count = static_cast<std::uint32_t>(record.chunk_paths.size());
    Logger::info("Split " + path + " into " + std::to_string(record.chunk_count) + " parts");
    return record;
}

std::uint64_t Splitter::chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

} // namespace lfsplit
