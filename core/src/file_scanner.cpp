#include "lfsplit/file_scanner.hpp"

#include "lfsplit/errors.hpp"

#include <algorithm>
#include <system_error>

namespace lfsplit {

namespace {

bool is_dot_directory(const std::filesystem::directory_entry &entry) {
    std::error_code ec;
    if (!entry.is_directory(ec) || ec) {
        return false;
    }
    const auto name = entry.path().filename().string();
    return !name.empty() && name.front() == '.';
}

} // namespace

FileScanner::FileScanner(std::uint64_t threshold_bytes) : threshold_bytes_(threshold_bytes) {}

std::vector<std::string> FileScanner::find_large_files(const std::filesystem::path &root) const {
    namespace fs = std::filesystem;
    if (!fs::is_directory(root)) {
        throw ConfigError("root is not a directory: " + root.string());
    }
    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ConfigError("cannot scan " + root.string() + ": " + ec.message());
    }
    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        const auto &entry = *it;
        if (is_dot_directory(entry)) {
            it.disable_recursion_pending();
            continue;
        }
        std::error_code stat_ec;
        if (!entry.is_regular_file(stat_ec) || stat_ec) {
            continue;
        }
        const auto size = entry.file_size(stat_ec);
        if (stat_ec || size <= threshold_bytes_) {
            continue;
        }
        files.push_back(entry.path().lexically_relative(root).generic_string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::uint64_t FileScanner::threshold_bytes() const noexcept { return threshold_bytes_; }

} // namespace lfsplit
