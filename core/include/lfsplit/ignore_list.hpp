#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lfsplit {

// Line-per-path exclusion file (".gitignore" by default). Entries are only ever added.
class IgnoreList {
  public:
    IgnoreList(std::filesystem::path root, std::filesystem::path file);

    // Adds paths relative to root; returns how many were not already listed.
    // A path outside root is reported and skipped.
    std::size_t add_paths(const std::vector<std::string> &paths) const;

    // Throws PathOutsideRootError when path cannot be expressed relative to root.
    std::string relative_entry(const std::string &path) const;

    std::vector<std::string> entries() const;

    const std::filesystem::path &file() const noexcept;

  private:
    std::filesystem::path root_;
    std::filesystem::path file_;
};

} // namespace lfsplit
