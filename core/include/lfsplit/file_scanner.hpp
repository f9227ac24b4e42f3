#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lfsplit {

class FileScanner {
  public:
    explicit FileScanner(std::uint64_t threshold_bytes);

    // Regular files under root strictly larger than the threshold, as sorted paths
    // relative to root. Directories whose name starts with '.' are not entered.
    std::vector<std::string> find_large_files(const std::filesystem::path &root) const;

    std::uint64_t threshold_bytes() const noexcept;

  private:
    std::uint64_t threshold_bytes_;
};

} // namespace lfsplit
