#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lfsplit {

// CRC-32 (IEEE 802.3) used to fingerprint chunk files.
class Checksum {
  public:
    static std::uint32_t crc32(const std::vector<char> &data);

    static std::string to_hex(std::uint32_t crc);

    // Streams the file through an accumulator. Throws Error if it cannot be read.
    static std::string file_crc32_hex(const std::filesystem::path &path);

    class Crc32Accumulator {
      public:
        Crc32Accumulator();

        void update(const char *data, std::size_t size);

        std::uint32_t value() const;

        std::string hex() const;

      private:
        std::uint32_t crc_;
    };
};

} // namespace lfsplit
