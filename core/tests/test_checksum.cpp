#include "lfsplit/checksum.hpp"
#include "lfsplit/errors.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <vector>

int main() {
    namespace fs = std::filesystem;

    std::vector<char> data{'a', 'b', 'c'};
    assert(lfsplit::Checksum::crc32(data) == 0x352441C2u);
    assert(lfsplit::Checksum::to_hex(0x352441C2u) == "352441c2");
    assert(lfsplit::Checksum::crc32({}) == 0u);

    lfsplit::Checksum::Crc32Accumulator accumulator;
    accumulator.update(data.data(), 2);
    accumulator.update(nullptr, 5);
    accumulator.update(data.data() + 2, data.size() - 2);
    assert(accumulator.value() == 0x352441C2u);
    assert(accumulator.hex() == "352441c2");

    auto temp_dir = fs::temp_directory_path() / "lfsplit_checksum_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    {
        std::ofstream file(temp_dir / "check.txt", std::ios::binary);
        file << "123456789";
    }
    assert(lfsplit::Checksum::file_crc32_hex(temp_dir / "check.txt") == "cbf43926");

    bool threw = false;
    try {
        lfsplit::Checksum::file_crc32_hex(temp_dir / "absent");
    } catch (const lfsplit::Error &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(temp_dir);
    return 0;
}
