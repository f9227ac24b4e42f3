#include "lfsplit/checksum.hpp"

#include "lfsplit/errors.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace lfsplit {

namespace {

constexpr std::uint32_t kPolynomial = 0xEDB88320u;
constexpr std::uint32_t kInitial = 0xFFFFFFFFu;
constexpr std::size_t kReadBufferSize = 1u << 20;

std::array<std::uint32_t, 256> make_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t value = i;
        for (int bit = 0; bit < 8; ++bit) {
            value = (value & 1u) ? (value >> 1) ^ kPolynomial : value >> 1;
        }
        table[i] = value;
    }
    return table;
}

const std::array<std::uint32_t, 256> &table() {
    static const auto instance = make_table();
    return instance;
}

std::uint32_t advance(std::uint32_t crc, const char *data, std::size_t size) {
    const auto &lookup = table();
    for (std::size_t i = 0; i < size; ++i) {
        const auto byte = static_cast<unsigned char>(data[i]);
        crc = (crc >> 8) ^ lookup[(crc ^ byte) & 0xFFu];
    }
    return crc;
}

} // namespace

std::uint32_t Checksum::crc32(const std::vector<char> &data) {
    return advance(kInitial, data.data(), data.size()) ^ kInitial;
}

std::string Checksum::to_hex(std::uint32_t crc) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(8) << crc;
    return oss.str();
}

std::string Checksum::file_crc32_hex(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error("failed to open file for checksum: " + path.string());
    }
    Crc32Accumulator accumulator;
    std::vector<char> buffer(kReadBufferSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = file.gcount();
        if (read <= 0) {
            break;
        }
        accumulator.update(buffer.data(), static_cast<std::size_t>(read));
    }
    if (file.bad()) {
        throw Error("failed to read file for checksum: " + path.string());
    }
    return accumulator.hex();
}

Checksum::Crc32Accumulator::Crc32Accumulator() : crc_(kInitial) {}

void Checksum::Crc32Accumulator::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    crc_ = advance(crc_, data, size);
}

std::uint32_t Checksum::Crc32Accumulator::value() const { return crc_ ^ kInitial; }

std::string Checksum::Crc32Accumulator::hex() const { return to_hex(value()); }

} // namespace lfsplit
