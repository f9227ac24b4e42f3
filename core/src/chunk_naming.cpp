#include "lfsplit/chunk_naming.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace lfsplit {

std::string chunk_prefix(const std::string &original_path) {
    std::string flat = original_path;
    while (flat.rfind("./", 0) == 0 || flat.rfind(".\\", 0) == 0) {
        flat.erase(0, 2);
    }
    std::replace(flat.begin(), flat.end(), '/', '_');
    std::replace(flat.begin(), flat.end(), '\\', '_');
    if (!flat.empty() && flat.front() == '_') {
        flat.erase(0, 1);
    }
    return std::filesystem::path(flat).stem().string() + "_split_";
}

std::string chunk_name(const std::string &prefix, std::size_t index) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "%03zu", index);
    return prefix + suffix;
}

} // namespace lfsplit
