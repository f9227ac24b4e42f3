#include "lfsplit/errors.hpp"

#include <sstream>
#include <utility>

namespace lfsplit {

namespace {

std::string describe_missing(const std::string &original, const std::vector<std::string> &missing) {
    std::ostringstream oss;
    oss << "missing split files for " << original << ": [";
    for (std::size_t i = 0; i < missing.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << missing[i];
    }
    oss << ']';
    return oss.str();
}

std::string describe_mismatch(const std::string &original, std::uint64_t expected, std::uint64_t actual) {
    std::ostringstream oss;
    oss << "size mismatch for " << original << ": expected " << expected << ", got " << actual;
    return oss.str();
}

} // namespace

MissingChunksError::MissingChunksError(const std::string &original, std::vector<std::string> missing)
    : MergeError(describe_missing(original, missing)), missing_(std::move(missing)) {}

SizeMismatchError::SizeMismatchError(const std::string &original, std::uint64_t expected,
                                     std::uint64_t actual)
    : MergeError(describe_mismatch(original, expected, actual)), expected_(expected), actual_(actual) {}

} // namespace lfsplit
