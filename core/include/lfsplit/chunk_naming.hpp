#pragma once

#include <cstddef>
#include <string>

namespace lfsplit {

// "data/models/big.bin" -> "data_models_big_split_"
std::string chunk_prefix(const std::string &original_path);

// prefix + zero-padded index, e.g. "data_models_big_split_007".
std::string chunk_name(const std::string &prefix, std::size_t index);

} // namespace lfsplit
