#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lfsplit {

struct Config {
    std::string command{"help"};
    std::filesystem::path root{"."};
    std::uint64_t size_limit_bytes{100u * 1024u * 1024u};
    std::filesystem::path split_info{"split_files_info.json"};
    std::filesystem::path ignore_file{".gitignore"};
    std::size_t jobs{1};
    bool quiet{false};
};

// argv[1] is the command, the rest are options. Throws ConfigError on bad input.
Config parse_command_line(int argc, const char *const *argv);

std::string usage();

} // namespace lfsplit
