#include "lfsplit/config.hpp"

#include "lfsplit/errors.hpp"
#include "lfsplit/size_parser.hpp"

#include <set>
#include <sstream>

namespace lfsplit {

namespace {

const std::set<std::string> &known_commands() {
    static const std::set<std::string> commands{"build", "all",     "merge-all", "clean",
                                                "status", "verify", "rebuild",   "help"};
    return commands;
}

std::size_t parse_jobs(const std::string &text) {
    std::size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &consumed);
    } catch (const std::exception &) {
        throw ConfigError("invalid --jobs value: " + text);
    }
    if (consumed != text.size() || value == 0 || text.front() == '-') {
        throw ConfigError("--jobs must be a positive integer, got " + text);
    }
    return static_cast<std::size_t>(value);
}

} // namespace

Config parse_command_line(int argc, const char *const *argv) {
    Config config;
    if (argc < 2) {
        return config;
    }
    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        command = "help";
    }
    if (known_commands().count(command) == 0) {
        throw ConfigError("unknown command: " + command);
    }
    config.command = command == "merge-all" ? "all" : command;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw ConfigError(oss.str());
        }
        const std::string value = argv[++i];
        if (arg == "--size-limit") {
            config.size_limit_bytes = parse_size(value);
        } else if (arg == "--split-info") {
            config.split_info = value;
        } else if (arg == "--ignore-file") {
            config.ignore_file = value;
        } else if (arg == "--root") {
            config.root = value;
        } else if (arg == "--jobs" || arg == "-j") {
            config.jobs = parse_jobs(value);
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }
    return config;
}

std::string usage() {
    return "Usage: lfsplit <command> [options]\n"
           "\n"
           "Commands:\n"
           "  build    - Find files over the size limit, split them, add them to the ignore file "
           "(originals are kept)\n"
           "  all      - Merge split files back into the original files (ignore file and split info are "
           "not modified)\n"
           "  clean    - Remove all split files and the split info file\n"
           "  status   - Show the files recorded in the split info\n"
           "  verify   - Check that every recorded split file is present and intact\n"
           "  rebuild  - clean, then build\n"
           "  help     - Show this help message\n"
           "\n"
           "Options:\n"
           "  --size-limit <size>   split files larger than this (default: 100M)\n"
           "  --split-info <file>   split information file (default: split_files_info.json)\n"
           "  --ignore-file <file>  ignore list to update (default: .gitignore)\n"
           "  --root <dir>          working tree root (default: .)\n"
           "  --jobs <n>            files processed in parallel (default: 1)\n"
           "  --quiet               only print warnings and errors\n"
           "\n"
           "Note: 'build' skips files that are already split\n"
           "Note: 'all' reconstructs files but leaves the ignore file and split info unchanged\n";
}

} // namespace lfsplit
