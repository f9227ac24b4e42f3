#include "lfsplit/config.hpp"
#include "lfsplit/errors.hpp"

#include <cassert>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

lfsplit::Config parse(std::initializer_list<const char *> args) {
    std::vector<const char *> argv{"lfsplit"};
    argv.insert(argv.end(), args.begin(), args.end());
    return lfsplit::parse_command_line(static_cast<int>(argv.size()), argv.data());
}

bool rejects(std::initializer_list<const char *> args) {
    try {
        parse(args);
    } catch (const lfsplit::ConfigError &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    auto config = parse({});
    assert(config.command == "help");

    config = parse({"build"});
    assert(config.command == "build");
    assert(config.size_limit_bytes == 100u * 1024u * 1024u);
    assert(config.split_info == "split_files_info.json");
    assert(config.ignore_file == ".gitignore");
    assert(config.root == ".");
    assert(config.jobs == 1);
    assert(!config.quiet);

    config = parse({"build", "--size-limit", "50M", "--split-info", "info.json", "--ignore-file", ".hgignore",
                    "--root", "/data/repo", "--jobs", "4", "--quiet"});
    assert(config.size_limit_bytes == 50u * 1024u * 1024u);
    assert(config.split_info == "info.json");
    assert(config.ignore_file == ".hgignore");
    assert(config.root == "/data/repo");
    assert(config.jobs == 4);
    assert(config.quiet);

    assert(parse({"merge-all"}).command == "all");
    assert(parse({"all"}).command == "all");
    assert(parse({"--help"}).command == "help");
    assert(parse({"verify", "-j", "2"}).jobs == 2);

    assert(rejects({"explode"}));
    assert(rejects({"build", "--size-limit"}));
    assert(rejects({"build", "--size-limit", "lots"}));
    assert(rejects({"build", "--jobs", "0"}));
    assert(rejects({"build", "--jobs", "-3"}));
    assert(rejects({"build", "--jobs", "2x"}));
    assert(rejects({"build", "--frobnicate", "1"}));

    assert(lfsplit::usage().find("rebuild") != std::string::npos);
    return 0;
}
