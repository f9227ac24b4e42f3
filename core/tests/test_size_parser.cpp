#include "lfsplit/errors.hpp"
#include "lfsplit/size_parser.hpp"

#include <cassert>
#include <string>

namespace {

bool rejects(const std::string &text) {
    try {
        lfsplit::parse_size(text);
    } catch (const lfsplit::InvalidSizeError &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    assert(lfsplit::parse_size("100M") == 100u * 1024u * 1024u);
    assert(lfsplit::parse_size("1G") == 1024ull * 1024ull * 1024ull);
    assert(lfsplit::parse_size("512K") == 512u * 1024u);
    assert(lfsplit::parse_size("512k") == 512u * 1024u);
    assert(lfsplit::parse_size("1048576") == 1048576u);
    assert(lfsplit::parse_size(" 2M ") == 2u * 1024u * 1024u);
    assert(lfsplit::parse_size("0") == 0u);

    assert(rejects(""));
    assert(rejects("M"));
    assert(rejects("abcM"));
    assert(rejects("1.5G"));
    assert(rejects("10T"));
    assert(rejects("-5M"));
    assert(rejects("99999999999999999999"));
    assert(rejects("99999999999G"));

    // InvalidSizeError is reported as a configuration problem.
    bool config_error = false;
    try {
        lfsplit::parse_size("x");
    } catch (const lfsplit::ConfigError &) {
        config_error = true;
    }
    assert(config_error);

    assert(lfsplit::format_megabytes(0) == "0.0MB");
    assert(lfsplit::format_megabytes(1024u * 1024u + 512u * 1024u) == "1.5MB");
    return 0;
}
