#include "lfsplit/ignore_list.hpp"

#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"

#include <cctype>
#include <fstream>
#include <set>

namespace lfsplit {

namespace {

std::string trim(const std::string &line) {
    std::size_t begin = 0;
    while (begin < line.size() && std::isspace(static_cast<unsigned char>(line[begin]))) {
        ++begin;
    }
    std::size_t end = line.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) {
        --end;
    }
    return line.substr(begin, end - begin);
}

std::set<std::string> read_entries(const std::filesystem::path &file) {
    std::set<std::string> entries;
    std::ifstream in(file);
    if (!in) {
        return entries;
    }
    std::string line;
    while (std::getline(in, line)) {
        auto entry = trim(line);
        if (!entry.empty()) {
            entries.insert(std::move(entry));
        }
    }
    return entries;
}

} // namespace

IgnoreList::IgnoreList(std::filesystem::path root, std::filesystem::path file)
    : root_(std::move(root)), file_(std::move(file)) {
    if (file_.is_relative()) {
        file_ = root_ / file_;
    }
}

std::string IgnoreList::relative_entry(const std::string &path) const {
    namespace fs = std::filesystem;
    const fs::path candidate(path);
    fs::path relative;
    if (candidate.is_absolute()) {
        relative = candidate.lexically_normal().lexically_relative(fs::absolute(root_).lexically_normal());
    } else {
        relative = candidate.lexically_normal();
    }
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        throw PathOutsideRootError(path + " is not inside " + root_.string());
    }
    return relative.generic_string();
}

std::size_t IgnoreList::add_paths(const std::vector<std::string> &paths) const {
    if (paths.empty()) {
        return 0;
    }
    auto entries = read_entries(file_);
    std::size_t added = 0;
    for (const auto &path : paths) {
        try {
            if (entries.insert(relative_entry(path)).second) {
                ++added;
            }
        } catch (const PathOutsideRootError &err) {
            Logger::error(std::string("not adding to ") + file_.filename().string() + ": " + err.what());
        }
    }

    std::ofstream out(file_, std::ios::trunc);
    if (!out) {
        throw Error("failed to open " + file_.string() + " for writing");
    }
    for (const auto &entry : entries) {
        out << entry << '\n';
    }
    out.close();
    if (!out) {
        throw Error("failed to write " + file_.string());
    }
    Logger::info("Added " + std::to_string(added) + " files to " + file_.filename().string());
    return added;
}

std::vector<std::string> IgnoreList::entries() const {
    const auto entries = read_entries(file_);
    return {entries.begin(), entries.end()};
}

const std::filesystem::path &IgnoreList::file() const noexcept { return file_; }

} // namespace lfsplit
