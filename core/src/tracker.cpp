#include "lfsplit/tracker.hpp"

#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace lfsplit {

using json = nlohmann::json;

void to_json(json &j, const SplitRecord &record) {
    j = json{{"original_file", record.original_path},
             {"original_size", record.original_size},
             {"split_prefix", record.chunk_prefix},
             {"split_files", record.chunk_paths},
             {"split_count", record.chunk_count}};
    if (!record.chunk_checksums.empty()) {
        j["split_checksums"] = record.chunk_checksums;
    }
}

void from_json(const json &j, SplitRecord &record) {
    if (!j.is_object()) {
        throw CorruptStoreError("split record is not an object");
    }
    record.original_path = j.value("original_file", std::string{});
    record.original_size = j.value("original_size", std::uint64_t{0});
    record.chunk_prefix = j.value("split_prefix", std::string{});
    record.chunk_paths = j.value("split_files", std::vector<std::string>{});
    record.chunk_count = j.value("split_count", static_cast<std::uint32_t>(record.chunk_paths.size()));
    record.chunk_checksums = j.value("split_checksums", std::vector<std::string>{});
}

namespace {

std::string join(const std::vector<std::string> &items) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << items[i];
    }
    oss << ']';
    return oss.str();
}

} // namespace

Tracker::Tracker(std::filesystem::path root, std::filesystem::path store_file)
    : root_(std::move(root)), store_file_(std::move(store_file)) {
    if (store_file_.is_relative()) {
        store_file_ = root_ / store_file_;
    }
}

TrackerStore Tracker::load() const {
    if (!std::filesystem::exists(store_file_)) {
        Logger::info("No split info found at " + store_file_.string());
        return {};
    }
    try {
        return load_strict();
    } catch (const CorruptStoreError &err) {
        Logger::warning("ignoring unreadable split info " + store_file_.string() + ": " + err.what());
        return {};
    }
}

TrackerStore Tracker::load_strict() const {
    TrackerStore store;
    std::ifstream in(store_file_);
    if (!in) {
        if (!std::filesystem::exists(store_file_)) {
            return store;
        }
        throw CorruptStoreError("cannot open " + store_file_.string());
    }
    try {
        const json document = json::parse(in);
        if (!document.is_object()) {
            throw CorruptStoreError("top-level value is not an object");
        }
        for (const auto &item : document.items()) {
            auto record = item.value().get<SplitRecord>();
            // The key decides where the file is merged to and how it is reported.
            record.original_path = item.key();
            store.emplace(item.key(), std::move(record));
        }
    } catch (const json::exception &err) {
        throw CorruptStoreError(err.what());
    }
    return store;
}

SplitCheck Tracker::check_already_split(const TrackerStore &store, const std::string &path) const {
    SplitCheck check;
    const auto found = store.find(path);
    if (found == store.end()) {
        return check;
    }
    const SplitRecord &record = found->second;
    check.record = record;

    std::vector<std::string> missing;
    for (const auto &chunk : record.chunk_paths) {
        if (!std::filesystem::exists(root_ / chunk)) {
            missing.push_back(chunk);
        }
    }
    if (!missing.empty()) {
        Logger::warning("some split files missing for " + path + ": " + join(missing));
        return check;
    }

    std::error_code ec;
    const auto current_size = std::filesystem::file_size(root_ / path, ec);
    if (!ec && current_size == record.original_size) {
        check.state = SplitState::SplitValid;
        return check;
    }
    std::ostringstream oss;
    oss << path << " size changed since last split (was " << record.original_size << ", now ";
    if (ec) {
        oss << "unreadable";
    } else {
        oss << current_size;
    }
    oss << ')';
    Logger::warning(oss.str());
    check.state = SplitState::SplitStale;
    return check;
}

TrackerStore Tracker::merge(TrackerStore store, const TrackerStore &new_records) const {
    for (const auto &entry : new_records) {
        store[entry.first] = entry.second;
    }
    persist(store);
    Logger::info("Updated split information in " + store_file_.string());
    return store;
}

std::vector<std::string> Tracker::all_chunk_paths(const TrackerStore &store) const {
    std::vector<std::string> chunks;
    for (const auto &entry : store) {
        for (const auto &chunk : entry.second.chunk_paths) {
            if (std::filesystem::exists(root_ / chunk)) {
                chunks.push_back(chunk);
            }
        }
    }
    return chunks;
}

bool Tracker::remove_store() const {
    std::error_code ec;
    const bool removed = std::filesystem::remove(store_file_, ec);
    if (ec) {
        throw StoreWriteError("failed to remove " + store_file_.string() + ": " + ec.message());
    }
    return removed;
}

const std::filesystem::path &Tracker::store_file() const noexcept { return store_file_; }

const std::filesystem::path &Tracker::root() const noexcept { return root_; }

void Tracker::persist(const TrackerStore &store) const {
    json document = json::object();
    for (const auto &entry : store) {
        document[entry.first] = entry.second;
    }
    const std::string text = document.dump(2);

    auto temp_file = store_file_;
    temp_file += ".tmp";
    {
        std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreWriteError("failed to open " + temp_file.string() + " for writing");
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_file, ignored);
            throw StoreWriteError("failed to write " + temp_file.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_file, store_file_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_file, ignored);
        throw StoreWriteError("failed to replace " + store_file_.string() + ": " + ec.message());
    }
}

} // namespace lfsplit
