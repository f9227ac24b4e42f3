#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"
#include "lfsplit/tracker.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

void write_text(const std::filesystem::path &path, const std::string &text) {
    std::ofstream file(path, std::ios::binary);
    file << text;
}

void write_bytes(const std::filesystem::path &path, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    std::vector<char> data(size, '\x05');
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

lfsplit::SplitRecord make_record(const std::string &path, std::uint64_t size,
                                 const std::vector<std::string> &chunks) {
    lfsplit::SplitRecord record;
    record.original_path = path;
    record.original_size = size;
    record.chunk_prefix = "prefix_split_";
    record.chunk_paths = chunks;
    record.chunk_count = static_cast<std::uint32_t>(chunks.size());
    return record;
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    lfsplit::Logger::set_quiet(true);
    auto temp_dir = fs::temp_directory_path() / "lfsplit_tracker_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);

    lfsplit::Tracker tracker(temp_dir, "split_files_info.json");
    assert(tracker.store_file() == temp_dir / "split_files_info.json");

    // No store yet.
    assert(tracker.load().empty());
    assert(tracker.load_strict().empty());
    assert(!tracker.remove_store());

    // Persist, reload, accumulate.
    lfsplit::TrackerStore first;
    first["a.bin"] = make_record("a.bin", 10, {"a_split_000", "a_split_001"});
    first["a.bin"].chunk_checksums = {"00000001", "00000002"};
    auto store = tracker.merge({}, first);
    assert(fs::exists(tracker.store_file()));
    assert(!fs::exists(temp_dir / "split_files_info.json.tmp"));

    lfsplit::TrackerStore second;
    second["b.bin"] = make_record("b.bin", 20, {"b_split_000"});
    store = tracker.merge(tracker.load(), second);
    assert(store.size() == 2);

    auto loaded = tracker.load_strict();
    assert(loaded.size() == 2);
    assert(loaded.at("a.bin").original_size == 10);
    assert(loaded.at("a.bin").chunk_count == 2);
    assert(loaded.at("a.bin").chunk_prefix == "prefix_split_");
    assert((loaded.at("a.bin").chunk_paths == std::vector<std::string>{"a_split_000", "a_split_001"}));
    assert((loaded.at("a.bin").chunk_checksums == std::vector<std::string>{"00000001", "00000002"}));
    assert(loaded.at("b.bin").chunk_checksums.empty());

    // Same key replaces, others survive.
    lfsplit::TrackerStore replacement;
    replacement["a.bin"] = make_record("a.bin", 30, {"a_split_000"});
    store = tracker.merge(tracker.load(), replacement);
    loaded = tracker.load();
    assert(loaded.size() == 2);
    assert(loaded.at("a.bin").original_size == 30);
    assert(loaded.at("a.bin").chunk_count == 1);
    assert(loaded.at("b.bin").original_size == 20);

    // Classification.
    write_bytes(temp_dir / "a.bin", 30);
    write_bytes(temp_dir / "a_split_000", 30);
    auto check = tracker.check_already_split(loaded, "a.bin");
    assert(check.state == lfsplit::SplitState::SplitValid);
    assert(check.record && check.record->original_size == 30);

    write_bytes(temp_dir / "a.bin", 31);
    check = tracker.check_already_split(loaded, "a.bin");
    assert(check.state == lfsplit::SplitState::SplitStale);
    assert(fs::exists(temp_dir / "a_split_000"));

    check = tracker.check_already_split(loaded, "b.bin");
    assert(check.state == lfsplit::SplitState::NotSplit);
    assert(check.record.has_value());

    check = tracker.check_already_split(loaded, "c.bin");
    assert(check.state == lfsplit::SplitState::NotSplit);
    assert(!check.record.has_value());

    // Only chunks present on disk are reported.
    assert((tracker.all_chunk_paths(loaded) == std::vector<std::string>{"a_split_000"}));

    // Unknown fields are ignored and missing ones take defaults.
    write_text(tracker.store_file(), R"({
  "old.bin": {
    "original_file": "old.bin",
    "original_size": 5,
    "split_prefix": "old_split_",
    "split_files": ["old_split_000"],
    "split_count": 1,
    "tool_version": "2.0",
    "extra": {"nested": true}
  },
  "bare.bin": {},
  "renamed.bin": {
    "original_file": "elsewhere.bin",
    "original_size": 7,
    "split_files": []
  }
})");
    loaded = tracker.load_strict();
    assert(loaded.size() == 3);
    // The key wins over original_file.
    assert(loaded.at("renamed.bin").original_path == "renamed.bin");
    assert(loaded.at("old.bin").chunk_paths.size() == 1);
    assert(loaded.at("bare.bin").original_path == "bare.bin");
    assert(loaded.at("bare.bin").original_size == 0);
    assert(loaded.at("bare.bin").chunk_count == 0);

    // Corrupt stores: strict load throws, load recovers with an empty store.
    const std::vector<std::string> corrupt{"{not json", "[1, 2, 3]", R"({"x": 5})",
                                           R"({"x": {"split_files": "nope"}})"};
    for (const auto &text : corrupt) {
        write_text(tracker.store_file(), text);
        bool threw = false;
        try {
            tracker.load_strict();
        } catch (const lfsplit::CorruptStoreError &) {
            threw = true;
        }
        assert(threw);
        assert(tracker.load().empty());
    }

    assert(tracker.remove_store());
    assert(!fs::exists(tracker.store_file()));

    // A store that cannot be written is a hard failure and leaves no temp file behind.
    lfsplit::Tracker unwritable(temp_dir, temp_dir / "no_such_dir" / "store.json");
    bool threw = false;
    try {
        unwritable.merge({}, first);
    } catch (const lfsplit::StoreWriteError &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(temp_dir);
    return 0;
}
