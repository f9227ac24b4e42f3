#include "lfsplit/cleaner.hpp"
#include "lfsplit/logger.hpp"
#include "lfsplit/splitter.hpp"
#include "lfsplit/tracker.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <vector>

namespace {

void write_bytes(const std::filesystem::path &path, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    std::vector<char> data(size, '\x07');
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    lfsplit::Logger::set_quiet(true);
    auto temp_dir = fs::temp_directory_path() / "lfsplit_cleaner_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);

    const lfsplit::Tracker tracker(temp_dir, "split_files_info.json");
    const lfsplit::Cleaner cleaner(tracker);

    // Nothing to clean.
    auto summary = cleaner.clean();
    assert(summary.chunks_removed == 0);
    assert(!summary.store_removed);

    const lfsplit::Splitter splitter(temp_dir, lfsplit::kChunkHeadroomBytes + 100);
    write_bytes(temp_dir / "one.bin", 250);
    write_bytes(temp_dir / "two.bin", 150);
    lfsplit::TrackerStore records;
    records["one.bin"] = splitter.split("one.bin");
    records["two.bin"] = splitter.split("two.bin");
    tracker.merge({}, records);

    // One chunk already gone; unrelated files stay.
    fs::remove(temp_dir / "two_split_001");
    write_bytes(temp_dir / "unrelated_split_000", 10);

    summary = cleaner.clean();
    assert(summary.chunks_removed == 4);
    assert(summary.store_removed);
    assert(!fs::exists(tracker.store_file()));
    assert(!fs::exists(temp_dir / "one_split_000"));
    assert(!fs::exists(temp_dir / "one_split_002"));
    assert(!fs::exists(temp_dir / "two_split_000"));
    assert(fs::exists(temp_dir / "one.bin"));
    assert(fs::exists(temp_dir / "two.bin"));
    assert(fs::exists(temp_dir / "unrelated_split_000"));

    // Idempotent.
    summary = cleaner.clean();
    assert(summary.chunks_removed == 0);
    assert(!summary.store_removed);

    fs::remove_all(temp_dir);
    return 0;
}
