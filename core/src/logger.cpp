#include "lfsplit/logger.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace lfsplit {

namespace {

std::mutex &output_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool> quiet_flag{false};

} // namespace

void Logger::info(const std::string &msg) {
    if (quiet_flag.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cout << msg << std::endl;
}

void Logger::warning(const std::string &msg) {
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "warning: " << msg << std::endl;
}

void Logger::error(const std::string &msg) {
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "error: " << msg << std::endl;
}

void Logger::set_quiet(bool quiet) { quiet_flag.store(quiet); }

} // namespace lfsplit
