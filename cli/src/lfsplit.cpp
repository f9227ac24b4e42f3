#include "lfsplit/config.hpp"
#include "lfsplit/errors.hpp"
#include "lfsplit/logger.hpp"
#include "lfsplit/manager.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace {

void print_status(const lfsplit::Manager &manager) {
    const auto report = manager.status();
    const auto &store_file = manager.tracker().store_file();
    if (report.records.empty()) {
        std::cout << "No split info file found or it is empty: " << store_file.string() << std::endl;
        return;
    }
    std::cout << "Split info file exists: " << store_file.string() << std::endl;
    std::cout << "Number of split files: " << report.records.size() << std::endl;
    std::cout << "Original files:" << std::endl;
    for (const auto &record : report.records) {
        std::cout << "  " << record.original_path << " -> " << record.chunk_count << " parts ("
                  << record.chunks_present << " present, original "
                  << (record.original_present ? "present" : "missing") << ')' << std::endl;
    }
}

int run_verify(const lfsplit::Manager &manager) {
    const auto report = manager.verify();
    if (report.ok()) {
        std::cout << "All split files are present" << std::endl;
        return EXIT_SUCCESS;
    }
    if (!report.missing.empty()) {
        std::cout << "Missing split files:" << std::endl;
        for (const auto &problem : report.missing) {
            std::cout << "  " << problem.chunk_path << " (" << problem.original_path << ')' << std::endl;
        }
    }
    if (!report.corrupt.empty()) {
        std::cout << "Split files with checksum mismatch:" << std::endl;
        for (const auto &problem : report.corrupt) {
            std::cout << "  " << problem.chunk_path << " (" << problem.original_path << ')' << std::endl;
        }
    }
    return EXIT_FAILURE;
}

int run(const lfsplit::Config &config) {
    const lfsplit::Manager manager(config);
    if (config.command == "build") {
        manager.build();
    } else if (config.command == "all") {
        manager.merge_all();
    } else if (config.command == "clean") {
        manager.clean();
    } else if (config.command == "rebuild") {
        manager.clean();
        manager.build();
    } else if (config.command == "status") {
        print_status(manager);
    } else if (config.command == "verify") {
        return run_verify(manager);
    } else {
        std::ostringstream oss;
        oss << "unknown command: " << config.command;
        throw lfsplit::ConfigError(oss.str());
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << lfsplit::usage();
        return EXIT_FAILURE;
    }

    lfsplit::Config config;
    try {
        config = lfsplit::parse_command_line(argc, argv);
    } catch (const lfsplit::ConfigError &err) {
        lfsplit::Logger::error(err.what());
        std::cerr << lfsplit::usage();
        return EXIT_FAILURE;
    }
    if (config.command == "help") {
        std::cout << lfsplit::usage();
        return EXIT_SUCCESS;
    }
    lfsplit::Logger::set_quiet(config.quiet);

    try {
        return run(config);
    } catch (const std::exception &err) {
        lfsplit::Logger::error(err.what());
        return EXIT_FAILURE;
    }
}
