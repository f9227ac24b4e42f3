#pragma once

#include <string>

namespace lfsplit {

// Console logger shared by the library and the command-line tool. Info lines go to
// stdout, warnings and errors to stderr. Safe to call from worker threads.
class Logger {
  public:
    static void info(const std::string &msg);

    static void warning(const std::string &msg);

    static void error(const std::string &msg);

    static void set_quiet(bool quiet);
};

} // namespace lfsplit
