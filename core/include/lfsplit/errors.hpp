#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace lfsplit {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg) : Error(msg) {}
};

class InvalidSizeError : public ConfigError {
  public:
    explicit InvalidSizeError(const std::string &msg) : ConfigError(msg) {}
};

class CorruptStoreError : public Error {
  public:
    explicit CorruptStoreError(const std::string &msg) : Error(msg) {}
};

class StoreWriteError : public Error {
  public:
    explicit StoreWriteError(const std::string &msg) : Error(msg) {}
};

class SplitIOError : public Error {
  public:
    explicit SplitIOError(const std::string &msg) : Error(msg) {}
};

class MergeError : public Error {
  public:
    explicit MergeError(const std::string &msg) : Error(msg) {}
};

class MissingChunksError : public MergeError {
  public:
    MissingChunksError(const std::string &original, std::vector<std::string> missing);

    const std::vector<std::string> &missing() const noexcept { return missing_; }

  private:
    std::vector<std::string> missing_;
};

class SizeMismatchError : public MergeError {
  public:
    SizeMismatchError(const std::string &original, std::uint64_t expected, std::uint64_t actual);

    std::uint64_t expected() const noexcept { return expected_; }
    std::uint64_t actual() const noexcept { return actual_; }

  private:
    std::uint64_t expected_;
    std::uint64_t actual_;
};

class MergeIOError : public MergeError {
  public:
    explicit MergeIOError(const std::string &msg) : MergeError(msg) {}
};

class PathOutsideRootError : public Error {
  public:
    explicit PathOutsideRootError(const std::string &msg) : Error(msg) {}
};

} // namespace lfsplit
