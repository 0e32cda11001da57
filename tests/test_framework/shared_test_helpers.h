// tests/test_framework/shared_test_helpers.h
#pragma once

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for the unit tests: temporary directories, file I/O
 *        and polling for asynchronous outcomes.
 */
#include "mqttop_base.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace fs = std::filesystem;

namespace mqttop::tests::helper
{

/// Creates a unique directory under the system temp dir, removed on destruction.
class TempDir
{
  public:
    explicit TempDir(std::string_view prefix = "mqttop_test");
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const { return m_path; }
    fs::path operator/(std::string_view name) const { return m_path / name; }

  private:
    fs::path m_path;
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const fs::path &path, std::string &out);

/// Writes @p contents to @p path, creating parent directories. Throws on failure.
void write_file(const fs::path &path, std::string_view contents);

/**
 * @brief Counts the lines of @p text, optionally only those that include
 *        @p must_include and do not include @p must_exclude.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls @p pred until it returns true or @p timeout elapses.
 * @return The last value of @p pred.
 */
bool wait_until(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5),
                std::chrono::milliseconds poll = std::chrono::milliseconds(5));

/// Sets an environment variable for the lifetime of the object.
class ScopedEnv
{
  public:
    ScopedEnv(std::string name, const std::optional<std::string> &value);
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string m_name;
    std::optional<std::string> m_previous;
};

} // namespace mqttop::tests::helper
