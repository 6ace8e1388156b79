#ifndef TIMED_FILE_SYSTEM_HPP
#define TIMED_FILE_SYSTEM_HPP

#include "IFileSystem.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when a single filesystem call exceeds its time bound.
 */
class FileSystemTimeout : public std::runtime_error {
public:
    FileSystemTimeout(const std::string& operation, const std::filesystem::path& path)
        : std::runtime_error("Timed out waiting for " + operation + " on '" + path.string() + "'"),
          path_(path) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Decorator that bounds every call of the wrapped filesystem.
 *
 * Calls are queued to a group of detached workers that stay around between calls;
 * a new worker is added only when every existing one is busy. When the bound
 * elapses the caller gets FileSystemTimeout while the worker is left to finish (or
 * hang) on its own. The wrapped filesystem and the queue are shared with the workers
 * so they outlive abandoned calls.
 */
class TimedFileSystem : public IFileSystem {
public:
    TimedFileSystem(std::shared_ptr<IFileSystem> inner, std::chrono::milliseconds call_timeout);
    ~TimedFileSystem() override;

    TimedFileSystem(const TimedFileSystem&) = delete;
    TimedFileSystem& operator=(const TimedFileSystem&) = delete;

    bool path_exists(const std::filesystem::path& path) override;
    std::optional<EntryInfo> stat_entry(const std::filesystem::path& path) override;
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) override;
    std::optional<std::uintmax_t> free_space(const std::filesystem::path& volume_path) override;

    std::chrono::milliseconds call_timeout() const { return call_timeout_; }

private:
#ifdef TWINPANE_TEST_BUILD
    friend class TimedFileSystemTestAccess;
#endif
    struct CallQueue;

    template <typename Result, typename Call>
    Result run_bounded(const char* operation, const std::filesystem::path& path, Call call);

    void submit(std::function<void()> job);
    static void run_worker(std::shared_ptr<CallQueue> queue);

    std::shared_ptr<IFileSystem> inner_;
    std::chrono::milliseconds call_timeout_;
    std::shared_ptr<CallQueue> queue_;
};

#endif
