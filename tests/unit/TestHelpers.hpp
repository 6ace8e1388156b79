/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp trees, env guards, event collection).
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "EventChannel.hpp"
#include "TestHooks.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    /**
     * @brief Restore the original environment variable state.
     */
    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    /**
     * @brief Create a unique temporary directory.
     */
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("twinpane-test-")) {
        std::filesystem::create_directories(path_);
    }

    /**
     * @brief Remove the temporary directory and its contents.
     */
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    /**
     * @brief Return the temporary directory path.
     * @return Reference to the directory path.
     */
    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Create a subdirectory (and its parents) below the temp root.
     */
    std::filesystem::path make_dir(const std::string& relative) const {
        const auto dir = path_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write `size` bytes of `fill` to `path`, creating parent directories.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path,
                                        std::size_t size,
                                        char fill = 'x') {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    const std::string data(size, fill);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Wait for the terminal event of the subscription's operation.
 */
inline std::vector<EngineEvent> collect_events(const EventChannel::SubscriptionHandle& subscription,
                                               std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    return subscription->drain_until_terminal(timeout);
}

inline std::size_t count_terminal(const std::vector<EngineEvent>& events) {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
        [](const EngineEvent& event) { return event.terminal(); }));
}

inline std::vector<EngineEvent> events_of_kind(const std::vector<EngineEvent>& events, EventKind kind) {
    std::vector<EngineEvent> matching;
    for (const auto& event : events) {
        if (event.kind == kind) {
            matching.push_back(event);
        }
    }
    return matching;
}

/**
 * @brief Clears the TestHooks probes when a test case ends.
 */
struct ProbeGuard {
    ~ProbeGuard() {
        TestHooks::reset_transfer_item_probe();
        TestHooks::reset_copy_chunk_probe();
        TestHooks::reset_scan_entry_probe();
    }
};
