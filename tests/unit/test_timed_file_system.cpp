#include <catch2/catch_test_macros.hpp>
#include "LocalFileSystem.hpp"
#include "TestHelpers.hpp"
#include "TimedFileSystem.hpp"
#include "TimedFileSystemTestAccess.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

namespace {

/**
 * @brief Filesystem whose calls block for a fixed delay, like a dead network mount.
 */
class SlowFileSystem : public IFileSystem {
public:
    explicit SlowFileSystem(std::chrono::milliseconds delay) : delay_(delay) {}

    bool path_exists(const std::filesystem::path&) override {
        std::this_thread::sleep_for(delay_);
        return true;
    }
    std::optional<EntryInfo> stat_entry(const std::filesystem::path&) override {
        std::this_thread::sleep_for(delay_);
        return EntryInfo{};
    }
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path&) override {
        std::this_thread::sleep_for(delay_);
        return {};
    }
    std::optional<std::uintmax_t> free_space(const std::filesystem::path&) override {
        std::this_thread::sleep_for(delay_);
        return 1;
    }

private:
    std::chrono::milliseconds delay_;
};

/**
 * @brief Local filesystem that hangs on one path only.
 */
class StuckPathFileSystem : public LocalFileSystem {
public:
    StuckPathFileSystem(std::filesystem::path stuck, std::chrono::milliseconds delay)
        : stuck_(std::move(stuck)), delay_(delay) {}

    std::optional<EntryInfo> stat_entry(const std::filesystem::path& path) override {
        if (path == stuck_) {
            std::this_thread::sleep_for(delay_);
        }
        return LocalFileSystem::stat_entry(path);
    }

private:
    std::filesystem::path stuck_;
    std::chrono::milliseconds delay_;
};

class FailingFileSystem : public LocalFileSystem {
public:
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) override {
        throw std::filesystem::filesystem_error("list_directory", path,
                                                std::make_error_code(std::errc::permission_denied));
    }
};

} // namespace

TEST_CASE("timed filesystem requires an inner filesystem") {
    CHECK_THROWS_AS(TimedFileSystem(nullptr, 100ms), std::invalid_argument);
}

TEST_CASE("calls that finish in time pass their result through") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "data.bin", 42);
    TimedFileSystem file_system(std::make_shared<LocalFileSystem>(), 2s);

    auto info = file_system.stat_entry(temp_dir.path() / "data.bin");
    REQUIRE(info.has_value());
    CHECK(info->is_regular);
    CHECK(info->size == 42);
    CHECK_FALSE(file_system.stat_entry(temp_dir.path() / "missing").has_value());
    CHECK(file_system.list_directory(temp_dir.path()).size() == 1);
    CHECK(file_system.free_space(temp_dir.path()).has_value());
}

TEST_CASE("a hanging call raises FileSystemTimeout with the path") {
    TimedFileSystem file_system(std::make_shared<SlowFileSystem>(500ms), 30ms);
    const std::filesystem::path path = "/net/share/file.txt";

    const auto started = std::chrono::steady_clock::now();
    try {
        file_system.stat_entry(path);
        FAIL("expected FileSystemTimeout");
    } catch (const FileSystemTimeout& ex) {
        CHECK(ex.path() == path);
    }
    CHECK(std::chrono::steady_clock::now() - started < 400ms);
    CHECK_THROWS_AS(file_system.list_directory(path), FileSystemTimeout);
}

TEST_CASE("errors of the inner filesystem propagate unchanged") {
    TempDir temp_dir;
    TimedFileSystem file_system(std::make_shared<FailingFileSystem>(), 2s);
    try {
        file_system.list_directory(temp_dir.path());
        FAIL("expected filesystem_error");
    } catch (const std::filesystem::filesystem_error& ex) {
        CHECK(ex.code() == std::errc::permission_denied);
    }
}

TEST_CASE("sequential calls reuse the same workers") {
    TempDir temp_dir;
    const auto file = write_file(temp_dir.path() / "data.bin", 8);
    TimedFileSystem file_system(std::make_shared<LocalFileSystem>(), 2s);

    for (int i = 0; i < 200; ++i) {
        REQUIRE(file_system.stat_entry(file).has_value());
    }
    CHECK(TimedFileSystemTestAccess::workers_started(file_system) <= 2);
}

TEST_CASE("a hung call does not hold up the calls after it") {
    TempDir temp_dir;
    const auto file = write_file(temp_dir.path() / "data.bin", 8);
    const auto stuck = temp_dir.path() / "stuck.bin";
    TimedFileSystem file_system(std::make_shared<StuckPathFileSystem>(stuck, 400ms), 50ms);

    CHECK_THROWS_AS(file_system.stat_entry(stuck), FileSystemTimeout);
    auto info = file_system.stat_entry(file);
    REQUIRE(info.has_value());
    CHECK(info->size == 8);
    CHECK(TimedFileSystemTestAccess::workers_started(file_system) == 2);
}
