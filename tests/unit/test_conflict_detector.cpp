#include <catch2/catch_test_macros.hpp>
#include "ConflictDetector.hpp"
#include "LocalFileSystem.hpp"
#include "TestHelpers.hpp"

#include <fmt/format.h>

namespace {

ConflictCandidate candidate(const std::string& name, std::uintmax_t size = 0, bool is_directory = false)
{
    ConflictCandidate result;
    result.name = name;
    result.size = size;
    result.source_path = "/src/" + name;
    result.is_directory = is_directory;
    return result;
}

} // namespace

TEST_CASE("conflicts are reported for names that exist directly in the destination") {
    TempDir temp_dir;
    const auto destination = temp_dir.make_dir("dst");
    write_file(destination / "a.txt", 10);
    write_file(destination / "nested" / "b.txt", 5);

    LocalFileSystem file_system;
    ConflictDetector detector(file_system);
    const auto report = detector.detect_conflicts(
        {candidate("a.txt", 4), candidate("b.txt", 5), candidate("c.txt", 6)}, destination, 100);

    REQUIRE(report.conflicts.size() == 1);
    CHECK(report.conflicts_total == 1);
    CHECK_FALSE(report.sampled);
    const auto& record = report.conflicts.front();
    CHECK(record.name == "a.txt");
    CHECK(record.source_size == 4);
    CHECK(record.existing_size == 10);
    CHECK(record.size_difference() == 6);
    CHECK(record.destination_path == (destination / "a.txt").string());
    CHECK_FALSE(record.is_directory);
}

TEST_CASE("an existing directory is reported with zero size") {
    TempDir temp_dir;
    const auto destination = temp_dir.make_dir("dst");
    write_file(destination / "photos" / "img.jpg", 100);

    LocalFileSystem file_system;
    ConflictDetector detector(file_system);
    const auto report = detector.detect_conflicts({candidate("photos", 0, true)}, destination, 100);

    REQUIRE(report.conflicts.size() == 1);
    CHECK(report.conflicts.front().is_directory);
    CHECK(report.conflicts.front().existing_size == 0);
}

TEST_CASE("the result cap samples records but counts every conflict") {
    TempDir temp_dir;
    const auto destination = temp_dir.make_dir("dst");
    std::vector<ConflictCandidate> candidates;
    for (int i = 0; i < 8; ++i) {
        const auto name = fmt::format("file{}.bin", i);
        write_file(destination / name, 1);
        candidates.push_back(candidate(name, 2));
    }
    candidates.push_back(candidate("fresh.bin", 2));

    LocalFileSystem file_system;
    ConflictDetector detector(file_system);
    const auto report = detector.detect_conflicts(candidates, destination, 3);

    REQUIRE(report.conflicts.size() == 3);
    CHECK(report.conflicts_total == 8);
    CHECK(report.sampled);
    CHECK(report.conflicts[0].name == "file0.bin");
    CHECK(report.conflicts[2].name == "file2.bin");
}

TEST_CASE("detecting conflicts leaves the destination untouched") {
    TempDir temp_dir;
    const auto destination = temp_dir.make_dir("dst");
    write_file(destination / "keep.txt", 3, 'k');

    LocalFileSystem file_system;
    ConflictDetector detector(file_system);
    detector.detect_conflicts({candidate("keep.txt", 9), candidate("new.txt", 1)}, destination, 1);

    CHECK(read_file(destination / "keep.txt") == "kkk");
    CHECK_FALSE(std::filesystem::exists(destination / "new.txt"));
}
