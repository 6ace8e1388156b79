#include <catch2/catch_test_macros.hpp>
#include "EngineFixture.hpp"
#include "RollbackCoordinator.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("rollback removes created entries children first") {
    TempDir temp_dir;
    const auto dir = temp_dir.make_dir("dst/new-folder");
    const auto file = write_file(dir / "copied.txt", 3);
    const auto untouched = write_file(temp_dir.path() / "dst" / "older.txt", 3);

    TransferJournal journal;
    journal.record_created(dir);
    journal.record_created(file);

    std::vector<fs::path> visited;
    RollbackCoordinator coordinator;
    const auto result = coordinator.roll_back(journal,
        [&visited](std::size_t done, std::size_t total, const fs::path& current) {
            CHECK(done <= total);
            visited.push_back(current);
        });

    CHECK(result.reverted == 2);
    CHECK(result.failed == 0);
    REQUIRE(visited.size() == 2);
    CHECK(visited.front() == file);
    CHECK_FALSE(fs::exists(dir));
    CHECK(fs::exists(untouched));
}

TEST_CASE("rollback renames moved entries back") {
    TempDir temp_dir;
    const auto original = temp_dir.make_dir("src") / "report.txt";
    const auto moved = write_file(temp_dir.make_dir("dst") / "report.txt", 8, 'r');

    TransferJournal journal;
    journal.record_renamed(original, moved);
    const auto result = RollbackCoordinator().roll_back(journal);

    CHECK(result.reverted == 1);
    CHECK(read_file(original) == "rrrrrrrr");
    CHECK_FALSE(fs::exists(moved));
}

TEST_CASE("rollback counts entries it cannot revert and keeps going") {
    TempDir temp_dir;
    const auto dir = temp_dir.make_dir("dst/busy");
    write_file(dir / "foreign.txt", 1);
    const auto file = write_file(temp_dir.path() / "dst" / "mine.txt", 1);

    TransferJournal journal;
    journal.record_created(dir);
    journal.record_created(file);
    const auto result = RollbackCoordinator().roll_back(journal);

    CHECK(result.reverted == 1);
    CHECK(result.failed == 1);
    CHECK(fs::exists(dir / "foreign.txt"));
    CHECK_FALSE(fs::exists(file));
}

TEST_CASE("cancel with rollback removes every file the transfer created") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto dst = temp_dir.make_dir("dst");
    write_file(dst / "existing.txt", 4, 'e');
    std::vector<fs::path> sources;
    for (int i = 0; i < 5; ++i) {
        sources.push_back(write_file(src / ("file" + std::to_string(i) + ".txt"), 100));
    }

    EngineFixture fixture;
    ProbeGuard guard;
    TestHooks::set_transfer_item_probe([&fixture](const TestHooks::TransferItemInfo& info) {
        if (info.phase == TransferPhase::Copying && info.files_done == 2) {
            fixture.transfers.cancel_transfer(info.operation_id, true);
        }
    });

    auto subscription = fixture.channel.subscribe(transfer_event_kinds());
    fixture.start(TransferKind::Copy, sources, dst, ConflictPolicy::Overwrite);

    const auto events = collect_events(subscription);
    REQUIRE(count_terminal(events) == 1);
    REQUIRE(events.back().kind == EventKind::TransferCancelled);
    CHECK(events.back().payload["filesProcessed"].asUInt64() == 2);
    CHECK(events.back().payload["rolledBack"].asBool());

    CHECK(tree_of(dst) == std::vector<std::string>{"existing.txt"});
    CHECK(read_file(dst / "existing.txt") == "eeee");
    for (const auto& source : sources) {
        CHECK(fs::exists(source));
    }

    bool saw_rolling_back = false;
    for (const auto& event : events_of_kind(events, EventKind::TransferProgress)) {
        if (event.payload["phase"].asString() == "rolling_back") {
            saw_rolling_back = true;
            CHECK(event.payload["filesDone"].asUInt64() == 2);
        }
    }
    CHECK(saw_rolling_back);
}

TEST_CASE("rollback of a folder copy removes the created folders too") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto dst = temp_dir.make_dir("dst");
    for (int i = 0; i < 4; ++i) {
        write_file(src / "tree" / ("sub" + std::to_string(i)) / "leaf.txt", 10);
    }

    EngineFixture fixture;
    ProbeGuard guard;
    TestHooks::set_transfer_item_probe([&fixture](const TestHooks::TransferItemInfo& info) {
        if (info.files_done == 3) {
            fixture.transfers.cancel_transfer(info.operation_id, true);
        }
    });

    auto subscription = fixture.channel.subscribe(transfer_event_kinds());
    fixture.start(TransferKind::Copy, {src / "tree"}, dst, ConflictPolicy::Stop);

    const auto events = collect_events(subscription);
    REQUIRE(events.back().kind == EventKind::TransferCancelled);
    CHECK(events.back().payload["rolledBack"].asBool());
    CHECK(fs::is_empty(dst));
}

TEST_CASE("rollback of a renamed move puts the sources back") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto dst = temp_dir.make_dir("dst");
    const auto first = write_file(src / "first.txt", 10);
    const auto second = write_file(src / "second.txt", 10);

    EngineFixture fixture;
    ProbeGuard guard;
    TestHooks::set_transfer_item_probe([&fixture](const TestHooks::TransferItemInfo& info) {
        if (info.files_done == 1) {
            fixture.transfers.cancel_transfer(info.operation_id, true);
        }
    });

    auto subscription = fixture.channel.subscribe(transfer_event_kinds());
    fixture.start(TransferKind::Move, {first, second}, dst, ConflictPolicy::Stop);

    const auto events = collect_events(subscription);
    REQUIRE(events.back().kind == EventKind::TransferCancelled);
    CHECK(events.back().payload["rolledBack"].asBool());
    CHECK(fs::exists(first));
    CHECK(fs::exists(second));
    CHECK(fs::is_empty(dst));
}
