#include <catch2/catch_test_macros.hpp>
#include "EngineFixture.hpp"
#include "FileOperationService.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

EngineSettings settings_in(const TempDir& temp_dir)
{
    EngineSettings settings((temp_dir.path() / "config" / "config.ini").string());
    settings.set_progress_interval(0ms);
    return settings;
}

std::vector<std::string> three_files(const fs::path& src)
{
    return {
        write_file(src / "a.txt", 10, 'a').string(),
        write_file(src / "b.txt", 20, 'b').string(),
        write_file(src / "c.txt", 30, 'c').string(),
    };
}

} // namespace

TEST_CASE("service reports status until the operation is acknowledged") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto dst = temp_dir.make_dir("dst");
    const auto sources = three_files(src);
    write_file(dst / "b.txt", 1, 'o');

    FileOperationService service(settings_in(temp_dir));
    auto subscription = service.subscribe(transfer_event_kinds());
    const auto id = service.start_transfer(TransferKind::Copy, sources, dst.string());
    REQUIRE(subscription->track(id));

    auto conflict = wait_for_kind(subscription, EventKind::TransferConflict);
    REQUIRE(conflict.has_value());
    auto active = service.list_active();
    REQUIRE(active.size() == 1);
    CHECK(active.front().id == id);
    CHECK(active.front().kind == OperationKind::Copy);
    CHECK(active.front().phase == "copying");
    CHECK(active.front().files_total == 3);
    CHECK_FALSE(service.acknowledge(id));

    CHECK(service.resolve_conflict(id, conflict->payload["token"].asUInt64(),
                                   ConflictDecision::OverwriteRemaining));
    const auto events = collect_events(subscription);
    REQUIRE(events.back().kind == EventKind::TransferComplete);

    auto status = service.get_status(id);
    REQUIRE(status.has_value());
    CHECK_FALSE(status->running);
    CHECK(status->phase == "complete");
    CHECK(status->files_done == 3);
    CHECK(status->bytes_done == 60);
    CHECK(status->percent_complete() == 100);
    CHECK(service.list_active().empty());

    CHECK(service.acknowledge(id));
    CHECK_FALSE(service.get_status(id).has_value());
}

TEST_CASE("service rejects commands for unknown operations") {
    TempDir temp_dir;
    FileOperationService service(settings_in(temp_dir));
    CHECK_FALSE(service.cancel_transfer("copy-unknown", true));
    CHECK_FALSE(service.cancel_scan("scan-unknown"));
    CHECK_FALSE(service.resolve_conflict("copy-unknown", 1, ConflictDecision::SkipThis));
    CHECK_FALSE(service.get_status("copy-unknown").has_value());
}

TEST_CASE("service applies the configured default conflict policy") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto dst = temp_dir.make_dir("dst");
    const auto sources = three_files(src);
    write_file(dst / "a.txt", 2, 'o');

    auto settings = settings_in(temp_dir);
    settings.set_default_conflict_policy(ConflictPolicy::Skip);
    FileOperationService service(settings);
    auto subscription = service.subscribe(transfer_event_kinds());
    service.start_transfer(TransferKind::Copy, sources, dst.string());

    const auto events = collect_events(subscription);
    REQUIRE(events.back().kind == EventKind::TransferComplete);
    CHECK(events_of_kind(events, EventKind::TransferConflict).empty());
    CHECK(events.back().payload["bytesProcessed"].asUInt64() == 50);
    CHECK(read_file(dst / "a.txt") == "oo");
}

TEST_CASE("conflict detection uses the configured cap") {
    TempDir temp_dir;
    const auto dst = temp_dir.make_dir("dst");
    std::vector<ConflictCandidate> candidates;
    for (int i = 0; i < 5; ++i) {
        const std::string name = "dup" + std::to_string(i) + ".txt";
        write_file(dst / name, 1);
        ConflictCandidate candidate;
        candidate.name = name;
        candidate.size = 2;
        candidate.source_path = "/elsewhere/" + name;
        candidates.push_back(candidate);
    }

    auto settings = settings_in(temp_dir);
    settings.set_max_conflicts_to_show(2);
    FileOperationService service(settings);

    const auto capped = service.detect_conflicts(candidates, dst.string());
    CHECK(capped.conflicts.size() == 2);
    CHECK(capped.conflicts_total == 5);
    CHECK(capped.sampled);

    const auto full = service.detect_conflicts(candidates, dst.string(), 10);
    CHECK(full.conflicts.size() == 5);
    CHECK_FALSE(full.sampled);
}

TEST_CASE("a transfer reuses a completed preview scan once") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto dst = temp_dir.make_dir("dst");
    const auto sources = three_files(src);

    FileOperationService service(settings_in(temp_dir));
    auto scan_events = service.subscribe(scan_event_kinds());
    const auto scan_id = service.start_scan(sources);
    const auto scanned = collect_events(scan_events);
    REQUIRE(scanned.back().kind == EventKind::ScanComplete);
    CHECK(scanned.back().payload["bytesTotal"].asUInt64() == 60);

    auto is_scanning = [](const EngineEvent& event) {
        return event.kind == EventKind::TransferProgress && event.payload["phase"].asString() == "scanning";
    };

    auto first = service.subscribe(transfer_event_kinds());
    service.start_transfer(TransferKind::Copy, sources, dst.string(), ConflictPolicy::Overwrite, scan_id);
    const auto first_events = collect_events(first);
    REQUIRE(first_events.back().kind == EventKind::TransferComplete);
    CHECK(first_events.back().payload["bytesProcessed"].asUInt64() == 60);
    CHECK(std::none_of(first_events.begin(), first_events.end(), is_scanning));

    auto second = service.subscribe(transfer_event_kinds());
    service.start_transfer(TransferKind::Copy, sources, dst.string(), ConflictPolicy::Overwrite, scan_id);
    const auto second_events = collect_events(second);
    REQUIRE(second_events.back().kind == EventKind::TransferComplete);
    CHECK(std::any_of(second_events.begin(), second_events.end(), is_scanning));
}

TEST_CASE("cancelling a completed scan discards it exactly once") {
    TempDir temp_dir;
    const auto src = temp_dir.make_dir("src");
    const auto sources = three_files(src);

    FileOperationService service(settings_in(temp_dir));
    auto scan_events = service.subscribe(scan_event_kinds());
    const auto scan_id = service.start_scan(sources);
    REQUIRE(collect_events(scan_events).back().kind == EventKind::ScanComplete);

    CHECK(service.cancel_scan(scan_id));
    CHECK_FALSE(service.cancel_scan(scan_id));
}
