#include <catch2/catch_test_macros.hpp>
#include "ConflictGate.hpp"
#include "OperationRegistry.hpp"
#include "OperationRegistryTestAccess.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace {

bool wait_until_finished(const OperationContext& context, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!context.finished()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST_CASE("a launched operation is listed while running and queryable after finishing") {
    OperationRegistry registry(std::chrono::seconds(60));
    std::promise<void> release;
    auto released = release.get_future().share();

    auto context = registry.launch("copy-1", OperationKind::Copy, [released](OperationContext& ctx) {
        ctx.update([](OperationSnapshot& snapshot) {
            snapshot.files_total = 4;
        });
        released.wait();
    });

    auto active = registry.list_active();
    REQUIRE(active.size() == 1);
    CHECK(active.front().id == "copy-1");
    CHECK(active.front().kind == OperationKind::Copy);
    CHECK(active.front().running);
    CHECK_FALSE(registry.acknowledge("copy-1"));

    release.set_value();
    REQUIRE(wait_until_finished(*context, 2s));

    CHECK(registry.list_active().empty());
    auto status = registry.get_status("copy-1");
    REQUIRE(status.has_value());
    CHECK_FALSE(status->running);
    CHECK(status->files_total == 4);

    CHECK(registry.acknowledge("copy-1"));
    CHECK_FALSE(registry.get_status("copy-1").has_value());
    CHECK(registry.size() == 0);
}

TEST_CASE("unknown ids are reported as absent") {
    OperationRegistry registry(std::chrono::seconds(60));
    CHECK_FALSE(registry.get_status("missing").has_value());
    CHECK_FALSE(registry.cancel("missing", false));
    CHECK_FALSE(registry.acknowledge("missing"));
}

TEST_CASE("cancel reaches the worker and is refused once finished") {
    OperationRegistry registry(std::chrono::seconds(60));
    std::atomic<bool> saw_rollback{false};

    auto context = registry.launch("move-1", OperationKind::Move, [&saw_rollback](OperationContext& ctx) {
        while (!ctx.cancellation().is_cancelled()) {
            std::this_thread::sleep_for(2ms);
        }
        saw_rollback = ctx.cancellation().rollback_requested();
    });

    CHECK(registry.cancel("move-1", true));
    REQUIRE(wait_until_finished(*context, 2s));
    CHECK(saw_rollback.load());
    CHECK_FALSE(registry.cancel("move-1", true));
}

TEST_CASE("a later cancel without rollback keeps an earlier rollback request") {
    OperationRegistry registry(std::chrono::seconds(60));
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> saw_rollback{false};

    auto context = registry.launch("copy-2", OperationKind::Copy, [&saw_rollback, released](OperationContext& ctx) {
        released.wait();
        saw_rollback = ctx.cancellation().rollback_requested();
    });

    CHECK(registry.cancel("copy-2", true));
    CHECK(registry.cancel("copy-2", false));
    release.set_value();
    REQUIRE(wait_until_finished(*context, 2s));
    CHECK(saw_rollback.load());
}

TEST_CASE("cancellation token rollback is sticky") {
    CancellationToken token;
    CHECK_FALSE(token.is_cancelled());
    token.request(false);
    CHECK(token.is_cancelled());
    CHECK_FALSE(token.rollback_requested());
    token.request(true);
    token.request(false);
    CHECK(token.rollback_requested());
}

TEST_CASE("duplicate operation ids are rejected") {
    OperationRegistry registry(std::chrono::seconds(60));
    registry.launch("scan-1", OperationKind::Scan, [](OperationContext&) {});
    CHECK_THROWS_AS(registry.launch("scan-1", OperationKind::Scan, [](OperationContext&) {}),
                    std::logic_error);
    registry.join_all();
}

TEST_CASE("an exception escaping the task still finishes the operation") {
    OperationRegistry registry(std::chrono::seconds(60));
    auto context = registry.launch("copy-err", OperationKind::Copy, [](OperationContext&) {
        throw std::runtime_error("boom");
    });
    REQUIRE(wait_until_finished(*context, 2s));
    CHECK_FALSE(registry.get_status("copy-err")->running);
}

TEST_CASE("expired finished operations are swept when another starts") {
    OperationRegistry registry(std::chrono::seconds(60));
    auto old_context = registry.launch("scan-old", OperationKind::Scan, [](OperationContext&) {});
    REQUIRE(wait_until_finished(*old_context, 2s));
    registry.launch("scan-recent", OperationKind::Scan, [](OperationContext&) {});
    registry.join_all();
    CHECK(registry.size() == 2);

    OperationRegistryTestAccess::backdate_finish(*old_context, std::chrono::seconds(120));
    auto fresh = registry.launch("scan-new", OperationKind::Scan, [](OperationContext&) {});
    CHECK_FALSE(registry.get_status("scan-old").has_value());
    CHECK(registry.get_status("scan-recent").has_value());
    CHECK(registry.get_status("scan-new").has_value());
    REQUIRE(wait_until_finished(*fresh, 2s));
}

TEST_CASE("list_active orders operations by start time") {
    OperationRegistry registry(std::chrono::seconds(60));
    std::promise<void> release;
    auto released = release.get_future().share();
    auto hold = [released](OperationContext&) { released.wait(); };

    registry.launch("copy-first", OperationKind::Copy, hold);
    std::this_thread::sleep_for(5ms);
    registry.launch("move-second", OperationKind::Move, hold);

    const auto active = registry.list_active();
    REQUIRE(active.size() == 2);
    CHECK(active[0].id == "copy-first");
    CHECK(active[1].id == "move-second");

    release.set_value();
    registry.join_all();
}

TEST_CASE("conflict gate accepts only the current token once") {
    ConflictGate gate;
    CancellationToken cancel;
    CHECK_FALSE(gate.resolve(1, ConflictDecision::SkipThis));

    const auto first = gate.open();
    const auto second = gate.open();
    CHECK(gate.waiting());
    CHECK_FALSE(gate.resolve(first, ConflictDecision::SkipThis));
    CHECK(gate.resolve(second, ConflictDecision::OverwriteThis));
    CHECK_FALSE(gate.resolve(second, ConflictDecision::Abort));

    const auto decision = gate.wait(second, 1s, cancel);
    REQUIRE(decision.has_value());
    CHECK(*decision == ConflictDecision::OverwriteThis);
    CHECK_FALSE(gate.waiting());
}

TEST_CASE("conflict gate wait ends on timeout or cancellation") {
    ConflictGate gate;
    CancellationToken cancel;

    const auto token = gate.open();
    CHECK_FALSE(gate.wait(token, 20ms, cancel).has_value());
    CHECK_FALSE(gate.resolve(token, ConflictDecision::SkipThis));

    const auto next = gate.open();
    std::thread canceller([&]() {
        std::this_thread::sleep_for(20ms);
        cancel.request(false);
        gate.interrupt();
    });
    CHECK_FALSE(gate.wait(next, 5s, cancel).has_value());
    canceller.join();
}
