/**
 * @file EngineFixture.hpp
 * @brief Scan and transfer engines wired over one filesystem for engine tests.
 */
#pragma once

#include "LocalFileSystem.hpp"
#include "OperationRegistry.hpp"
#include "ScanEngine.hpp"
#include "TestHelpers.hpp"
#include "TransferEngine.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Local filesystem that reports a fixed amount of free space.
 */
class FixedSpaceFileSystem : public LocalFileSystem {
public:
    explicit FixedSpaceFileSystem(std::uintmax_t available) : available_(available) {}

    std::optional<std::uintmax_t> free_space(const std::filesystem::path&) override {
        return available_;
    }

private:
    std::uintmax_t available_;
};

struct EngineFixture {
    explicit EngineFixture(std::shared_ptr<IFileSystem> fs = std::make_shared<LocalFileSystem>(),
                           TransferTuning tuning = {})
        : file_system(std::move(fs)),
          registry(std::chrono::seconds(60)),
          scans(file_system, channel, registry),
          transfers(file_system, channel, registry, scans, tuning)
    {
    }

    ~EngineFixture() {
        registry.cancel_all(false);
        registry.join_all();
    }

    std::string start(TransferKind kind,
                      const std::vector<std::filesystem::path>& sources,
                      const std::filesystem::path& destination,
                      ConflictPolicy policy) {
        TransferRequest request;
        request.kind = kind;
        for (const auto& source : sources) {
            request.sources.push_back(source.string());
        }
        request.destination = destination.string();
        request.conflict_policy = policy;
        request.progress_interval = std::chrono::milliseconds(0);
        return transfers.start_transfer(std::move(request));
    }

    std::shared_ptr<IFileSystem> file_system;
    EventChannel channel;
    OperationRegistry registry;
    ScanEngine scans;
    TransferEngine transfers;
};

/**
 * @brief Reads events until one of `kind` arrives; stops early at a terminal event.
 */
inline std::optional<EngineEvent> wait_for_kind(const EventChannel::SubscriptionHandle& subscription,
                                                EventKind kind,
                                                std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto event = subscription->wait_next(std::chrono::milliseconds(50));
        if (!event) {
            continue;
        }
        if (event->kind == kind) {
            return event;
        }
        if (event->terminal()) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/**
 * @brief Every entry below `root` as a sorted relative path.
 */
inline std::vector<std::string> tree_of(const std::filesystem::path& root) {
    std::vector<std::string> entries;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        entries.push_back(entry.path().lexically_relative(root).generic_string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}
