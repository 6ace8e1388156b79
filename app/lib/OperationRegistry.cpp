#include "OperationRegistry.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

void join_quietly(std::thread& worker)
{
    if (!worker.joinable()) {
        return;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
        return;
    }
    worker.join();
}

} // namespace

OperationContext::OperationContext(std::string id, OperationKind kind)
    : id_(std::move(id)),
      kind_(kind)
{
    snapshot_.id = id_;
    snapshot_.kind = kind_;
    snapshot_.phase = kind_ == OperationKind::Scan ? "scanning" : to_string(TransferPhase::Scanning);
    snapshot_.running = true;
    snapshot_.started_at_ms = Utils::now_epoch_ms();
}

void OperationContext::request_cancel(bool rollback)
{
    cancellation_.request(rollback);
    conflict_gate_.interrupt();
}

void OperationContext::update(const std::function<void(OperationSnapshot&)>& mutate)
{
    std::lock_guard<std::mutex> lock(mutex_);
    mutate(snapshot_);
}

OperationSnapshot OperationContext::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

void OperationContext::mark_finished()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    finished_ = true;
    finished_at_ = std::chrono::steady_clock::now();
    snapshot_.running = false;
}

bool OperationContext::finished() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

std::chrono::steady_clock::time_point OperationContext::finished_at() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_at_;
}

OperationRegistry::OperationRegistry(std::chrono::seconds retention)
    : retention_(retention)
{
}

OperationRegistry::~OperationRegistry()
{
    cancel_all(false);
    join_all();
}

std::shared_ptr<OperationContext> OperationRegistry::launch(const std::string& id,
                                                            OperationKind kind,
                                                            Task task)
{
    auto context = std::make_shared<OperationContext>(id, kind);
    std::vector<std::thread> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(id) != 0) {
            throw std::logic_error("Operation id already registered: " + id);
        }
        expired = take_expired_locked(std::chrono::steady_clock::now());
        Entry& entry = entries_[id];
        entry.context = context;
        entry.worker = std::thread([context, task = std::move(task)]() {
            try {
                task(*context);
            } catch (const std::exception& ex) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->error("Operation '{}' ended with an unhandled exception: {}",
                                  context->id(), ex.what());
                }
            }
            context->mark_finished();
        });
    }

    for (auto& worker : expired) {
        join_quietly(worker);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Started {} operation '{}'", to_string(kind), id);
    }
    return context;
}

std::shared_ptr<OperationContext> OperationRegistry::find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.context;
}

bool OperationRegistry::cancel(const std::string& id, bool rollback)
{
    auto context = find(id);
    if (!context || context->finished()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Cancel ignored for unknown or finished operation '{}'", id);
        }
        return false;
    }
    context->request_cancel(rollback);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Cancellation requested for '{}' (rollback: {})", id, rollback);
    }
    return true;
}

std::optional<OperationSnapshot> OperationRegistry::get_status(const std::string& id) const
{
    auto context = find(id);
    if (!context) {
        return std::nullopt;
    }
    return context->snapshot();
}

std::vector<OperationSnapshot> OperationRegistry::list_active() const
{
    std::vector<OperationSnapshot> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (!entry.context->finished()) {
                active.push_back(entry.context->snapshot());
            }
        }
    }
    std::sort(active.begin(), active.end(), [](const OperationSnapshot& lhs, const OperationSnapshot& rhs) {
        if (lhs.started_at_ms != rhs.started_at_ms) {
            return lhs.started_at_ms < rhs.started_at_ms;
        }
        return lhs.id < rhs.id;
    });
    return active;
}

bool OperationRegistry::acknowledge(const std::string& id)
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.context->finished()) {
            return false;
        }
        worker = std::move(it->second.worker);
        entries_.erase(it);
    }
    join_quietly(worker);
    return true;
}

void OperationRegistry::cancel_all(bool rollback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entry] : entries_) {
        if (!entry.context->finished()) {
            entry.context->request_cancel(rollback);
        }
    }
}

void OperationRegistry::join_all()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (entry.worker.joinable()) {
                workers.push_back(std::move(entry.worker));
            }
        }
    }
    for (auto& worker : workers) {
        join_quietly(worker);
    }
}

std::size_t OperationRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::thread> OperationRegistry::take_expired_locked(std::chrono::steady_clock::time_point now)
{
    std::vector<std::thread> expired;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& context = it->second.context;
        if (context->finished() && now - context->finished_at() >= retention_) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->debug("Sweeping unacknowledged operation '{}'", it->first);
            }
            expired.push_back(std::move(it->second.worker));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}
