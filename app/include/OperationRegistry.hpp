#ifndef OPERATION_REGISTRY_HPP
#define OPERATION_REGISTRY_HPP

#include "CancellationToken.hpp"
#include "ConflictGate.hpp"
#include "Types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

/**
 * @brief State of one in-flight scan or transfer.
 *
 * Only the worker running the operation writes the snapshot; everybody else reads
 * copies through snapshot().
 */
class OperationContext {
public:
    OperationContext(std::string id, OperationKind kind);

    const std::string& id() const { return id_; }
    OperationKind kind() const { return kind_; }

    CancellationToken& cancellation() { return cancellation_; }
    const CancellationToken& cancellation() const { return cancellation_; }
    ConflictGate& conflict_gate() { return conflict_gate_; }

    void request_cancel(bool rollback);

    void update(const std::function<void(OperationSnapshot&)>& mutate);
    OperationSnapshot snapshot() const;

    /// Called by the worker right before it publishes the terminal event.
    void mark_finished();
    bool finished() const;
    std::chrono::steady_clock::time_point finished_at() const;

private:
#ifdef TWINPANE_TEST_BUILD
    friend class OperationRegistryTestAccess;
#endif
    const std::string id_;
    const OperationKind kind_;
    CancellationToken cancellation_;
    ConflictGate conflict_gate_;

    mutable std::mutex mutex_;
    OperationSnapshot snapshot_;
    bool finished_{false};
    std::chrono::steady_clock::time_point finished_at_{};
};

/**
 * @brief Id-keyed arena of operations, each running on its own worker thread.
 *
 * Finished entries stay queryable until acknowledged or until they are older than
 * the retention window; expired entries are swept whenever a new operation starts.
 */
class OperationRegistry {
public:
    using Task = std::function<void(OperationContext&)>;

    explicit OperationRegistry(std::chrono::seconds retention);
    ~OperationRegistry();

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /**
     * @brief Registers the operation and starts `task` on a new worker thread.
     *
     * The task owns the terminal event; an exception escaping it is logged.
     */
    std::shared_ptr<OperationContext> launch(const std::string& id, OperationKind kind, Task task);

    std::shared_ptr<OperationContext> find(const std::string& id) const;

    /**
     * @return false when the id is unknown or the operation already finished.
     */
    bool cancel(const std::string& id, bool rollback);

    std::optional<OperationSnapshot> get_status(const std::string& id) const;
    std::vector<OperationSnapshot> list_active() const;

    /**
     * @brief Frees a finished entry. Running operations are left alone.
     */
    bool acknowledge(const std::string& id);

    void cancel_all(bool rollback);
    void join_all();

    std::size_t size() const;

private:
    struct Entry {
        std::shared_ptr<OperationContext> context;
        std::thread worker;
    };

    std::vector<std::thread> take_expired_locked(std::chrono::steady_clock::time_point now);

    std::chrono::seconds retention_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

#endif
