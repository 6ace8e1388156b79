#include "TimedFileSystem.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace {

constexpr std::chrono::seconds kIdleWorkerLifetime{10};

}

struct TimedFileSystem::CallQueue {
    std::mutex mutex;
    std::condition_variable job_ready;
    std::deque<std::function<void()>> jobs;
    std::size_t idle_workers{0};
    std::size_t workers_started{0};
    bool stopping{false};
};

TimedFileSystem::TimedFileSystem(std::shared_ptr<IFileSystem> inner,
                                 std::chrono::milliseconds call_timeout)
    : inner_(std::move(inner)),
      call_timeout_(call_timeout),
      queue_(std::make_shared<CallQueue>())
{
    if (!inner_) {
        throw std::invalid_argument("TimedFileSystem requires a filesystem to wrap");
    }
}

TimedFileSystem::~TimedFileSystem()
{
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->stopping = true;
    }
    queue_->job_ready.notify_all();
}

void TimedFileSystem::run_worker(std::shared_ptr<CallQueue> queue)
{
    std::unique_lock<std::mutex> lock(queue->mutex);
    while (true) {
        ++queue->idle_workers;
        queue->job_ready.wait_for(lock, kIdleWorkerLifetime, [&queue] {
            return !queue->jobs.empty() || queue->stopping;
        });
        --queue->idle_workers;
        if (queue->jobs.empty()) {
            return;
        }
        auto job = std::move(queue->jobs.front());
        queue->jobs.pop_front();
        lock.unlock();
        job();
        lock.lock();
    }
}

void TimedFileSystem::submit(std::function<void()> job)
{
    bool start_worker = false;
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->jobs.push_back(std::move(job));
        if (queue_->jobs.size() > queue_->idle_workers) {
            ++queue_->workers_started;
            start_worker = true;
        }
    }
    if (start_worker) {
        std::thread(run_worker, queue_).detach();
    } else {
        queue_->job_ready.notify_one();
    }
}

template <typename Result, typename Call>
Result TimedFileSystem::run_bounded(const char* operation,
                                    const std::filesystem::path& path,
                                    Call call)
{
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    submit([inner = inner_, promise, path, call]() mutable {
        try {
            promise->set_value(call(*inner, path));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (future.wait_for(call_timeout_) == std::future_status::timeout) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("{} on '{}' exceeded {} ms", operation, Utils::path_to_utf8(path),
                         call_timeout_.count());
        }
        throw FileSystemTimeout(operation, path);
    }
    return future.get();
}

bool TimedFileSystem::path_exists(const std::filesystem::path& path)
{
    return run_bounded<bool>("path_exists", path, [](IFileSystem& fs, const std::filesystem::path& p) {
        return fs.path_exists(p);
    });
}

std::optional<EntryInfo> TimedFileSystem::stat_entry(const std::filesystem::path& path)
{
    return run_bounded<std::optional<EntryInfo>>("stat_entry", path,
        [](IFileSystem& fs, const std::filesystem::path& p) {
            return fs.stat_entry(p);
        });
}

std::vector<std::filesystem::path> TimedFileSystem::list_directory(const std::filesystem::path& path)
{
    return run_bounded<std::vector<std::filesystem::path>>("list_directory", path,
        [](IFileSystem& fs, const std::filesystem::path& p) {
            return fs.list_directory(p);
        });
}

std::optional<std::uintmax_t> TimedFileSystem::free_space(const std::filesystem::path& volume_path)
{
    return run_bounded<std::optional<std::uintmax_t>>("free_space", volume_path,
        [](IFileSystem& fs, const std::filesystem::path& p) {
            return fs.free_space(p);
        });
}
