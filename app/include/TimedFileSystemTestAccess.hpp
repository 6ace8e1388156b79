#pragma once

#ifdef TWINPANE_TEST_BUILD

#include "TimedFileSystem.hpp"

#include <mutex>

class TimedFileSystemTestAccess {
public:
    static std::size_t workers_started(const TimedFileSystem& file_system) {
        std::lock_guard<std::mutex> lock(file_system.queue_->mutex);
        return file_system.queue_->workers_started;
    }
};

#endif // TWINPANE_TEST_BUILD
