#pragma once

#ifdef TWINPANE_TEST_BUILD

#include "ScanEngine.hpp"

class ScanEngineTestAccess {
public:
    static std::size_t retained_scans(const ScanEngine& engine) {
        std::lock_guard<std::mutex> lock(engine.records_mutex_);
        return engine.records_.size();
    }
};

#endif // TWINPANE_TEST_BUILD
