#pragma once

#ifdef TWINPANE_TEST_BUILD

#include "OperationRegistry.hpp"

class OperationRegistryTestAccess {
public:
    static void backdate_finish(OperationContext& context, std::chrono::seconds age) {
        std::lock_guard<std::mutex> lock(context.mutex_);
        context.finished_at_ -= age;
    }
};

#endif // TWINPANE_TEST_BUILD
