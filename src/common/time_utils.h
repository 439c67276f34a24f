#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "backstop/types.h"

namespace backstop {

constexpr int64_t ONE_MINUTE_MS = 60000;

inline Seconds MsToSeconds(int64_t ms) {
    return std::chrono::duration_cast<Seconds>(std::chrono::milliseconds(ms));
}

inline bool
WaitCondition(const std::function<bool()>& cond, const std::string& cond_name, int64_t max_ms, int interval_ms = 1) {
    std::chrono::milliseconds wait_time_ms(0);
    while (true) {
        if (cond()) {
            return true;
        }

        if (wait_time_ms.count() > max_ms) {
            SPDLOG_ERROR("Wait for condition [{}] timeout, {}ms", cond_name, wait_time_ms.count());
            break;
        }

        if (wait_time_ms.count() > 0 && wait_time_ms.count() % ONE_MINUTE_MS == 0) {
            SPDLOG_INFO("Wait for condition [{}] {}ms", cond_name, wait_time_ms.count());
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
        wait_time_ms += std::chrono::milliseconds(interval_ms);
    }
    return false;
}

} // namespace backstop
