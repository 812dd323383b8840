// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/core/retry.hpp>
#include <condition_variable>
#include <mutex>

namespace nimbus::core {

std::chrono::milliseconds retry_delay(int attempt, std::chrono::milliseconds max_delay) noexcept {
    if (attempt < 0) {
        attempt = 0;
    }
    // Past 2^31 s every practical cap has been reached
    if (attempt >= 31) {
        return max_delay;
    }
    std::chrono::milliseconds delay = std::chrono::seconds(std::int64_t{1} << attempt);
    return delay < max_delay ? delay : max_delay;
}

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop) {
    if (duration <= std::chrono::milliseconds::zero()) {
        return !stop.stop_requested();
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Nothing notifies cv; only the stop request or the timeout ends the wait
    return !cv.wait_for(lock, stop, duration, [&stop] { return stop.stop_requested(); });
}

} // namespace nimbus::core
