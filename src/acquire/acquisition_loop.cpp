#include "acquisition_loop.hpp"

#include <algorithm>
#include <thread>

#include "../core/logger.hpp"

namespace wcl {
FailureNotice notice_for(uint64_t consecutive_failures, uint64_t every) {
    if (consecutive_failures == 1) return FailureNotice::ConnectionLost;
    if (every > 0 && consecutive_failures > 0 && consecutive_failures % every == 0)
        return FailureNotice::StillRetrying;
    return FailureNotice::None;
}

std::chrono::nanoseconds pacing_delay(std::chrono::nanoseconds interval,
                                      std::chrono::nanoseconds elapsed) {
    return std::max(std::chrono::nanoseconds::zero(), interval - elapsed);
}

AcquisitionLoop::AcquisitionLoop(Endpoint endpoint, FetchFn fetch, ReadingBus& bus,
                                 AcquisitionOptions opts)
    : endpoint_(std::move(endpoint)), fetch_(std::move(fetch)), bus_(bus), opts_(opts) {}

bool AcquisitionLoop::tick() {
    ++stats_.ticks;
    auto reading = fetch_(endpoint_, opts_.request_timeout_ms);
    if (reading) {
        if (stats_.consecutive_failures > 0)
            log(LogLevel::INFO, "connection to " + endpoint_.authority() + " restored after " +
                                    std::to_string(stats_.consecutive_failures) + " failed poll(s)");
        stats_.consecutive_failures = 0;
        ++stats_.successes;
        bus_.emit(*reading);
        return true;
    }

    ++stats_.failures;
    ++stats_.consecutive_failures;
    stats_.longest_streak = std::max(stats_.longest_streak, stats_.consecutive_failures);
    FailureNotice notice = notice_for(stats_.consecutive_failures, opts_.notice_every);
    if (notice != FailureNotice::None) {
        if (notice_) {
            notice_(notice, stats_.consecutive_failures);
        } else {
            log(LogLevel::WARN, notice == FailureNotice::ConnectionLost
                                    ? "connection lost, reconnecting"
                                    : "still retrying (attempt " +
                                          std::to_string(stats_.consecutive_failures) + ")");
        }
    }
    return false;
}

void AcquisitionLoop::sliced_sleep(std::chrono::nanoseconds delay,
                                   const std::atomic<bool>& stop) const {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!stop.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return;
        auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - now);
        std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(remaining, opts_.sleep_slice));
    }
}

void AcquisitionLoop::run(const std::atomic<bool>& stop) {
    log(LogLevel::INFO, "polling " + endpoint_.telemetry_url() + " every " +
                            std::to_string(opts_.interval.count()) + " ms");
    while (!stop.load()) {
        auto start = std::chrono::steady_clock::now();
        tick();
        if (stop.load()) break;
        auto elapsed = std::chrono::steady_clock::now() - start;
        auto delay = pacing_delay(opts_.interval, elapsed);
        if (sleep_)
            sleep_(delay, stop);
        else
            sliced_sleep(delay, stop);
    }
}
}  // namespace wcl
