#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

#include "../core/reading_bus.hpp"
#include "../probes/device_probe.hpp"
#include "telemetry.hpp"

namespace wcl {
enum class FailureNotice { None, ConnectionLost, StillRetrying };

// Notice owed after `consecutive_failures` failed polls in a row: one when a
// streak starts, then one every `every` failures.
FailureNotice notice_for(uint64_t consecutive_failures, uint64_t every);

// Sleep that keeps tick starts `interval` apart; never negative, and a late
// tick is not made up.
std::chrono::nanoseconds pacing_delay(std::chrono::nanoseconds interval,
                                      std::chrono::nanoseconds elapsed);

struct AcquisitionOptions {
    std::chrono::milliseconds interval{1000};
    int request_timeout_ms{5000};
    uint64_t notice_every{10};
    // upper bound on how long a stop request waits during pacing sleeps
    std::chrono::milliseconds sleep_slice{100};
};

struct AcquisitionStats {
    uint64_t ticks{0};
    uint64_t successes{0};
    uint64_t failures{0};
    uint64_t consecutive_failures{0};
    uint64_t longest_streak{0};
};

using NoticeFn = std::function<void(FailureNotice notice, uint64_t consecutive_failures)>;
using SleepFn = std::function<void(std::chrono::nanoseconds delay, const std::atomic<bool>& stop)>;

// Polls one confirmed endpoint at a fixed cadence until asked to stop.
// Failed polls are counted and reported but never end the loop; successful
// readings go out on the bus.
class AcquisitionLoop {
   public:
    AcquisitionLoop(Endpoint endpoint, FetchFn fetch, ReadingBus& bus, AcquisitionOptions opts);

    void set_notice_handler(NoticeFn fn) { notice_ = std::move(fn); }
    void set_sleeper(SleepFn fn) { sleep_ = std::move(fn); }

    bool tick();
    void run(const std::atomic<bool>& stop);

    const Endpoint& endpoint() const { return endpoint_; }
    const AcquisitionStats& stats() const { return stats_; }

   private:
    const Endpoint endpoint_;
    FetchFn fetch_;
    ReadingBus& bus_;
    AcquisitionOptions opts_;
    AcquisitionStats stats_;
    NoticeFn notice_;
    SleepFn sleep_;

    void sliced_sleep(std::chrono::nanoseconds delay, const std::atomic<bool>& stop) const;
};
}  // namespace wcl
