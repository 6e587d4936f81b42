#include <atomic>
#include <cassert>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../src/acquire/acquisition_loop.hpp"

using namespace wcl;
using namespace std::chrono_literals;

namespace {
class CountingSink : public ReadingSink {
   public:
    void on_reading(const Reading& r) override { seen.push_back(r.captured_at); }
    std::vector<std::string> seen;
};

Reading reading_at(const std::string& ts) {
    Reading r;
    r.captured_at = ts;
    r.fields["SOC_pct"] = FieldValue::of_real(80.0);
    return r;
}
}  // namespace

// 15 failures in a row owe exactly two notices: at the first and the tenth.
static int outage_notices() {
    ReadingBus bus;
    AcquisitionLoop loop(Endpoint("10.0.0.5"),
                         [](const Endpoint&, int) { return std::optional<Reading>(); }, bus,
                         AcquisitionOptions{});
    std::vector<std::pair<FailureNotice, uint64_t>> notices;
    loop.set_notice_handler([&](FailureNotice n, uint64_t c) { notices.emplace_back(n, c); });
    for (int i = 0; i < 15; ++i) {
        if (loop.tick()) return 1;
    }
    if (notices.size() != 2) return 2;
    if (notices[0] != std::make_pair(FailureNotice::ConnectionLost, uint64_t{1})) return 3;
    if (notices[1] != std::make_pair(FailureNotice::StillRetrying, uint64_t{10})) return 4;
    if (loop.stats().failures != 15 || loop.stats().consecutive_failures != 15) return 5;
    return 0;
}

// A success resets the streak; the next outage starts over with "lost".
static int streak_reset() {
    ReadingBus bus;
    CountingSink sink;
    bus.add_sink(&sink);
    std::vector<bool> script{false, false, false, true, false, true, true};
    size_t call = 0;
    int seen_timeout = 0;
    AcquisitionOptions opts;
    opts.request_timeout_ms = 1234;
    AcquisitionLoop loop(
        Endpoint("10.0.0.5"),
        [&](const Endpoint& ep, int timeout_ms) -> std::optional<Reading> {
            assert(ep.host() == "10.0.0.5");
            seen_timeout = timeout_ms;
            if (script[call++]) return reading_at("t" + std::to_string(call));
            return std::nullopt;
        },
        bus, opts);
    std::vector<FailureNotice> notices;
    loop.set_notice_handler([&](FailureNotice n, uint64_t) { notices.push_back(n); });
    for (size_t i = 0; i < script.size(); ++i) loop.tick();
    if (seen_timeout != 1234) return 10;
    if (notices.size() != 2) return 11;
    if (notices[0] != FailureNotice::ConnectionLost || notices[1] != FailureNotice::ConnectionLost)
        return 12;
    if (sink.seen != std::vector<std::string>{"t4", "t6", "t7"}) return 13;
    const auto& st = loop.stats();
    if (st.ticks != 7 || st.successes != 3 || st.failures != 4) return 14;
    if (st.consecutive_failures != 0 || st.longest_streak != 3) return 15;
    return 0;
}

static int notice_schedule() {
    assert(notice_for(0, 10) == FailureNotice::None);
    assert(notice_for(1, 10) == FailureNotice::ConnectionLost);
    assert(notice_for(2, 10) == FailureNotice::None);
    assert(notice_for(10, 10) == FailureNotice::StillRetrying);
    assert(notice_for(11, 10) == FailureNotice::None);
    assert(notice_for(20, 10) == FailureNotice::StillRetrying);
    assert(notice_for(4, 2) == FailureNotice::StillRetrying);
    assert(notice_for(7, 0) == FailureNotice::None);
    return 0;
}

static int pacing() {
    if (pacing_delay(1000ms, 200ms) != 800ms) return 30;
    if (pacing_delay(1000ms, 1000ms) != 0ns) return 31;
    // a slow poll is not made up
    if (pacing_delay(1000ms, 3500ms) != 0ns) return 32;
    return 0;
}

// Tick starts stay one interval apart when the poll itself takes time.
static int run_spacing() {
    ReadingBus bus;
    std::vector<std::chrono::steady_clock::time_point> starts;
    std::atomic<bool> stop{false};
    AcquisitionOptions opts;
    opts.interval = 100ms;
    opts.sleep_slice = 10ms;
    AcquisitionLoop loop(
        Endpoint("10.0.0.5"),
        [&](const Endpoint&, int) -> std::optional<Reading> {
            starts.push_back(std::chrono::steady_clock::now());
            std::this_thread::sleep_for(30ms);
            if (starts.size() == 5) stop.store(true);
            return reading_at("t");
        },
        bus, opts);
    loop.run(stop);
    if (starts.size() != 5) return 40;
    for (size_t i = 1; i < starts.size(); ++i) {
        auto gap = starts[i] - starts[i - 1];
        if (gap < 95ms || gap > 250ms) return 41;
    }
    return 0;
}

// A stop request during a long pacing sleep is honored within a slice.
static int stop_during_sleep() {
    ReadingBus bus;
    std::atomic<bool> stop{false};
    AcquisitionOptions opts;
    opts.interval = 10s;
    opts.sleep_slice = 20ms;
    AcquisitionLoop loop(Endpoint("10.0.0.5"),
                         [](const Endpoint&, int) { return std::optional<Reading>(); }, bus, opts);
    loop.set_notice_handler([](FailureNotice, uint64_t) {});
    auto begin = std::chrono::steady_clock::now();
    std::thread stopper([&] {
        std::this_thread::sleep_for(100ms);
        stop.store(true);
    });
    loop.run(stop);
    stopper.join();
    auto took = std::chrono::steady_clock::now() - begin;
    if (took > 2s) return 50;
    if (loop.stats().ticks != 1) return 51;
    return 0;
}

// An injected sleeper sees the computed delay and can end the loop.
static int injected_sleeper() {
    ReadingBus bus;
    std::atomic<bool> stop{false};
    AcquisitionOptions opts;
    opts.interval = 500ms;
    AcquisitionLoop loop(Endpoint("10.0.0.5"),
                         [](const Endpoint&, int) { return std::optional<Reading>(reading_at("t")); },
                         bus, opts);
    std::vector<std::chrono::nanoseconds> delays;
    loop.set_sleeper([&](std::chrono::nanoseconds d, const std::atomic<bool>&) {
        delays.push_back(d);
        if (delays.size() == 3) stop.store(true);
    });
    loop.run(stop);
    if (delays.size() != 3) return 60;
    for (auto d : delays) {
        if (d > 500ms || d < 400ms) return 61;
    }
    return 0;
}

int main() {
    if (int rc = outage_notices()) return rc;
    if (int rc = streak_reset()) return rc;
    if (int rc = notice_schedule()) return rc;
    if (int rc = pacing()) return rc;
    if (int rc = run_spacing()) return rc;
    if (int rc = stop_during_sleep()) return rc;
    if (int rc = injected_sleeper()) return rc;
    return 0;
}
