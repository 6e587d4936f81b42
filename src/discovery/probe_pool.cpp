#include "probe_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>

#include "../core/logger.hpp"

namespace wcl {
ProbePool::ProbePool(size_t max_workers) : max_workers_(std::max<size_t>(1, max_workers)) {}

std::vector<bool> ProbePool::run(const std::vector<std::string>& addresses, int timeout_ms,
                                 const ProbeFn& probe) const {
    // vector<bool> packs bits; workers write distinct bytes instead
    std::vector<char> hits(addresses.size(), 0);
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= addresses.size()) return;
            try {
                hits[i] = probe(addresses[i], timeout_ms) ? 1 : 0;
            } catch (const std::exception& e) {
                log(LogLevel::WARN, "probe " + addresses[i] + " threw: " + e.what());
            }
        }
    };

    size_t n = std::min(max_workers_, addresses.size());
    std::vector<std::thread> threads;
    threads.reserve(n);
    for (size_t t = 0; t < n; ++t) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            log(LogLevel::WARN, std::string("probe pool short of threads: ") + e.what());
            break;
        }
    }
    if (threads.empty()) worker();
    for (auto& th : threads) th.join();

    return std::vector<bool>(hits.begin(), hits.end());
}
}  // namespace wcl
