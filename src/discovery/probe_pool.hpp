#pragma once
#include <string>
#include <vector>

#include "../probes/device_probe.hpp"

namespace wcl {
// Fixed-size pool of probe workers. A batch is fully drained before run()
// returns; results line up with the input order so callers can break ties
// deterministically.
class ProbePool {
   public:
    explicit ProbePool(size_t max_workers);

    std::vector<bool> run(const std::vector<std::string>& addresses, int timeout_ms,
                          const ProbeFn& probe) const;

    size_t max_workers() const { return max_workers_; }

   private:
    size_t max_workers_;
};
}  // namespace wcl
