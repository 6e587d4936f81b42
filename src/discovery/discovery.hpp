#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../probes/device_probe.hpp"
#include "../probes/resolve.hpp"

namespace wcl {
enum class DiscoveryPhase { Hostname, CommonAddress, SubnetSweep };

const char* phase_name(DiscoveryPhase phase);

struct DiscoveryOptions {
    int port{80};
    std::vector<std::string> hostnames{"wican.local", "wican"};
    // WiCAN AP mode first, then the ESP32 AP default and common DHCP leases
    std::vector<std::string> common_addresses{"192.168.8.102", "192.168.4.1",   "192.168.1.100",
                                              "192.168.1.102", "192.168.0.100", "192.168.0.102"};
    std::vector<std::string> subnets;
    int hostname_timeout_ms{1000};
    int common_timeout_ms{1000};
    int sweep_timeout_ms{500};
    size_t common_parallelism{10};
    size_t sweep_parallelism{50};
};

struct DiscoveryOutcome {
    std::optional<Endpoint> endpoint;
    std::optional<DiscoveryPhase> found_in;
    std::vector<DiscoveryPhase> phases_run;
    std::vector<std::string> subnets_scanned;
};

using LocalAddressFn = std::function<std::optional<std::string>()>;
using ProgressFn = std::function<void(const std::string& line)>;

// Escalating search for the gateway: known hostnames, then a short list of
// well-known addresses probed in parallel, then a /24 sweep. Stops at the
// first phase that confirms a device.
class DiscoveryEngine {
   public:
    DiscoveryEngine(DiscoveryOptions opts, ProbeFn probe);
    DiscoveryEngine(DiscoveryOptions opts, ProbeFn probe, ResolveFn resolve,
                    LocalAddressFn local_address);

    void set_progress(ProgressFn progress) { progress_ = std::move(progress); }

    DiscoveryOutcome discover() const;

    std::optional<std::string> hostname_phase() const;
    std::optional<std::string> common_address_phase() const;
    std::optional<std::string> subnet_sweep_phase(std::vector<std::string>* scanned) const;

   private:
    DiscoveryOptions opts_;
    ProbeFn probe_;
    ResolveFn resolve_;
    LocalAddressFn local_address_;
    ProgressFn progress_;

    void report(const std::string& line) const;
};
}  // namespace wcl
