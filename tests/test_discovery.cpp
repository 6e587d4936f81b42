#include <atomic>
#include <cassert>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../src/discovery/discovery.hpp"
#include "../src/discovery/subnets.hpp"

using namespace wcl;

namespace {
// Stands in for the network: a fixed set of addresses answer as devices.
struct FakeNetwork {
    std::set<std::string> devices;
    std::mutex mu;
    std::vector<std::string> probed;

    ProbeFn probe() {
        return [this](const std::string& ip, int) {
            std::lock_guard<std::mutex> lk(mu);
            probed.push_back(ip);
            return devices.count(ip) > 0;
        };
    }
    size_t probed_with_prefix(const std::string& prefix) {
        std::lock_guard<std::mutex> lk(mu);
        size_t n = 0;
        for (const auto& ip : probed) n += ip.rfind(prefix, 0) == 0;
        return n;
    }
};

ResolveFn resolver(std::optional<std::string> wican_local) {
    return [wican_local](const std::string& name) -> std::optional<std::string> {
        if (name == "wican.local") return wican_local;
        return std::nullopt;
    };
}

LocalAddressFn no_route() {
    return [] { return std::optional<std::string>(); };
}
}  // namespace

static int hostname_hit_stops_early() {
    FakeNetwork net;
    net.devices = {"192.168.50.7"};
    DiscoveryEngine engine(DiscoveryOptions{}, net.probe(), resolver("192.168.50.7"), no_route());
    auto out = engine.discover();
    if (!out.endpoint || out.endpoint->host() != "192.168.50.7") return 1;
    if (out.found_in != DiscoveryPhase::Hostname) return 2;
    if (out.phases_run.size() != 1) return 3;
    if (net.probed.size() != 1) return 4;
    return 0;
}

static int resolved_but_silent_host_falls_through() {
    FakeNetwork net;
    net.devices = {"192.168.4.1"};
    DiscoveryEngine engine(DiscoveryOptions{}, net.probe(), resolver("192.168.50.7"), no_route());
    auto out = engine.discover();
    if (!out.endpoint || out.endpoint->host() != "192.168.4.1") return 10;
    if (out.found_in != DiscoveryPhase::CommonAddress) return 11;
    if (out.phases_run.size() != 2) return 12;
    return 0;
}

// Device at the fourth of six common addresses: returned, no sweep issued.
static int common_address_no_sweep() {
    FakeNetwork net;
    DiscoveryOptions opts;
    net.devices = {opts.common_addresses[3]};
    DiscoveryEngine engine(opts, net.probe(), resolver(std::nullopt), no_route());
    auto out = engine.discover();
    if (!out.endpoint || out.endpoint->host() != opts.common_addresses[3]) return 20;
    if (out.phases_run.size() != 2) return 21;
    if (!out.subnets_scanned.empty()) return 22;
    if (net.probed.size() != opts.common_addresses.size()) return 23;
    return 0;
}

// Several common addresses answer: the earliest in the list wins every time.
static int common_address_tie_break() {
    DiscoveryOptions opts;
    for (int round = 0; round < 20; ++round) {
        FakeNetwork net;
        net.devices = {opts.common_addresses[5], opts.common_addresses[2],
                       opts.common_addresses[4]};
        DiscoveryEngine engine(opts, net.probe(), resolver(std::nullopt), no_route());
        auto out = engine.discover();
        if (!out.endpoint || out.endpoint->host() != opts.common_addresses[2]) return 30;
    }
    return 0;
}

static int sweep_picks_lowest_octet() {
    for (int round = 0; round < 5; ++round) {
        FakeNetwork net;
        net.devices = {"10.9.9.200", "10.9.9.37", "10.9.9.120"};
        DiscoveryOptions opts;
        opts.common_addresses.clear();
        DiscoveryEngine engine(opts, net.probe(), resolver(std::nullopt),
                               [] { return std::optional<std::string>("10.9.9.14"); });
        auto out = engine.discover();
        if (!out.endpoint || out.endpoint->host() != "10.9.9.37") return 40;
        if (out.found_in != DiscoveryPhase::SubnetSweep) return 41;
        if (out.subnets_scanned != std::vector<std::string>{"10.9.9"}) return 42;
        // the whole /24 is drained before the result is taken
        if (net.probed_with_prefix("10.9.9.") != 254) return 43;
    }
    return 0;
}

static int configured_subnets_first() {
    FakeNetwork net;
    net.devices = {"172.16.3.9"};
    DiscoveryOptions opts;
    opts.common_addresses.clear();
    opts.subnets = {"172.16.2", "172.16.3", "172.16.4"};
    std::atomic<int> route_lookups{0};
    DiscoveryEngine engine(opts, net.probe(), resolver(std::nullopt), [&] {
        ++route_lookups;
        return std::optional<std::string>("192.168.1.5");
    });
    auto out = engine.discover();
    if (!out.endpoint || out.endpoint->host() != "172.16.3.9") return 50;
    if (out.subnets_scanned != std::vector<std::string>{"172.16.2", "172.16.3"}) return 51;
    if (route_lookups.load() != 0) return 52;
    if (net.probed_with_prefix("172.16.4.") != 0) return 53;
    return 0;
}

static int nothing_found() {
    FakeNetwork net;
    DiscoveryOptions opts;
    opts.port = 8080;
    std::vector<std::string> progress;
    DiscoveryEngine engine(opts, net.probe(), resolver(std::nullopt), no_route());
    engine.set_progress([&](const std::string& line) { progress.push_back(line); });
    auto out = engine.discover();
    if (out.endpoint) return 60;
    if (out.phases_run.size() != 3) return 61;
    if (out.subnets_scanned != fallback_subnets()) return 62;
    if (net.probed.size() != opts.common_addresses.size() + 4 * 254) return 63;
    bool saw_phase3 = false;
    for (const auto& l : progress) saw_phase3 |= l == "[3/3] Scanning local network...";
    if (!saw_phase3) return 64;
    return 0;
}

static int endpoint_carries_port() {
    FakeNetwork net;
    net.devices = {"192.168.4.1"};
    DiscoveryOptions opts;
    opts.port = 8080;
    DiscoveryEngine engine(opts, net.probe(), resolver(std::nullopt), no_route());
    auto out = engine.discover();
    if (!out.endpoint) return 70;
    if (out.endpoint->port() != 8080) return 71;
    if (out.endpoint->telemetry_url() != "http://192.168.4.1:8080/autopid_data") return 72;
    if (Endpoint("192.168.4.1").telemetry_url() != "http://192.168.4.1/autopid_data") return 73;
    return 0;
}

int main() {
    if (int rc = hostname_hit_stops_early()) return rc;
    if (int rc = resolved_but_silent_host_falls_through()) return rc;
    if (int rc = common_address_no_sweep()) return rc;
    if (int rc = common_address_tie_break()) return rc;
    if (int rc = sweep_picks_lowest_octet()) return rc;
    if (int rc = configured_subnets_first()) return rc;
    if (int rc = nothing_found()) return rc;
    if (int rc = endpoint_carries_port()) return rc;
    assert(std::string(phase_name(DiscoveryPhase::SubnetSweep)) == "subnet-sweep");
    return 0;
}
