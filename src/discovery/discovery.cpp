#include "discovery.hpp"

#include "../core/logger.hpp"
#include "probe_pool.hpp"
#include "subnets.hpp"

namespace wcl {
const char* phase_name(DiscoveryPhase phase) {
    switch (phase) {
        case DiscoveryPhase::Hostname: return "hostname";
        case DiscoveryPhase::CommonAddress: return "common-address";
        case DiscoveryPhase::SubnetSweep: return "subnet-sweep";
    }
    return "?";
}

DiscoveryEngine::DiscoveryEngine(DiscoveryOptions opts, ProbeFn probe)
    : DiscoveryEngine(std::move(opts), std::move(probe), resolve_ipv4,
                      [] { return local_ipv4_via_route(); }) {}

DiscoveryEngine::DiscoveryEngine(DiscoveryOptions opts, ProbeFn probe, ResolveFn resolve,
                                 LocalAddressFn local_address)
    : opts_(std::move(opts)),
      probe_(std::move(probe)),
      resolve_(std::move(resolve)),
      local_address_(std::move(local_address)) {}

void DiscoveryEngine::report(const std::string& line) const {
    log(LogLevel::DEBUG, "discovery: " + line);
    if (progress_) progress_(line);
}

std::optional<std::string> DiscoveryEngine::hostname_phase() const {
    for (const auto& name : opts_.hostnames) {
        auto ip = resolve_(name);
        if (!ip) {
            report("  " + name + ": not found");
            continue;
        }
        if (probe_(*ip, opts_.hostname_timeout_ms)) {
            report("  " + name + ": found (" + *ip + ")");
            return ip;
        }
        report("  " + name + ": no response from " + *ip);
    }
    return std::nullopt;
}

std::optional<std::string> DiscoveryEngine::common_address_phase() const {
    ProbePool pool(opts_.common_parallelism);
    auto hits = pool.run(opts_.common_addresses, opts_.common_timeout_ms, probe_);
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i]) {
            report("  found device at " + opts_.common_addresses[i]);
            return opts_.common_addresses[i];
        }
    }
    report("  not found at common addresses");
    return std::nullopt;
}

std::optional<std::string> DiscoveryEngine::subnet_sweep_phase(
    std::vector<std::string>* scanned) const {
    std::optional<std::string> local;
    if (opts_.subnets.empty()) local = local_address_();
    auto subnets = candidate_subnets(opts_.subnets, local);
    ProbePool pool(opts_.sweep_parallelism);
    for (const auto& subnet : subnets) {
        if (scanned) scanned->push_back(subnet);
        auto hosts = subnet_hosts(subnet);
        auto hits = pool.run(hosts, opts_.sweep_timeout_ms, probe_);
        std::vector<std::string> found;
        for (size_t i = 0; i < hits.size(); ++i) {
            if (hits[i]) found.push_back(hosts[i]);
        }
        if (found.empty()) {
            report("  " + subnet + ".1-254: not found");
            continue;
        }
        std::string list;
        for (const auto& ip : found) list += (list.empty() ? "" : ", ") + ip;
        report("  " + subnet + ".1-254: found " + list);
        return found.front();
    }
    return std::nullopt;
}

DiscoveryOutcome DiscoveryEngine::discover() const {
    DiscoveryOutcome out;
    auto finish = [&](DiscoveryPhase phase, const std::string& ip) {
        out.found_in = phase;
        out.endpoint = Endpoint(ip, opts_.port);
        log(LogLevel::INFO, std::string("device confirmed at ") + ip + " (" + phase_name(phase) +
                                " phase)");
    };

    out.phases_run.push_back(DiscoveryPhase::Hostname);
    report("[1/3] Trying known hostnames...");
    if (auto ip = hostname_phase()) {
        finish(DiscoveryPhase::Hostname, *ip);
        return out;
    }

    out.phases_run.push_back(DiscoveryPhase::CommonAddress);
    report("[2/3] Trying common WiCAN addresses...");
    if (auto ip = common_address_phase()) {
        finish(DiscoveryPhase::CommonAddress, *ip);
        return out;
    }

    out.phases_run.push_back(DiscoveryPhase::SubnetSweep);
    report("[3/3] Scanning local network...");
    if (auto ip = subnet_sweep_phase(&out.subnets_scanned)) {
        finish(DiscoveryPhase::SubnetSweep, *ip);
        return out;
    }

    log(LogLevel::WARN, "discovery exhausted all phases without finding a device");
    return out;
}
}  // namespace wcl
