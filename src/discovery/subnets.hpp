#pragma once
#include <optional>
#include <string>
#include <vector>

namespace wcl {
// Subnets are written as their first three octets, e.g. "192.168.1".

// True for exactly four dot-separated decimal octets, each in [0, 255].
bool is_valid_ipv4(const std::string& text);

// Local address the kernel would use for outbound traffic. A UDP connect()
// only selects a route, so nothing is sent.
std::optional<std::string> local_ipv4_via_route(const std::string& probe_ip = "8.8.8.8",
                                                int probe_port = 80);

// "192.168.8.17" -> "192.168.8"; empty for anything that is not an IPv4 address.
std::string subnet_of(const std::string& ipv4);

// Hosts .1 to .254 of `subnet`, ascending by final octet.
std::vector<std::string> subnet_hosts(const std::string& subnet);

const std::vector<std::string>& fallback_subnets();

// Configured list, else the local route's /24, else the fallback list.
std::vector<std::string> candidate_subnets(const std::vector<std::string>& configured,
                                           const std::optional<std::string>& local_ip);
}  // namespace wcl
