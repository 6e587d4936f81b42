#pragma once
#include <functional>
#include <optional>
#include <string>

namespace wcl {
// IPv4 address for `host` via the system resolver (mDNS names included when
// nss-mdns is configured). Empty when the name does not resolve.
std::optional<std::string> resolve_ipv4(const std::string& host);

using ResolveFn = std::function<std::optional<std::string>(const std::string& host)>;
}  // namespace wcl
