#include "resolve.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "../core/logger.hpp"

namespace wcl {
std::optional<std::string> resolve_ipv4(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        log(LogLevel::DEBUG, "resolve " + host + ": " + gai_strerror(rc));
        if (res) freeaddrinfo(res);
        return std::nullopt;
    }
    char ipbuf[INET_ADDRSTRLEN] = {};
    const auto* sa = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
    bool ok = inet_ntop(AF_INET, &sa->sin_addr, ipbuf, sizeof(ipbuf)) != nullptr;
    freeaddrinfo(res);
    if (!ok) return std::nullopt;
    return std::string(ipbuf);
}
}  // namespace wcl
