#include "subnets.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cctype>

#include "../core/fd.hpp"
#include "../core/logger.hpp"

namespace wcl {
bool is_valid_ipv4(const std::string& text) {
    int parts = 0;
    size_t start = 0;
    while (true) {
        size_t dot = text.find('.', start);
        std::string part = text.substr(start, dot == std::string::npos ? std::string::npos
                                                                         : dot - start);
        if (part.empty() || part.size() > 3) return false;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        if (std::stoi(part) > 255) return false;
        ++parts;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts == 4;
}

std::optional<std::string> local_ipv4_via_route(const std::string& probe_ip, int probe_port) {
    Fd sock = Fd::open_socket(AF_INET, SOCK_DGRAM);
    if (!sock) {
        log(LogLevel::DEBUG, "route lookup: socket() failed");
        return std::nullopt;
    }
    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(static_cast<uint16_t>(probe_port));
    if (::inet_pton(AF_INET, probe_ip.c_str(), &dst.sin_addr) != 1) return std::nullopt;
    if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
        log(LogLevel::DEBUG, "route lookup: no route to " + probe_ip);
        return std::nullopt;
    }
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &len) < 0)
        return std::nullopt;
    char ipbuf[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &local.sin_addr, ipbuf, sizeof(ipbuf))) return std::nullopt;
    std::string ip(ipbuf);
    if (ip == "0.0.0.0") return std::nullopt;
    return ip;
}

std::string subnet_of(const std::string& ipv4) {
    if (!is_valid_ipv4(ipv4)) return "";
    return ipv4.substr(0, ipv4.rfind('.'));
}

std::vector<std::string> subnet_hosts(const std::string& subnet) {
    std::vector<std::string> out;
    out.reserve(254);
    for (int i = 1; i <= 254; ++i) out.push_back(subnet + "." + std::to_string(i));
    return out;
}

const std::vector<std::string>& fallback_subnets() {
    static const std::vector<std::string> subnets{"192.168.1", "192.168.0", "192.168.8",
                                                  "10.0.0"};
    return subnets;
}

std::vector<std::string> candidate_subnets(const std::vector<std::string>& configured,
                                           const std::optional<std::string>& local_ip) {
    if (!configured.empty()) return configured;
    if (local_ip) {
        std::string subnet = subnet_of(*local_ip);
        if (!subnet.empty()) return {subnet};
    }
    return fallback_subnets();
}
}  // namespace wcl
