#pragma once
#include <functional>
#include <string>
#include <utility>

namespace wcl {
constexpr const char* kTelemetryPath = "/autopid_data";

// Address confirmed to host the telemetry gateway. Fixed for the session.
class Endpoint {
   public:
    explicit Endpoint(std::string host, int port = 80) : host_(std::move(host)), port_(port) {}
    const std::string& host() const { return host_; }
    int port() const { return port_; }
    std::string authority() const {
        return port_ == 80 ? host_ : host_ + ":" + std::to_string(port_);
    }
    std::string telemetry_url() const { return "http://" + authority() + kTelemetryPath; }

   private:
    std::string host_;
    int port_;
};

struct ProbeResult {
    bool confirmed{false};
    double latency_ms{0.0};
    std::string error_category;
};

// Address + timeout -> confirmed? Discovery takes this so tests can stand in
// for the network.
using ProbeFn = std::function<bool(const std::string& address, int timeout_ms)>;

class DeviceProbe {
   public:
    explicit DeviceProbe(int port = 80) : port_(port) {}

    // GET /autopid_data on `address`; confirmed only if the body is a JSON
    // object or array. Never throws.
    ProbeResult probe(const std::string& address, int timeout_ms) const;

    ProbeFn as_fn() const {
        return [this](const std::string& address, int timeout_ms) {
            return probe(address, timeout_ms).confirmed;
        };
    }

    static bool looks_like_device(const std::string& body);

   private:
    int port_;
};
}  // namespace wcl
