#include "device_probe.hpp"

#include <exception>

#include "../core/logger.hpp"
#include "../net/http_client.hpp"
#include "../net/json_body.hpp"

namespace wcl {
bool DeviceProbe::looks_like_device(const std::string& body) {
    Json::Value root;
    if (!parse_json_body(body, root)) return false;
    return root.isObject() || root.isArray();
}

ProbeResult DeviceProbe::probe(const std::string& address, int timeout_ms) const {
    ProbeResult result;
    try {
        Endpoint candidate(address, port_);
        HttpResponse resp = http_get(candidate.telemetry_url(), timeout_ms);
        result.latency_ms = resp.elapsed_ms;
        if (!resp.ok) {
            result.error_category = resp.status ? "http_status" : "transport";
            log(LogLevel::DEBUG, "probe " + address + ": " + resp.error);
            return result;
        }
        if (!looks_like_device(resp.body)) {
            result.error_category = "malformed";
            log(LogLevel::DEBUG, "probe " + address + ": body is not a JSON object/array");
            return result;
        }
        result.confirmed = true;
        log(LogLevel::DEBUG, "probe " + address + ": confirmed in " +
                                 std::to_string(static_cast<int>(result.latency_ms)) + " ms");
    } catch (const std::exception& e) {
        result.confirmed = false;
        result.error_category = "internal";
        log(LogLevel::WARN, "probe " + address + " failed: " + e.what());
    }
    return result;
}
}  // namespace wcl
