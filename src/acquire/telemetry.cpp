#include "telemetry.hpp"

#include <cstdint>
#include <limits>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"
#include "../net/http_client.hpp"
#include "../net/json_body.hpp"

namespace wcl {
namespace {
FieldValue to_field(const Json::Value& v) {
    switch (v.type()) {
        case Json::nullValue: return FieldValue::null();
        case Json::intValue: return FieldValue::of_integer(v.asInt64());
        case Json::uintValue:
            if (v.asUInt64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return FieldValue::of_real(v.asDouble());
            return FieldValue::of_integer(static_cast<int64_t>(v.asUInt64()));
        case Json::realValue: return FieldValue::of_real(v.asDouble());
        case Json::stringValue: return FieldValue::of_text(v.asString());
        case Json::booleanValue: return FieldValue::of_boolean(v.asBool());
        case Json::arrayValue:
        case Json::objectValue: return FieldValue::of_text(to_compact_json(v));
    }
    return FieldValue::null();
}
}  // namespace

std::optional<Reading> decode_reading(const std::string& body, const std::string& captured_at) {
    Json::Value root;
    std::string err;
    if (!parse_json_body(body, root, &err)) {
        log(LogLevel::DEBUG, "telemetry body is not JSON: " + err);
        return std::nullopt;
    }
    if (!root.isObject()) {
        log(LogLevel::DEBUG, "telemetry body is not a JSON object");
        return std::nullopt;
    }
    Reading reading;
    reading.captured_at = captured_at;
    reading.ts_monotonic_ns = monotonic_ns();
    for (const auto& name : root.getMemberNames()) {
        if (name == "timestamp") continue;
        reading.fields.emplace(name, to_field(root[name]));
    }
    if (reading.fields.empty()) return std::nullopt;
    return reading;
}

std::optional<Reading> fetch_reading(const Endpoint& endpoint, int timeout_ms) {
    HttpResponse resp = http_get(endpoint.telemetry_url(), timeout_ms);
    if (!resp.ok) {
        log(LogLevel::DEBUG, "poll " + endpoint.authority() + ": " + resp.error);
        return std::nullopt;
    }
    return decode_reading(resp.body, local_time_iso8601());
}
}  // namespace wcl
