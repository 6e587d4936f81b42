#pragma once
#include <functional>
#include <optional>
#include <string>

#include "../core/reading_bus.hpp"
#include "../probes/device_probe.hpp"

namespace wcl {
// Body of /autopid_data -> Reading. Empty when the body is not a JSON object
// or the object carries no fields. Nested arrays/objects are kept as compact
// JSON text; a device field called "timestamp" is dropped because the capture
// time owns that column.
std::optional<Reading> decode_reading(const std::string& body, const std::string& captured_at);

// One poll of the endpoint; empty on transport error, timeout, non-2xx or a
// malformed body.
std::optional<Reading> fetch_reading(const Endpoint& endpoint, int timeout_ms);

using FetchFn = std::function<std::optional<Reading>(const Endpoint& endpoint, int timeout_ms)>;
}  // namespace wcl
