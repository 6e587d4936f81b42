#include <cassert>
#include <chrono>
#include <string>

#include "../src/acquire/telemetry.hpp"
#include "../src/net/http_client.hpp"
#include "../src/probes/device_probe.hpp"
#include "support/fake_device.hpp"

using wcl_test::FakeDevice;

int main() {
    wcl::CurlGlobal curl;
    if (!curl.ready()) return 1;

    const std::string telemetry = "{\"SOC_pct\":87.5,\"HV_Voltage_V\":398.2}";

    {
        FakeDevice dev(200, telemetry);
        if (dev.port() == 0) return 2;
        wcl::DeviceProbe probe(dev.port());
        auto res = probe.probe("127.0.0.1", 1000);
        if (!res.confirmed) return 3;
        if (!res.error_category.empty()) return 4;

        // the acquisition path uses the same endpoint, port included
        auto reading = wcl::fetch_reading(wcl::Endpoint("127.0.0.1", dev.port()), 1000);
        if (!reading) return 5;
        if (reading->fields.size() != 2) return 6;
        if (reading->captured_at.empty()) return 7;
        if (dev.requests() != 2) return 8;
    }

    // a web page is not a device
    {
        FakeDevice dev(200, "<html><body>router</body></html>");
        wcl::DeviceProbe probe(dev.port());
        auto res = probe.probe("127.0.0.1", 1000);
        if (res.confirmed) return 10;
        if (res.error_category != "malformed") return 11;
    }

    // JSON behind an error status is not a device either
    {
        FakeDevice dev(404, "{\"error\":\"not found\"}");
        wcl::DeviceProbe probe(dev.port());
        auto res = probe.probe("127.0.0.1", 1000);
        if (res.confirmed) return 20;
        if (res.error_category != "http_status") return 21;
        auto resp = wcl::http_get("http://127.0.0.1:" + std::to_string(dev.port()) + "/", 1000);
        if (resp.ok || resp.status != 404) return 22;
        if (wcl::fetch_reading(wcl::Endpoint("127.0.0.1", dev.port()), 1000)) return 23;
    }

    // nothing listening
    {
        wcl::DeviceProbe probe(1);
        auto res = probe.probe("127.0.0.1", 500);
        if (res.confirmed) return 30;
        if (res.error_category != "transport") return 31;
    }

    // a host that accepts but never answers is bounded by the timeout
    {
        FakeDevice dev(200, telemetry, true);
        wcl::DeviceProbe probe(dev.port());
        auto start = std::chrono::steady_clock::now();
        auto res = probe.probe("127.0.0.1", 300);
        auto took = std::chrono::steady_clock::now() - start;
        if (res.confirmed) return 40;
        if (took > std::chrono::seconds(2)) return 41;
    }

    assert(wcl::DeviceProbe::looks_like_device("[]"));
    assert(!wcl::DeviceProbe::looks_like_device("42"));
    assert(!wcl::curl_version_string().empty());
    return 0;
}
