#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"

namespace wcl {
namespace {
// Device answers are a few KB; anything past this is not the telemetry endpoint.
constexpr size_t kMaxBodyBytes = 4 * 1024 * 1024;

size_t write_body(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    size_t n = size * nmemb;
    if (body->size() + n > kMaxBodyBytes) return 0;
    body->append(static_cast<const char*>(contents), n);
    return n;
}

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
}  // namespace

CurlGlobal::CurlGlobal() {
    ready_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    if (!ready_) log(LogLevel::ERROR, "curl_global_init failed");
}

CurlGlobal::~CurlGlobal() {
    if (ready_) curl_global_cleanup();
}

HttpResponse http_get(const std::string& url, int timeout_ms) {
    HttpResponse response;
    uint64_t start = monotonic_ns();
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        response.error = "curl_easy_init failed";
        return response;
    }
    CURL* h = handle.get();
    long timeout = timeout_ms > 0 ? timeout_ms : 1;
    char errbuf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeout);
    curl_easy_setopt(h, CURLOPT_PROXY, "");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "wcl/1.0");
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(h);
    response.elapsed_ms = (monotonic_ns() - start) / 1e6;
    if (rc != CURLE_OK) {
        response.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return response;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    response.ok = response.status >= 200 && response.status < 300;
    if (!response.ok) response.error = "HTTP " + std::to_string(response.status);
    return response;
}

std::string curl_version_string() { return curl_version(); }
}  // namespace wcl
