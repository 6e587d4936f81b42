#pragma once
#include <string>

namespace wcl {
struct HttpResponse {
    bool ok{false};
    long status{0};
    std::string body;
    std::string error;
    double elapsed_ms{0.0};
};

// Process-wide libcurl setup. Construct once in main() before any thread
// issues requests.
class CurlGlobal {
   public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    bool ready() const { return ready_; }

   private:
    bool ready_{false};
};

// Blocking GET bounded by `timeout_ms` end to end. `ok` is set only for a
// completed transfer with a 2xx status; never throws.
HttpResponse http_get(const std::string& url, int timeout_ms);

std::string curl_version_string();
}  // namespace wcl
