#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/logger.hpp"
#include "../discovery/discovery.hpp"
#include "../ui/console_view.hpp"

namespace wcl {
class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Bounds on acquisition.interval_s; the loop paces in whole milliseconds.
constexpr double kMinIntervalS = 0.001;
constexpr double kMaxIntervalS = 3600.0;

struct AcquisitionConfig {
    double interval_s{1.0};
    int request_timeout_ms{5000};
    uint64_t notice_every{10};
    int manual_timeout_ms{3000};
};

struct OutputConfig {
    std::string directory{"."};
    std::string prefix{"wican_log_"};
};

struct AppConfig {
    // empty => run discovery
    std::string device_address;
    DiscoveryOptions discovery{};
    AcquisitionConfig acquisition{};
    OutputConfig output{};
    DisplayMode display{DisplayMode::All};
    LogLevel log_level{LogLevel::INFO};
};

// Overlays a YAML document (file or text) onto `cfg`. Keys that are absent
// keep their current value.
void load_app_config(const std::string& path, AppConfig& cfg);
void apply_config_yaml(const std::string& text, AppConfig& cfg);

// Overlays command-line flags (everything after the subcommand). Repeated
// --hostname / --subnet flags replace the configured list.
void apply_cli_args(const std::vector<std::string>& args, AppConfig& cfg);

// Path of --config if present in `args`, else empty.
std::string config_path_from_args(const std::vector<std::string>& args);

void validate_app_config(const AppConfig& cfg);

// Polling interval rounded to whole milliseconds; call after validation.
std::chrono::milliseconds poll_interval(const AcquisitionConfig& acq);

std::string output_path(const AppConfig& cfg, std::chrono::system_clock::time_point started);

std::string dump_app_config(const AppConfig& cfg);
}  // namespace wcl
