#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "acquire/acquisition_loop.hpp"
#include "acquire/telemetry.hpp"
#include "config/config.hpp"
#include "core/logger.hpp"
#include "core/reading_bus.hpp"
#include "discovery/discovery.hpp"
#include "discovery/subnets.hpp"
#include "net/http_client.hpp"
#include "probes/device_probe.hpp"
#include "store/csv_log.hpp"
#include "ui/console_view.hpp"
#include "ui/manual_entry.hpp"

using namespace wcl;

namespace {
std::atomic<bool> g_stop{false};

void on_stop_signal(int) { g_stop.store(true); }

void install_stop_handlers() {
    // no SA_RESTART: a blocking prompt read returns on Ctrl+C
    struct sigaction sa {};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

std::string banner_rule(char c, size_t n = 50) { return std::string(n, c); }
}  // namespace

static std::optional<Endpoint> discover_endpoint(const AppConfig& cfg, const ProbeFn& probe) {
    std::cout << banner_rule('=') << "\nWiCAN Auto-Discovery\n" << banner_rule('=') << "\n";
    DiscoveryEngine engine(cfg.discovery, probe);
    engine.set_progress([](const std::string& line) {
        if (line.rfind("[", 0) == 0) std::cout << "\n";
        std::cout << line << std::endl;
    });
    DiscoveryOutcome outcome = engine.discover();
    return outcome.endpoint;
}

static std::optional<Endpoint> manual_endpoint(const AppConfig& cfg, const ProbeFn& probe) {
    std::cout << "\n" << banner_rule('!') << "\nWARNING: Could not find WiCAN on network!\n"
              << banner_rule('!') << "\n\nTroubleshooting:\n"
              << "  1. Make sure WiCAN is powered on\n"
              << "  2. Check that you're on the same network\n"
              << "  3. Enter the IP address manually below\n";
    auto ip = prompt_for_address(std::cin, std::cout, probe, cfg.acquisition.manual_timeout_ms);
    if (!ip) return std::nullopt;
    return Endpoint(*ip, cfg.discovery.port);
}

static void print_summary(const CsvLogWriter& writer, const AcquisitionStats& stats) {
    std::cout << "\n\n" << banner_rule('=') << "\nLogging stopped.\n";
    std::cout << "Total rows: " << writer.rows_written() << "\n";
    if (writer.rows_recorded() > writer.rows_written())
        std::cout << "Rows not saved (see errors above): "
                  << writer.rows_recorded() - writer.rows_written() << "\n";
    std::cout << "Total fields: " << writer.schema().size() << "\n";
    std::cout << "Polls: " << stats.ticks << " (" << stats.failures << " failed, longest outage "
              << stats.longest_streak << ")\n";
    if (writer.rows_written() == 0) return;
    std::cout << "Data saved to: " << writer.path() << "\n\nAll fields captured:\n";
    const auto& fields = writer.schema();
    for (size_t i = 0; i < fields.size(); ++i) {
        char num[16];
        std::snprintf(num, sizeof(num), "%3zu", i + 1);
        std::cout << "  " << num << ". " << fields[i] << "\n";
    }
}

static int cmd_run(const AppConfig& cfg) {
    auto started = std::chrono::system_clock::now();
    std::string out_path = output_path(cfg, started);
    DeviceProbe prober(cfg.discovery.port);
    ProbeFn probe = prober.as_fn();

    std::cout << "\n" << banner_rule('#') << "\n#  WiCAN Data Logger - Auto Discovery\n"
              << banner_rule('#') << "\n\n";

    std::optional<Endpoint> endpoint;
    if (!cfg.device_address.empty()) {
        std::cout << "Using configured address: " << cfg.device_address << "\n";
        endpoint = Endpoint(cfg.device_address, cfg.discovery.port);
    } else {
        endpoint = discover_endpoint(cfg, probe);
        if (!endpoint && !g_stop.load()) endpoint = manual_endpoint(cfg, probe);
    }
    if (!endpoint || g_stop.load()) {
        std::cout << "No device selected.\n";
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.output.directory, ec);
    if (ec) {
        log(LogLevel::ERROR, "cannot create output directory " + cfg.output.directory + ": " +
                                 ec.message());
        return 1;
    }

    std::cout << "\n" << banner_rule('=') << "\n";
    std::cout << "WiCAN found at: " << endpoint->authority() << "\n";
    std::cout << "Output file: " << out_path << "\n";
    std::cout << "Interval: " << cfg.acquisition.interval_s
              << "s | Display: " << display_mode_name(cfg.display) << "\n";
    std::cout << banner_rule('=') << "\n\nPress Ctrl+C to stop logging\n\n";

    ReadingBus bus;
    CsvLogWriter writer(out_path);
    ConsoleView view(std::cout, cfg.display);
    bus.add_sink(&writer);
    bus.add_sink(&view);

    AcquisitionOptions opts;
    opts.interval = poll_interval(cfg.acquisition);
    opts.request_timeout_ms = cfg.acquisition.request_timeout_ms;
    opts.notice_every = cfg.acquisition.notice_every;

    AcquisitionLoop loop(*endpoint, fetch_reading, bus, opts);
    loop.set_notice_handler([](FailureNotice notice, uint64_t count) {
        if (notice == FailureNotice::ConnectionLost)
            std::cout << "Connection lost, reconnecting..." << std::endl;
        else
            std::cout << "Still trying... (attempt " << count << ")" << std::endl;
        log(LogLevel::DEBUG, "consecutive failed polls: " + std::to_string(count));
    });
    loop.run(g_stop);

    print_summary(writer, loop.stats());
    return 0;
}

static int cmd_discover(const AppConfig& cfg) {
    DeviceProbe prober(cfg.discovery.port);
    auto endpoint = discover_endpoint(cfg, prober.as_fn());
    if (!endpoint) {
        std::cout << "\nNo WiCAN device found.\n";
        return 2;
    }
    std::cout << "\n" << endpoint->authority() << "\n";
    return 0;
}

static int cmd_doctor(const AppConfig& cfg) {
    std::cout << "Doctor checks:\n";
    std::cout << " - libcurl: " << curl_version_string() << "\n";
    auto local = local_ipv4_via_route();
    if (local)
        std::cout << " - local address: " << *local << " (subnet " << subnet_of(*local) << ")\n";
    else
        std::cout << " - local address: unavailable (no default route)\n";
    auto subnets = candidate_subnets(cfg.discovery.subnets, local);
    std::cout << " - sweep subnets:";
    for (const auto& s : subnets) std::cout << " " << s;
    std::cout << "\n";
    std::error_code ec;
    std::filesystem::create_directories(cfg.output.directory, ec);
    bool writable = !ec && ::access(cfg.output.directory.c_str(), W_OK) == 0;
    std::cout << " - output directory " << cfg.output.directory << ": "
              << (writable ? "writable" : "NOT writable") << "\n";
    std::cout << "\nEffective configuration:\n" << dump_app_config(cfg) << "\n";
    return writable ? 0 : 1;
}

static void print_usage() {
    std::cerr << "Usage: wcl <run|discover|doctor> [options]\n"
              << "  run       discover the device (or use --address) and log telemetry to CSV\n"
              << "  discover  run discovery only and print the device address\n"
              << "  doctor    show environment checks and the effective configuration\n"
              << "Options:\n"
              << "  --config <file.yaml>   load settings from YAML\n"
              << "  --address <ip|host>    skip discovery\n"
              << "  --port <n>             device HTTP port (default 80)\n"
              << "  --hostname <name>      hostname to try (repeatable)\n"
              << "  --subnet <a.b.c>       subnet to sweep (repeatable)\n"
              << "  --interval <seconds>   polling interval (default 1)\n"
              << "  --out <dir>            output directory (default .)\n"
              << "  --display <all|compact|key>\n"
              << "  --log-level <debug|info|warn|error>\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    if (cmd != "run" && cmd != "discover" && cmd != "doctor") {
        std::cerr << "Unknown command\n";
        print_usage();
        return 1;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    AppConfig cfg;
    try {
        std::string path = config_path_from_args(args);
        if (!path.empty()) load_app_config(path, cfg);
        apply_cli_args(args, cfg);
        validate_app_config(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        print_usage();
        return 1;
    }
    set_log_level(cfg.log_level);

    CurlGlobal curl;
    if (!curl.ready()) return 1;
    install_stop_handlers();

    if (cmd == "run") return cmd_run(cfg);
    if (cmd == "discover") return cmd_discover(cfg);
    return cmd_doctor(cfg);
}
