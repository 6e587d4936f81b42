#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

#include "../core/time_utils.hpp"
#include "../discovery/subnets.hpp"

namespace wcl {
namespace {
std::vector<std::string> string_list(const YAML::Node& n, const char* key) {
    if (!n.IsSequence()) throw ConfigError(std::string(key) + " must be a list");
    std::vector<std::string> out;
    out.reserve(n.size());
    for (const auto& item : n) out.push_back(item.as<std::string>());
    return out;
}

bool is_subnet(const std::string& s) { return is_valid_ipv4(s + ".1"); }

void apply_yaml(const YAML::Node& y, AppConfig& cfg) {
    if (!y || y.IsNull()) return;
    if (!y.IsMap()) throw ConfigError("configuration root must be a mapping");

    if (auto d = y["device"]) {
        if (d["address"]) cfg.device_address = d["address"].as<std::string>();
        if (d["port"]) cfg.discovery.port = d["port"].as<int>();
    }

    if (auto d = y["discovery"]) {
        auto& o = cfg.discovery;
        if (d["hostnames"]) o.hostnames = string_list(d["hostnames"], "discovery.hostnames");
        if (d["common_addresses"])
            o.common_addresses = string_list(d["common_addresses"], "discovery.common_addresses");
        if (d["subnets"]) o.subnets = string_list(d["subnets"], "discovery.subnets");
        if (d["hostname_timeout_ms"])
            o.hostname_timeout_ms = std::max(50, d["hostname_timeout_ms"].as<int>());
        if (d["common_timeout_ms"])
            o.common_timeout_ms = std::max(50, d["common_timeout_ms"].as<int>());
        if (d["sweep_timeout_ms"])
            o.sweep_timeout_ms = std::max(50, d["sweep_timeout_ms"].as<int>());
        if (d["common_parallelism"])
            o.common_parallelism = std::max(1, d["common_parallelism"].as<int>());
        if (d["sweep_parallelism"])
            o.sweep_parallelism = std::max(1, d["sweep_parallelism"].as<int>());
    }

    if (auto a = y["acquisition"]) {
        auto& o = cfg.acquisition;
        if (a["interval_s"]) o.interval_s = a["interval_s"].as<double>();
        if (a["request_timeout_ms"])
            o.request_timeout_ms = std::max(100, a["request_timeout_ms"].as<int>());
        if (a["notice_every"]) o.notice_every = std::max(1, a["notice_every"].as<int>());
        if (a["manual_timeout_ms"])
            o.manual_timeout_ms = std::max(100, a["manual_timeout_ms"].as<int>());
    }

    if (auto o = y["output"]) {
        if (o["directory"]) cfg.output.directory = o["directory"].as<std::string>();
        if (o["prefix"]) cfg.output.prefix = o["prefix"].as<std::string>();
    }

    if (auto d = y["display"]) {
        if (d["mode"]) {
            std::string mode = d["mode"].as<std::string>();
            if (!parse_display_mode(mode, cfg.display))
                throw ConfigError("unknown display mode: " + mode);
        }
    }

    if (auto l = y["log"]) {
        if (l["level"]) {
            std::string level = l["level"].as<std::string>();
            if (!parse_log_level(level, cfg.log_level))
                throw ConfigError("unknown log level: " + level);
        }
    }
}

int to_int(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError(flag + " expects an integer, got '" + v + "'");
    }
}

double to_double(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::logic_error&) {
        throw ConfigError(flag + " expects a number, got '" + v + "'");
    }
}
}  // namespace

void load_app_config(const std::string& path, AppConfig& cfg) {
    try {
        apply_yaml(YAML::LoadFile(path), cfg);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot load " + path + ": " + e.what());
    }
}

void apply_config_yaml(const std::string& text, AppConfig& cfg) {
    try {
        apply_yaml(YAML::Load(text), cfg);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

std::string config_path_from_args(const std::vector<std::string>& args) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") return args[i + 1];
    }
    return "";
}

void apply_cli_args(const std::vector<std::string>& args, AppConfig& cfg) {
    bool hostnames_given = false;
    bool subnets_given = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError(a + " expects a value");
            return args[++i];
        };
        if (a == "--config") {
            value();
        } else if (a == "--address") {
            cfg.device_address = value();
        } else if (a == "--port") {
            cfg.discovery.port = to_int(a, value());
        } else if (a == "--hostname") {
            if (!hostnames_given) cfg.discovery.hostnames.clear();
            hostnames_given = true;
            cfg.discovery.hostnames.push_back(value());
        } else if (a == "--subnet") {
            if (!subnets_given) cfg.discovery.subnets.clear();
            subnets_given = true;
            cfg.discovery.subnets.push_back(value());
        } else if (a == "--interval") {
            cfg.acquisition.interval_s = to_double(a, value());
        } else if (a == "--out") {
            cfg.output.directory = value();
        } else if (a == "--display") {
            const std::string& mode = value();
            if (!parse_display_mode(mode, cfg.display))
                throw ConfigError("unknown display mode: " + mode + " (all|compact|key)");
        } else if (a == "--log-level") {
            const std::string& level = value();
            if (!parse_log_level(level, cfg.log_level))
                throw ConfigError("unknown log level: " + level);
        } else {
            throw ConfigError("unknown option: " + a);
        }
    }
}

void validate_app_config(const AppConfig& cfg) {
    if (cfg.discovery.port < 1 || cfg.discovery.port > 65535)
        throw ConfigError("device port out of range: " + std::to_string(cfg.discovery.port));
    double interval = cfg.acquisition.interval_s;
    if (!std::isfinite(interval) || interval < kMinIntervalS || interval > kMaxIntervalS)
        throw ConfigError("polling interval must be between 0.001 and 3600 seconds, got " +
                          std::to_string(interval));
    if (!cfg.device_address.empty() && cfg.device_address.find_first_of(" /") != std::string::npos)
        throw ConfigError("device address must be a bare host or IPv4: " + cfg.device_address);
    for (const auto& s : cfg.discovery.subnets) {
        if (!is_subnet(s)) throw ConfigError("subnet must be three octets like 192.168.1: " + s);
    }
    for (const auto& ip : cfg.discovery.common_addresses) {
        if (!is_valid_ipv4(ip)) throw ConfigError("not an IPv4 address: " + ip);
    }
}

std::chrono::milliseconds poll_interval(const AcquisitionConfig& acq) {
    double s = std::isfinite(acq.interval_s) ? acq.interval_s : kMinIntervalS;
    s = std::min(std::max(s, kMinIntervalS), kMaxIntervalS);
    return std::chrono::milliseconds(static_cast<int64_t>(s * 1000.0 + 0.5));
}

std::string output_path(const AppConfig& cfg, std::chrono::system_clock::time_point started) {
    std::filesystem::path dir(cfg.output.directory);
    return (dir / (cfg.output.prefix + file_stamp(started) + ".csv")).string();
}

std::string dump_app_config(const AppConfig& cfg) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "device" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "address" << YAML::Value << cfg.device_address;
    out << YAML::Key << "port" << YAML::Value << cfg.discovery.port;
    out << YAML::EndMap;

    const auto& d = cfg.discovery;
    out << YAML::Key << "discovery" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "hostnames" << YAML::Value << YAML::Flow << d.hostnames;
    out << YAML::Key << "common_addresses" << YAML::Value << YAML::Flow << d.common_addresses;
    out << YAML::Key << "subnets" << YAML::Value << YAML::Flow << d.subnets;
    out << YAML::Key << "hostname_timeout_ms" << YAML::Value << d.hostname_timeout_ms;
    out << YAML::Key << "common_timeout_ms" << YAML::Value << d.common_timeout_ms;
    out << YAML::Key << "sweep_timeout_ms" << YAML::Value << d.sweep_timeout_ms;
    out << YAML::Key << "common_parallelism" << YAML::Value << d.common_parallelism;
    out << YAML::Key << "sweep_parallelism" << YAML::Value << d.sweep_parallelism;
    out << YAML::EndMap;

    const auto& a = cfg.acquisition;
    out << YAML::Key << "acquisition" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "interval_s" << YAML::Value << a.interval_s;
    out << YAML::Key << "request_timeout_ms" << YAML::Value << a.request_timeout_ms;
    out << YAML::Key << "notice_every" << YAML::Value << a.notice_every;
    out << YAML::Key << "manual_timeout_ms" << YAML::Value << a.manual_timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "directory" << YAML::Value << cfg.output.directory;
    out << YAML::Key << "prefix" << YAML::Value << cfg.output.prefix;
    out << YAML::EndMap;

    out << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "mode" << YAML::Value << display_mode_name(cfg.display);
    out << YAML::EndMap;

    std::string level = level_name(cfg.log_level);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << level;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}
}  // namespace wcl
