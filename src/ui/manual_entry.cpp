#include "manual_entry.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

#include "../core/logger.hpp"
#include "../discovery/subnets.hpp"

namespace wcl {
namespace {
std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

std::optional<std::string> prompt_for_address(std::istream& in, std::ostream& out,
                                              const ProbeFn& probe, int timeout_ms) {
    while (true) {
        out << "\nEnter WiCAN IP address (or 'q' to quit): " << std::flush;
        std::string line;
        if (!std::getline(in, line)) {
            out << "\nExiting.\n";
            return std::nullopt;
        }
        std::string entry = trim(line);
        std::string cmd = lower(entry);
        if (cmd.empty() || cmd == "q" || cmd == "quit" || cmd == "exit") {
            out << "Exiting.\n";
            return std::nullopt;
        }
        if (!is_valid_ipv4(entry)) {
            out << "  Invalid IP format: " << entry << "\n";
            continue;
        }
        out << "  Checking " << entry << "... " << std::flush;
        if (probe(entry, timeout_ms)) {
            out << "Connected!\n";
            log(LogLevel::INFO, "device confirmed at " + entry + " (manual entry)");
            return entry;
        }
        out << "no response.\n"
            << "  Device not found at that address. Try again or press 'q' to quit.\n";
    }
}
}  // namespace wcl
