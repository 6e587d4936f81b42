#include "console_view.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <sstream>
#include <vector>

#include "../core/time_utils.hpp"

namespace wcl {
namespace {
bool has(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

bool starts_with(const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; }

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string fixed(double v, int decimals, const char* suffix) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f%s", decimals, v, suffix);
    return buf;
}

// Headline metrics accept any numeric type; text passes through unchanged.
std::string headline(const Reading& r, const char* key, const char* fallback_key, int decimals,
                     const char* suffix, const char* missing) {
    const FieldValue* v = r.find(key);
    if (!v && fallback_key) v = r.find(fallback_key);
    if (!v || v->is_null()) return missing;
    if (v->is_number()) return fixed(v->as_double(), decimals, suffix);
    return v->to_cell();
}

const char* const kGroupOrder[] = {"Other", "Drive", "Temps", "TPMS", "VMCU", "BMS", "Cells"};
constexpr size_t kCellsPerLine = 16;
constexpr size_t kLineWidth = 78;
}  // namespace

bool parse_display_mode(const std::string& name, DisplayMode& out) {
    if (name == "all") out = DisplayMode::All;
    else if (name == "compact") out = DisplayMode::Compact;
    else if (name == "key") out = DisplayMode::Key;
    else return false;
    return true;
}

const char* display_mode_name(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::All: return "all";
        case DisplayMode::Compact: return "compact";
        case DisplayMode::Key: return "key";
    }
    return "?";
}

std::string format_value(const std::string& key, const FieldValue& value) {
    if (value.is_null()) return "---";
    if (value.kind != FieldValue::Kind::Real) return value.to_cell();
    double v = value.real;
    if (has(key, "Temp") || has(key, "_C")) return fixed(v, 0, "°");
    if (has(key, "pct") || has(key, "SOC") || has(key, "SOH")) return fixed(v, 1, "%");
    if (has(key, "Voltage") || has(key, "_V")) return fixed(v, 2, "V");
    if (has(key, "Current") || has(key, "_A")) return fixed(v, 1, "A");
    if (has(key, "Power") || has(key, "_kW")) return fixed(v, 1, "kW");
    if (has(key, "psi")) return fixed(v, 1, "");
    return fixed(v, 2, "");
}

std::string group_of(const std::string& key) {
    if (starts_with(key, "Cell_") && has(key, "_V")) return "Cells";
    if (starts_with(key, "VMCU")) return "VMCU";
    if (starts_with(key, "BMS")) return "BMS";
    if (has(key, "Temp") || has(key, "_C")) return "Temps";
    if (has(key, "Gear") || has(key, "Brake") || has(key, "Regen")) return "Drive";
    if (has(key, "psi")) return "TPMS";
    return "Other";
}

std::string short_key(const std::string& key) {
    std::string s = key;
    replace_all(s, "_pct", "%");
    replace_all(s, "_V", "V");
    replace_all(s, "_A", "A");
    replace_all(s, "_kW", "kW");
    replace_all(s, "_C", "°");
    replace_all(s, "_km", "km");
    replace_all(s, "Batt_", "");
    replace_all(s, "Cell_V_", "Cell");
    return s;
}

ConsoleView::ConsoleView(std::ostream& out, DisplayMode mode) : out_(out), mode_(mode) {}

std::string ConsoleView::render_all(const Reading& r, size_t row) const {
    std::ostringstream os;
    std::string rule(80, '=');
    os << "\n" << rule << "\n";
    os << "[" << clock_part(r.captured_at) << "] Row " << row << " | " << r.fields.size()
       << " parameters\n";
    os << rule << "\n";

    std::map<std::string, std::vector<const std::pair<const std::string, FieldValue>*>> groups;
    for (const auto& kv : r.fields) groups[group_of(kv.first)].push_back(&kv);

    for (const char* name : kGroupOrder) {
        auto it = groups.find(name);
        if (it == groups.end()) continue;
        const auto& items = it->second;
        if (it->first == "Cells") {
            os << "\n[Cells] (" << items.size() << " cells)\n";
            for (size_t i = 0; i < items.size(); i += kCellsPerLine) {
                size_t end = std::min(i + kCellsPerLine, items.size());
                char label[16];
                std::snprintf(label, sizeof(label), "%02zu-%02zu", i + 1, end);
                os << "  " << label << ":";
                for (size_t j = i; j < end; ++j)
                    os << " " << format_value(items[j]->first, items[j]->second);
                os << "\n";
            }
            continue;
        }
        os << "\n[" << it->first << "]\n";
        std::string line = "  ";
        for (const auto* kv : items) {
            std::string item = short_key(kv->first) + ":" + format_value(kv->first, kv->second);
            if (line.size() + item.size() > kLineWidth) {
                os << line << "\n";
                line = "  ";
            }
            line += item + " ";
        }
        if (line.find_first_not_of(' ') != std::string::npos) os << line << "\n";
    }
    return os.str();
}

std::string ConsoleView::render_compact(const Reading& r, size_t row) const {
    std::ostringstream os;
    os << "[" << clock_part(r.captured_at) << "] #" << row
       << " | SOC:" << headline(r, "SOC_pct", "SOC", 1, "%", "---")
       << " | " << headline(r, "HV_Voltage_V", nullptr, 1, "V", "---")
       << " | " << headline(r, "HV_Current_A", nullptr, 1, "A", "---")
       << " | " << headline(r, "HV_Power_kW", nullptr, 1, "kW", "---") << " | "
       << r.fields.size() << " params\n";
    return os.str();
}

std::string ConsoleView::render_key(const Reading& r, size_t row) const {
    const FieldValue* soc = r.find("SOC_pct");
    if (!soc) soc = r.find("SOC");
    std::string soc_text = soc && !soc->is_null() ? soc->to_cell() : "N/A";
    std::ostringstream os;
    os << "[" << clock_part(r.captured_at) << "] Row " << row << " | SOC: " << soc_text << "% | "
       << r.fields.size() << " params\n";
    return os.str();
}

std::string ConsoleView::render(const Reading& reading, size_t row) const {
    switch (mode_) {
        case DisplayMode::All: return render_all(reading, row);
        case DisplayMode::Compact: return render_compact(reading, row);
        case DisplayMode::Key: return render_key(reading, row);
    }
    return "";
}

void ConsoleView::on_reading(const Reading& reading) {
    std::vector<std::string> fresh;
    for (const auto& kv : reading.fields) {
        if (seen_.insert(kv.first).second) fresh.push_back(kv.first);
    }
    if (!fresh.empty()) {
        if (rows_ == 0) {
            // +1 for the timestamp column
            out_ << "Initial fields: " << seen_.size() + 1 << " parameters\n";
        } else {
            out_ << "\n  [+] New fields: ";
            for (size_t i = 0; i < fresh.size(); ++i) out_ << (i ? ", " : "") << fresh[i];
            out_ << "\n";
        }
    }
    ++rows_;
    out_ << render(reading, rows_);
    out_.flush();
}
}  // namespace wcl
