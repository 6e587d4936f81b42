#pragma once
#include <ostream>
#include <set>
#include <string>

#include "../core/reading_bus.hpp"

namespace wcl {
enum class DisplayMode { All, Compact, Key };

bool parse_display_mode(const std::string& name, DisplayMode& out);
const char* display_mode_name(DisplayMode mode);

// Unit-aware rendering guessed from the field name ("---" for null).
std::string format_value(const std::string& key, const FieldValue& value);
std::string group_of(const std::string& key);
std::string short_key(const std::string& key);

// Live console readout of each reading. Holds only what it needs to announce
// newly seen fields; the log writer owns the real schema.
class ConsoleView : public ReadingSink {
   public:
    ConsoleView(std::ostream& out, DisplayMode mode);
    void on_reading(const Reading& reading) override;

    std::string render(const Reading& reading, size_t row) const;
    size_t rows() const { return rows_; }

   private:
    std::ostream& out_;
    DisplayMode mode_;
    size_t rows_{0};
    std::set<std::string> seen_;

    std::string render_all(const Reading& reading, size_t row) const;
    std::string render_compact(const Reading& reading, size_t row) const;
    std::string render_key(const Reading& reading, size_t row) const;
};
}  // namespace wcl
