#include <charconv>
#include <cmath>
#include <string>

#include "reading_bus.hpp"

namespace wcl {
std::string format_real(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc()) return std::to_string(v);
    std::string out(buf, res.ptr);
    // keep a visible fractional part for integral reals (398 -> 398.0)
    if (out.find_first_of(".eE") == std::string::npos) out += ".0";
    return out;
}

std::string FieldValue::to_cell() const {
    switch (kind) {
        case Kind::Null: return "";
        case Kind::Integer: return std::to_string(integer);
        case Kind::Real: return format_real(real);
        case Kind::Boolean: return boolean ? "true" : "false";
        case Kind::Text: return text;
    }
    return "";
}
}  // namespace wcl
