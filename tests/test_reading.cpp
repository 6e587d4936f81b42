#include <cassert>
#include <string>

#include "../src/core/reading_bus.hpp"

int main() {
    using wcl::FieldValue;
    assert(wcl::format_real(87.5) == "87.5");
    assert(wcl::format_real(398.2) == "398.2");
    assert(wcl::format_real(3.7) == "3.7");
    assert(wcl::format_real(12.0) == "12.0");
    assert(FieldValue::null().to_cell().empty());
    assert(FieldValue::of_integer(-42).to_cell() == "-42");
    assert(FieldValue::of_boolean(true).to_cell() == "true");
    assert(FieldValue::of_text("P").to_cell() == "P");
    assert(FieldValue::of_integer(3).is_number());
    assert(FieldValue::of_integer(3).as_double() == 3.0);
    assert(!FieldValue::of_text("3").is_number());

    wcl::Reading r;
    r.fields["SOC_pct"] = FieldValue::of_real(87.5);
    assert(r.find("SOC_pct") != nullptr);
    assert(r.find("missing") == nullptr);
    return 0;
}
