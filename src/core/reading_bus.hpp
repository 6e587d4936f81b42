#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace wcl {
// Scalar telemetry value as reported by the device.
struct FieldValue {
    enum class Kind { Null, Integer, Real, Boolean, Text };

    Kind kind{Kind::Null};
    int64_t integer{};
    double real{};
    bool boolean{};
    std::string text;

    static FieldValue null() {
        return {};
    }
    static FieldValue of_integer(int64_t v) {
        FieldValue f;
        f.kind = Kind::Integer;
        f.integer = v;
        return f;
    }
    static FieldValue of_real(double v) {
        FieldValue f;
        f.kind = Kind::Real;
        f.real = v;
        return f;
    }
    static FieldValue of_boolean(bool v) {
        FieldValue f;
        f.kind = Kind::Boolean;
        f.boolean = v;
        return f;
    }
    static FieldValue of_text(std::string v) {
        FieldValue f;
        f.kind = Kind::Text;
        f.text = std::move(v);
        return f;
    }

    bool is_null() const {
        return kind == Kind::Null;
    }
    bool is_number() const {
        return kind == Kind::Integer || kind == Kind::Real;
    }
    double as_double() const {
        return kind == Kind::Integer ? static_cast<double>(integer) : real;
    }

    // Text for one table cell; null renders as an empty cell.
    std::string to_cell() const;
};

// Shortest decimal text that round-trips `v`.
std::string format_real(double v);

struct Reading {
    std::string captured_at;
    uint64_t ts_monotonic_ns{};
    std::map<std::string, FieldValue> fields;

    const FieldValue* find(const std::string& name) const {
        auto it = fields.find(name);
        return it == fields.end() ? nullptr : &it->second;
    }
};

class ReadingSink {
   public:
    virtual ~ReadingSink() = default;
    virtual void on_reading(const Reading& reading) = 0;
};

class ReadingBus {
   public:
    void add_sink(ReadingSink* sink) {
        sinks_.push_back(sink);
    }
    void emit(const Reading& reading) {
        for (auto* s : sinks_) s->on_reading(reading);
    }
    size_t sink_count() const {
        return sinks_.size();
    }

   private:
    std::vector<ReadingSink*> sinks_;
};
}  // namespace wcl
