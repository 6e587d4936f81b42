#pragma once
#include <fstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/reading_bus.hpp"

namespace wcl {
// Comma-separated log whose column set grows with the telemetry.
//
// Column 0 is always "timestamp"; fields are appended in sorted order the first
// time they are seen and never move afterwards. A reading that carries only
// known fields is appended as one row. A reading that introduces fields
// triggers a migration: the whole table is rewritten to a sibling temp file
// under the new header (earlier rows get empty cells) and renamed over the
// artifact, so a reader never sees a half-written table.
class CsvLogWriter : public ReadingSink {
   public:
    static constexpr const char* kTimestampColumn = "timestamp";

    explicit CsvLogWriter(const std::string& path);
    ~CsvLogWriter() override;

    // Returns false if the artifact could not be brought up to date; the
    // reading is still kept and the next record() retries with a full rewrite.
    bool record(const Reading& reading);
    void on_reading(const Reading& reading) override;

    const std::vector<std::string>& schema() const { return schema_; }
    // Readings accepted this session, persisted or not.
    size_t rows_recorded() const { return history_.size(); }
    // Rows the artifact held after the last successful write.
    size_t rows_written() const { return rows_written_; }
    size_t migrations() const { return migrations_; }
    const std::string& path() const { return path_; }

    static std::string escape(const std::string& cell);

   private:
    std::string path_;
    std::ofstream out_;
    std::vector<std::string> schema_;
    std::unordered_set<std::string> known_;
    std::vector<Reading> history_;
    size_t rows_written_{0};
    size_t migrations_{0};
    bool stale_{false};

    std::vector<std::string> unseen_fields(const Reading& reading) const;
    void write_header(std::ostream& out) const;
    void write_row(std::ostream& out, const Reading& reading) const;
    bool rewrite_all();
    bool append_last();
};
}  // namespace wcl
