#include "csv_log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "../core/logger.hpp"

namespace wcl {
CsvLogWriter::CsvLogWriter(const std::string& path) : path_(path) {
    schema_.push_back(kTimestampColumn);
    known_.insert(kTimestampColumn);
}

CsvLogWriter::~CsvLogWriter() {
    if (out_.is_open()) out_.flush();
}

std::string CsvLogWriter::escape(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) return cell;
    std::string out;
    out.reserve(cell.size() + 2);
    out += '"';
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::vector<std::string> CsvLogWriter::unseen_fields(const Reading& reading) const {
    std::vector<std::string> fresh;
    for (const auto& kv : reading.fields) {
        if (!known_.count(kv.first)) fresh.push_back(kv.first);
    }
    std::sort(fresh.begin(), fresh.end());
    return fresh;
}

void CsvLogWriter::write_header(std::ostream& out) const {
    for (size_t i = 0; i < schema_.size(); ++i) {
        if (i) out << ',';
        out << escape(schema_[i]);
    }
    out << '\n';
}

void CsvLogWriter::write_row(std::ostream& out, const Reading& reading) const {
    for (size_t i = 0; i < schema_.size(); ++i) {
        if (i) out << ',';
        if (i == 0) {
            out << escape(reading.captured_at);
            continue;
        }
        const FieldValue* v = reading.find(schema_[i]);
        if (v) out << escape(v->to_cell());
    }
    out << '\n';
}

bool CsvLogWriter::rewrite_all() {
    if (out_.is_open()) out_.close();
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream rewrite(tmp, std::ios::out | std::ios::trunc);
        if (!rewrite.is_open()) {
            log(LogLevel::ERROR, "CsvLogWriter failed to open " + tmp);
            return false;
        }
        write_header(rewrite);
        for (const auto& r : history_) write_row(rewrite, r);
        rewrite.flush();
        if (!rewrite.good()) {
            log(LogLevel::ERROR, "CsvLogWriter failed writing " + tmp);
            rewrite.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        log(LogLevel::ERROR, "CsvLogWriter failed to replace " + path_ + ": " + ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        log(LogLevel::ERROR, "CsvLogWriter failed to reopen " + path_);
        return false;
    }
    return true;
}

bool CsvLogWriter::append_last() {
    if (!out_.is_open()) {
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_.is_open()) {
            log(LogLevel::ERROR, "CsvLogWriter failed to open output file: " + path_);
            return false;
        }
    }
    write_row(out_, history_.back());
    out_.flush();
    if (!out_.good()) {
        log(LogLevel::ERROR, "CsvLogWriter failed appending to " + path_);
        out_.close();
        return false;
    }
    return true;
}

bool CsvLogWriter::record(const Reading& reading) {
    auto fresh = unseen_fields(reading);
    for (const auto& name : fresh) {
        schema_.push_back(name);
        known_.insert(name);
    }
    bool first = history_.empty();
    history_.push_back(reading);

    bool ok;
    if (first) {
        // a new session always starts a new table
        out_.open(path_, std::ios::out | std::ios::trunc);
        if (!out_.is_open()) {
            log(LogLevel::ERROR, "CsvLogWriter failed to open output file: " + path_);
            ok = false;
        } else {
            write_header(out_);
            ok = append_last();
        }
    } else if (!fresh.empty() || stale_) {
        if (!fresh.empty()) {
            ++migrations_;
            log(LogLevel::INFO, "schema grew by " + std::to_string(fresh.size()) +
                                    " field(s), rewriting " + std::to_string(history_.size()) +
                                    " row(s)");
        }
        ok = rewrite_all();
    } else {
        ok = append_last();
    }
    stale_ = !ok;
    if (ok) rows_written_ = history_.size();
    return ok;
}

void CsvLogWriter::on_reading(const Reading& reading) {
    if (!record(reading)) log(LogLevel::WARN, "row kept in memory; will retry on next reading");
}
}  // namespace wcl
