#include "json_body.hpp"

#include <memory>

namespace wcl {
bool parse_json_body(const std::string& body, Json::Value& root, std::string* err) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    bool ok = reader->parse(body.data(), body.data() + body.size(), &root, &errs);
    if (!ok && err) *err = errs;
    return ok;
}

std::string to_compact_json(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}
}  // namespace wcl
