#include "jsonl_writer.hpp"

#include "../../utils/logger.hpp"
#include "../parse/timestamp.hpp"

using json = nlohmann::ordered_json;

namespace core::writer {
namespace {
template <typename T>
json Nullable(const std::optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}
}  // namespace

json JsonlWriter::ToJson(const AccessRecord &record) {
    json obj;
    obj["remote_addr"] = record.remote_addr;
    obj["time_local"] = record.time_local;
    obj["time_utc"] = parse::FormatIsoUtc(record.time);
    obj["method"] = record.method;
    obj["uri"] = record.uri;
    obj["path"] = record.path;
    obj["proto"] = record.proto;
    obj["status"] = Nullable(record.status);
    obj["body_bytes_sent"] = Nullable(record.body_bytes_sent);
    obj["http_referer"] = record.http_referer;
    obj["http_user_agent"] = record.http_user_agent;
    obj["request_length"] = Nullable(record.request_length);
    obj["request_time"] = Nullable(record.request_time);
    obj["upstream_name"] = record.upstream_name;
    obj["upstream_alternative"] = record.upstream_alternative;
    obj["upstream_addr"] = record.upstream_addr;
    obj["upstream_response_length"] = Nullable(record.upstream_response_length);
    obj["upstream_response_time"] = Nullable(record.upstream_response_time);
    if (record.upstream_status) {
        obj["upstream_status"] = *record.upstream_status;
    } else {
        obj["upstream_status"] = record.upstream_status_raw;
    }
    obj["request_id"] = record.request_id;
    obj["query_keys_count"] = record.query_keys_count;
    return obj;
}

Err JsonlWriter::Write(const AccessRecord &record) {
    out_ << ToJson(record).dump(-1, ' ', false,
                                json::error_handler_t::replace)
         << '\n';
    if (!out_) {
        logger::Error("JSON Lines write failed");
        return Err::OutputWriteFailed;
    }
    return Err::Ok;
}

Err JsonlWriter::Finish() {
    out_.flush();
    return out_ ? Err::Ok : Err::OutputWriteFailed;
}
}  // namespace core::writer
