#include "line_parser.hpp"

#include <optional>
#include <string_view>

#include "../../utils/logger.hpp"
#include "../../utils/utils.hpp"
#include "cursor.hpp"
#include "request.hpp"
#include "timestamp.hpp"

namespace core::parse {
namespace {
struct IngressFields {
    std::string_view remote_addr;
    std::string_view time_local;
    std::string_view request;
    std::string_view status;
    std::string_view body_bytes_sent;
    std::string_view http_referer;
    std::string_view http_user_agent;
    std::string_view request_length;
    std::string_view request_time;
    std::string_view upstream_name;
    std::string_view upstream_alternative;
    std::string_view upstream_addr;
    std::string_view upstream_response_length;
    std::string_view upstream_response_time;
    std::string_view upstream_status;
    std::string_view request_id;
};

bool AllDigits(std::string_view str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (!utils::IsAsciiDigit(c)) return false;
    }
    return true;
}

// Reads one field and the whitespace after it. The last field of the line
// passes `last` and must end the text instead.
bool Field(Cursor &cur, std::optional<std::string_view> value,
           std::string_view &out, bool last = false) {
    if (!value) return false;
    out = *value;
    return last ? cur.Done() : cur.SkipSpace();
}

// $remote_addr - $remote_user [$time_local] "$request" $status
// $body_bytes_sent "$http_referer" "$http_user_agent" $request_length
// $request_time [$proxy_upstream_name] [$proxy_alternative_upstream_name]
// $upstream_addr $upstream_response_length $upstream_response_time
// $upstream_status $req_id
//
// Single pass over the line, every field is taken in the order it appears.
bool ScanIngress(std::string_view line, IngressFields &f) {
    Cursor cur(line);
    std::string_view skipped;

    return Field(cur, cur.Token(), f.remote_addr) &&
           Field(cur, cur.Token(), skipped) &&
           Field(cur, cur.Token(), skipped) &&
           Field(cur, cur.Enclosed('[', ']', false), f.time_local) &&
           Field(cur, cur.Enclosed('"', '"', true), f.request) &&
           Field(cur, cur.Token(), f.status) && f.status.size() == 3 &&
           AllDigits(f.status) &&
           Field(cur, cur.Token(), f.body_bytes_sent) &&
           Field(cur, cur.Enclosed('"', '"', true), f.http_referer) &&
           Field(cur, cur.Enclosed('"', '"', true), f.http_user_agent) &&
           Field(cur, cur.Token(), f.request_length) &&
           Field(cur, cur.Token(), f.request_time) &&
           Field(cur, cur.Enclosed('[', ']', true), f.upstream_name) &&
           Field(cur, cur.Enclosed('[', ']', true), f.upstream_alternative) &&
           Field(cur, cur.Token(), f.upstream_addr) &&
           Field(cur, cur.Token(), f.upstream_response_length) &&
           Field(cur, cur.Token(), f.upstream_response_time) &&
           Field(cur, cur.Token(), f.upstream_status) &&
           Field(cur, cur.Token(), f.request_id, true);
}
}  // namespace

Err ParseLine(const std::string &line, AccessRecord &record) {
    IngressFields f{};
    if (!ScanIngress(line, f)) {
        return Err::MalformedLine;
    }

    auto time = ParseLogTime(f.time_local);
    if (!time) {
        logger::Debug("Unparsable timestamp `%s`",
                      std::string(f.time_local).c_str());
        return Err::MalformedLine;
    }

    auto request = SplitRequest(f.request);

    record = AccessRecord{
        .remote_addr = std::string(f.remote_addr),
        .time_local = std::string(f.time_local),
        .time = *time,
        .method = std::move(request.method),
        .uri = std::move(request.uri),
        .path = std::move(request.path),
        .proto = std::move(request.proto),
        .status = utils::ParseInt(f.status),
        .body_bytes_sent = utils::ParseInt(f.body_bytes_sent),
        .http_referer = std::string(f.http_referer),
        .http_user_agent = std::string(f.http_user_agent),
        .request_length = utils::ParseInt(f.request_length),
        .request_time = utils::ParseFloat(f.request_time),
        .upstream_name = std::string(f.upstream_name),
        .upstream_alternative = std::string(f.upstream_alternative),
        .upstream_addr = std::string(f.upstream_addr),
        .upstream_response_length = utils::ParseInt(f.upstream_response_length),
        .upstream_response_time = utils::ParseFloat(f.upstream_response_time),
        .upstream_status = std::nullopt,
        .upstream_status_raw = std::string(f.upstream_status),
        .request_id = std::string(f.request_id),
        .query_keys_count =
            request.query.empty() ? 0 : CountQueryKeys(request.query),
    };

    if (AllDigits(record.upstream_status_raw)) {
        record.upstream_status = utils::ParseInt(record.upstream_status_raw);
    }

    return Err::Ok;
}

Err ParseStream(std::istream &in, bool strict, const RecordCallback &on_record,
                ParseStats &stats) {
    std::string raw;
    while (std::getline(in, raw)) {
        stats.lines++;
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        if (utils::Trim(raw).empty()) {
            continue;
        }

        std::string line = utils::SanitizeUtf8(raw);
        AccessRecord record{};
        Err err = ParseLine(line, record);
        if (err != Err::Ok) {
            stats.bad_lines++;
            if (strict) {
                logger::Error("line %llu does not match format:\n%s",
                              static_cast<unsigned long long>(stats.lines),
                              line.c_str());
                return err;
            }
            logger::Debug("Skipping line %llu: %s",
                          static_cast<unsigned long long>(stats.lines),
                          utils::UnescapeString(line).c_str());
            continue;
        }

        stats.records++;
        on_record(std::move(record));
    }

    if (in.bad()) {
        logger::Error("Read error after line %llu",
                      static_cast<unsigned long long>(stats.lines));
        return Err::InputReadFailed;
    }

    return Err::Ok;
}
}  // namespace core::parse
