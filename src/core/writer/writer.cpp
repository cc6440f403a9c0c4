#include "writer.hpp"

#include <filesystem>
#include <system_error>

#include "../../utils/logger.hpp"
#include "../../utils/utils.hpp"
#include "../parse/timestamp.hpp"
#include "csv_writer.hpp"
#include "jsonl_writer.hpp"

namespace core::writer {
namespace {
std::string IntText(const std::optional<i64> &value) {
    return value ? std::to_string(*value) : std::string{};
}

std::string FloatText(const std::optional<f64> &value) {
    return value ? utils::FormatFloat(*value) : std::string{};
}
}  // namespace

std::unique_ptr<Writer> MakeWriter(config::OutputFormat format,
                                   std::ostream &out) {
    switch (format) {
        case config::OutputFormat::Jsonl:
            return std::make_unique<JsonlWriter>(out);
        case config::OutputFormat::Csv:
        default:
            return std::make_unique<CsvWriter>(out);
    }
}

Err OpenOutput(const std::string &path, std::ofstream &file) {
    namespace fs = std::filesystem;

    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out_path.parent_path().lexically_normal(), ec);
        if (ec) {
            logger::Error("Can't create directory '%s': %s",
                          out_path.parent_path().string().c_str(),
                          ec.message().c_str());
            return Err::OutputWriteFailed;
        }
    }

    file.open(out_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        logger::Error("Can't open '%s' for writing", path.c_str());
        return Err::OutputWriteFailed;
    }

    logger::Debug("Writing output to '%s'", path.c_str());
    return Err::Ok;
}

std::string FieldText(const AccessRecord &record, Column column) {
    switch (column) {
        case Column::RemoteAddr:
            return record.remote_addr;
        case Column::TimeLocal:
            return record.time_local;
        case Column::TimeUtc:
            return parse::FormatIsoUtc(record.time);
        case Column::Method:
            return record.method;
        case Column::Uri:
            return record.uri;
        case Column::Path:
            return record.path;
        case Column::Proto:
            return record.proto;
        case Column::Status:
            return IntText(record.status);
        case Column::BodyBytesSent:
            return IntText(record.body_bytes_sent);
        case Column::HttpReferer:
            return record.http_referer;
        case Column::HttpUserAgent:
            return record.http_user_agent;
        case Column::RequestLength:
            return IntText(record.request_length);
        case Column::RequestTime:
            return FloatText(record.request_time);
        case Column::UpstreamName:
            return record.upstream_name;
        case Column::UpstreamAlternative:
            return record.upstream_alternative;
        case Column::UpstreamAddr:
            return record.upstream_addr;
        case Column::UpstreamResponseLength:
            return IntText(record.upstream_response_length);
        case Column::UpstreamResponseTime:
            return FloatText(record.upstream_response_time);
        case Column::UpstreamStatus:
            return record.upstream_status
                       ? std::to_string(*record.upstream_status)
                       : record.upstream_status_raw;
        case Column::RequestId:
            return record.request_id;
        case Column::QueryKeysCount:
            return std::to_string(record.query_keys_count);
        case Column::Count:
            break;
    }
    return {};
}
}  // namespace core::writer
