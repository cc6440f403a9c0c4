#ifndef CORE_RECORD_HPP
#define CORE_RECORD_HPP

#include <array>
#include <optional>
#include <string>

#include "../utils/alias.hpp"

namespace core {
// One normalized line of an nginx ingress access log.
struct AccessRecord {
    std::string remote_addr{};
    std::string time_local{};
    TimePoint time{};
    std::string method{};
    std::string uri{};
    std::string path{};
    std::string proto{};
    std::optional<i64> status{};
    std::optional<i64> body_bytes_sent{};
    std::string http_referer{};
    std::string http_user_agent{};
    std::optional<i64> request_length{};
    std::optional<f64> request_time{};
    std::string upstream_name{};
    std::string upstream_alternative{};
    std::string upstream_addr{};
    std::optional<i64> upstream_response_length{};
    std::optional<f64> upstream_response_time{};
    // Numeric when the field is all digits, raw text ("-") otherwise.
    std::optional<i64> upstream_status{};
    std::string upstream_status_raw{};
    std::string request_id{};
    u64 query_keys_count{};
};

enum class Column : u8 {
    RemoteAddr,
    TimeLocal,
    TimeUtc,
    Method,
    Uri,
    Path,
    Proto,
    Status,
    BodyBytesSent,
    HttpReferer,
    HttpUserAgent,
    RequestLength,
    RequestTime,
    UpstreamName,
    UpstreamAlternative,
    UpstreamAddr,
    UpstreamResponseLength,
    UpstreamResponseTime,
    UpstreamStatus,
    RequestId,
    QueryKeysCount,
    Count
};

inline constexpr std::array<const char *, static_cast<usize>(Column::Count)>
    ColumnName = {
        "remote_addr",
        "time_local",
        "time_utc",
        "method",
        "uri",
        "path",
        "proto",
        "status",
        "body_bytes_sent",
        "http_referer",
        "http_user_agent",
        "request_length",
        "request_time",
        "upstream_name",
        "upstream_alternative",
        "upstream_addr",
        "upstream_response_length",
        "upstream_response_time",
        "upstream_status",
        "request_id",
        "query_keys_count",
};
}  // namespace core

#endif
