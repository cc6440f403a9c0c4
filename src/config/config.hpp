#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../utils/alias.hpp"
#include "../utils/errors.hpp"

namespace config {
enum class SortKey : u8 {
    TimeUtc,
    Status,
    RequestTime,
    BodyBytesSent,
    UpstreamResponseTime,
};

const std::map<SortKey, std::string> SortKeyName{
    {SortKey::TimeUtc, "time_utc"},
    {SortKey::Status, "status"},
    {SortKey::RequestTime, "request_time"},
    {SortKey::BodyBytesSent, "body_bytes_sent"},
    {SortKey::UpstreamResponseTime, "upstream_response_time"},
};

enum class OutputFormat : u8 {
    Csv,
    Jsonl,
};

const std::map<OutputFormat, std::string> OutputFormatName{
    {OutputFormat::Csv, "csv"},
    {OutputFormat::Jsonl, "jsonl"},
};

struct FilterConfig {
    std::vector<i64> statuses;
    std::vector<std::string> methods;
    std::string path_contains;
    std::vector<std::string> ips;
    std::optional<TimePoint> since;
    std::optional<TimePoint> until;
};

struct ExportConfig {
    SortKey sort_by = SortKey::TimeUtc;
    bool descending{};
    std::optional<i64> limit;
    OutputFormat format = OutputFormat::Csv;
};

class Config {
public:
    std::string input_file;
    std::string output_file;
    bool strict{};
    bool require_unprivileged{};
    bool verbose_logs{};
    bool color{};
    FilterConfig filters;
    ExportConfig output;

    Config(const Config &) = delete;
    Config &operator=(const Config &) = delete;

    friend Err InitFromArgs(int argc, const char *const *argv);
    friend Config &Get();
    friend void Reset();

private:
    Config() = default;
};

// Parses the command line, merging defaults from the JSON config file.
// Prints usage and exits the process on `--help`.
Err InitFromArgs(int argc, const char *const *argv);
Config &Get();
void Reset();

Err LoadDefaults(const std::string &filename, Config &config);
std::optional<SortKey> SortKeyFromString(const std::string &str);
std::optional<OutputFormat> OutputFormatFromString(const std::string &str);

// Rewrites `--flag a b c` into `--flag=a --flag=b --flag=c` for options
// that take several values.
std::vector<std::string> ExpandMultiValueArgs(
    const std::vector<std::string> &args,
    const std::vector<std::string> &multi_value_flags);

}  // namespace config

#endif  // CONFIG_HPP
