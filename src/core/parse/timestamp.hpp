#ifndef CORE_PARSE_TIMESTAMP_HPP
#define CORE_PARSE_TIMESTAMP_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../../utils/alias.hpp"

namespace core::parse {
// nginx `$time_local`, e.g. "26/Apr/2021:21:20:17 +0000", normalized to UTC.
std::optional<TimePoint> ParseLogTime(std::string_view text);

// ISO-8601 date or date-time. A trailing "Z" or a "+HH:MM" offset is
// honoured, a value without offset is taken as UTC.
std::optional<TimePoint> ParseIsoUtc(std::string_view text);

// "2021-04-26T21:20:17Z", fractional seconds only when non-zero.
std::string FormatIsoUtc(TimePoint time);
}  // namespace core::parse

#endif
