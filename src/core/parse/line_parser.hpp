#ifndef CORE_PARSE_LINE_PARSER_HPP
#define CORE_PARSE_LINE_PARSER_HPP

#include <functional>
#include <istream>
#include <string>

#include "../../utils/errors.hpp"
#include "../record.hpp"

namespace core::parse {
struct ParseStats {
    u64 lines{};
    u64 records{};
    u64 bad_lines{};
};

using RecordCallback = std::function<void(AccessRecord &&)>;

// Parses a single ingress log line. Returns Err::MalformedLine when the line
// does not match the format or carries an invalid timestamp.
Err ParseLine(const std::string &line, AccessRecord &record);

// Reads `in` line by line, handing every parsed record to `on_record`.
// Blank lines are ignored. Malformed lines are counted, or abort the read
// with Err::MalformedLine when `strict` is set.
Err ParseStream(std::istream &in, bool strict, const RecordCallback &on_record,
                ParseStats &stats);
}  // namespace core::parse

#endif
