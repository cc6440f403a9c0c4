#ifndef CORE_PARSE_REQUEST_HPP
#define CORE_PARSE_REQUEST_HPP

#include <string>
#include <string_view>

#include "../../utils/alias.hpp"

namespace core::parse {
struct Request {
    std::string method{};
    std::string uri{};
    std::string path{};
    std::string query{};
    std::string proto{};
};

// Splits `$request` ("GET /path?x=1 HTTP/2.0") into its parts. Missing parts
// stay empty.
Request SplitRequest(std::string_view request);

struct UrlParts {
    std::string scheme{};
    std::string netloc{};
    std::string path{};
    std::string params{};
    std::string query{};
    std::string fragment{};
};

// Generic URL split: scheme, `//netloc`, path with trailing `;params`,
// `?query` and `#fragment`.
UrlParts ParseUrl(std::string_view url);

// Number of distinct decoded names among `name=value` pairs with a
// non-empty value.
u64 CountQueryKeys(std::string_view query);
}  // namespace core::parse

#endif
