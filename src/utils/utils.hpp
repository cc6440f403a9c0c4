#ifndef UTILS_UTILS_HPP
#define UTILS_UTILS_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "alias.hpp"

namespace utils {
template <class C, typename T>
inline bool contains(C &&c, T e) {
    return std::find(std::begin(c), std::end(c), e) != std::end(c);
};

std::string UnescapeString(const std::string &str);

std::string_view Trim(std::string_view str);
std::vector<std::string> SplitWhitespace(std::string_view str);
std::string ToLower(std::string_view str);

// Replaces every malformed UTF-8 subsequence with U+FFFD.
std::string SanitizeUtf8(std::string_view str);

// `%XX` escapes are decoded, malformed escapes are kept verbatim.
std::string PercentDecode(std::string_view str);

// Integer text as accepted by log fields: optional surrounding whitespace
// and sign. Anything else (including "-") yields nullopt.
std::optional<i64> ParseInt(std::string_view str);
std::optional<f64> ParseFloat(std::string_view str);

// Shortest round-trip form that always reads back as a float: "1.0",
// "0.123", "1e-05", "1e+16", "inf", "nan".
std::string FormatFloat(f64 value);

inline bool IsAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
           c == '\f';
}

inline bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }
}  // namespace utils

#endif
