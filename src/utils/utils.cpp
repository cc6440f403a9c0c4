#include "utils.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace utils {
std::string UnescapeString(const std::string &str) {
    std::ostringstream res;
    for (unsigned char c : str) {
        switch (c) {
            case '\n':
                res << "\\n";
                break;
            case '\t':
                res << "\\t";
                break;
            case '\r':
                res << "\\r";
                break;
            case '\\':
                res << "\\\\";
                break;
            case '\"':
                res << "\\\"";
                break;
            default:
                if (c < 32 || c == 127) {
                    res << "\\x" << std::hex << std::setw(2)
                        << std::setfill('0') << (int)c << std::dec;
                } else {
                    res << c;
                }
        }
    }

    return res.str();
}

std::string_view Trim(std::string_view str) {
    while (!str.empty() && IsAsciiSpace(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && IsAsciiSpace(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

std::vector<std::string> SplitWhitespace(std::string_view str) {
    std::vector<std::string> parts;
    usize i = 0;
    while (i < str.size()) {
        while (i < str.size() && IsAsciiSpace(str[i])) i++;
        usize start = i;
        while (i < str.size() && !IsAsciiSpace(str[i])) i++;
        if (i > start) {
            parts.emplace_back(str.substr(start, i - start));
        }
    }
    return parts;
}

std::string ToLower(std::string_view str) {
    std::string res(str);
    std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return res;
}

std::string SanitizeUtf8(std::string_view str) {
    static constexpr const char *replacement = "\xEF\xBF\xBD";

    std::string res;
    res.reserve(str.size());
    usize i = 0;
    while (i < str.size()) {
        auto c = static_cast<u8>(str[i]);
        if (c < 0x80) {
            res.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        usize length = 0;
        u8 lower = 0x80;
        u8 upper = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            length = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            length = 3;
            if (c == 0xE0) lower = 0xA0;
            if (c == 0xED) upper = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            length = 4;
            if (c == 0xF0) lower = 0x90;
            if (c == 0xF4) upper = 0x8F;
        } else {
            res += replacement;
            i++;
            continue;
        }

        usize consumed = 1;
        bool valid = true;
        for (; consumed < length; consumed++) {
            if (i + consumed >= str.size()) {
                valid = false;
                break;
            }
            auto next = static_cast<u8>(str[i + consumed]);
            u8 lo = consumed == 1 ? lower : 0x80;
            u8 hi = consumed == 1 ? upper : 0xBF;
            if (next < lo || next > hi) {
                valid = false;
                break;
            }
        }

        if (valid) {
            res.append(str.substr(i, length));
        } else {
            res += replacement;
        }
        i += consumed;
    }

    return res;
}

static int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string PercentDecode(std::string_view str) {
    std::string res;
    res.reserve(str.size());
    for (usize i = 0; i < str.size(); i++) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = HexValue(str[i + 1]);
            int lo = HexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                res.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        res.push_back(str[i]);
    }
    return res;
}

std::optional<i64> ParseInt(std::string_view str) {
    str = Trim(str);
    if (str.empty()) return std::nullopt;

    bool negative = false;
    if (str.front() == '+' || str.front() == '-') {
        negative = str.front() == '-';
        str.remove_prefix(1);
    }
    if (str.empty()) return std::nullopt;
    for (char c : str) {
        if (!IsAsciiDigit(c)) return std::nullopt;
    }

    u64 magnitude{};
    auto [ptr, ec] =
        std::from_chars(str.data(), str.data() + str.size(), magnitude);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    constexpr u64 max_positive = static_cast<u64>(INT64_MAX);
    if (negative) {
        if (magnitude > max_positive + 1) return std::nullopt;
        return magnitude == max_positive + 1
                   ? INT64_MIN
                   : -static_cast<i64>(magnitude);
    }
    if (magnitude > max_positive) return std::nullopt;
    return static_cast<i64>(magnitude);
}

std::optional<f64> ParseFloat(std::string_view str) {
    str = Trim(str);
    if (str.empty()) return std::nullopt;

    std::string text(str);
    std::string lowered = ToLower(text);
    std::string_view body = lowered;
    if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
        body.remove_prefix(1);
    }
    if (body == "inf" || body == "infinity" || body == "nan") {
        f64 value = body == "nan" ? NAN : INFINITY;
        return lowered.front() == '-' ? -value : value;
    }

    // Only plain decimal notation, strtod alone would also take hex floats.
    bool seen_digit = false;
    for (char c : body) {
        if (IsAsciiDigit(c)) {
            seen_digit = true;
        } else if (c != '.' && c != 'e' && c != '+' && c != '-') {
            return std::nullopt;
        }
    }
    if (!seen_digit) return std::nullopt;

    char *end = nullptr;
    f64 value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string FormatFloat(f64 value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                   std::chars_format::scientific);
    if (ec != std::errc()) {
        std::ostringstream fallback;
        fallback << std::setprecision(17) << value;
        return fallback.str();
    }
    std::string sci(buffer, ptr);

    std::string sign;
    if (!sci.empty() && sci.front() == '-') {
        sign = "-";
        sci.erase(0, 1);
    }

    usize e_pos = sci.find('e');
    std::string mantissa = sci.substr(0, e_pos);
    int exponent = std::stoi(sci.substr(e_pos + 1));

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') digits.push_back(c);
    }

    if (exponent < -4 || exponent >= 16) {
        std::string res = sign + digits.substr(0, 1);
        if (digits.size() > 1) {
            res += "." + digits.substr(1);
        }
        char exp_buffer[16];
        std::snprintf(exp_buffer, sizeof(exp_buffer), "e%c%02d",
                      exponent < 0 ? '-' : '+', std::abs(exponent));
        return res + exp_buffer;
    }

    std::string res;
    if (exponent < 0) {
        res = "0." + std::string(static_cast<usize>(-exponent - 1), '0') +
              digits;
    } else {
        auto int_digits = static_cast<usize>(exponent + 1);
        if (digits.size() <= int_digits) {
            res = digits + std::string(int_digits - digits.size(), '0') + ".0";
        } else {
            res = digits.substr(0, int_digits) + "." +
                  digits.substr(int_digits);
        }
    }
    return sign + res;
}
}  // namespace utils
