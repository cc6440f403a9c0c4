#include "timestamp.hpp"

#include <array>
#include <cstdio>

#include "../../utils/utils.hpp"
#include "cursor.hpp"

namespace core::parse {
namespace {
using namespace std::chrono;

constexpr std::array<const char *, 12> MonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec",
};

std::optional<sys_days> MakeDate(int y, int m, int d) {
    if (y < 1 || y > 9999) return std::nullopt;
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)},
                       day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    return sys_days{ymd};
}

bool ValidTime(int h, int m, int s) {
    return h >= 0 && h < 24 && m >= 0 && m < 60 && s >= 0 && s < 60;
}

// Parses "Z", "+HHMM", "+HH:MM" or "+HH". Returns the offset east of UTC.
std::optional<minutes> ParseOffset(Cursor &cur) {
    if (cur.Expect('Z') || cur.Expect('z')) {
        return minutes{0};
    }

    int sign = 1;
    if (cur.Expect('-')) {
        sign = -1;
    } else if (!cur.Expect('+')) {
        return std::nullopt;
    }

    int hh{};
    int mm{};
    if (!cur.Digits(2, 2, &hh)) return std::nullopt;
    if (!cur.Done()) {
        cur.Expect(':');
        if (!cur.Digits(2, 2, &mm)) return std::nullopt;
    }
    if (hh >= 24 || mm >= 60) return std::nullopt;

    return minutes{sign * (hh * 60 + mm)};
}
}  // namespace

std::optional<TimePoint> ParseLogTime(std::string_view text) {
    Cursor cur(text);
    int d{}, y{}, h{}, mi{}, s{};

    if (!cur.Digits(1, 2, &d) || !cur.Expect('/')) return std::nullopt;

    if (cur.Remaining() < 3) return std::nullopt;
    std::string month_name = utils::ToLower(cur.Take(3));
    int m = 0;
    for (usize i = 0; i < MonthNames.size(); i++) {
        if (month_name == MonthNames[i]) {
            m = static_cast<int>(i) + 1;
            break;
        }
    }
    if (m == 0 || !cur.Expect('/')) return std::nullopt;

    if (!cur.Digits(4, 4, &y) || !cur.Expect(':')) return std::nullopt;
    if (!cur.Digits(1, 2, &h) || !cur.Expect(':')) return std::nullopt;
    if (!cur.Digits(1, 2, &mi) || !cur.Expect(':')) return std::nullopt;
    if (!cur.Digits(1, 2, &s)) return std::nullopt;

    if (!utils::IsAsciiSpace(cur.Peek())) return std::nullopt;
    while (utils::IsAsciiSpace(cur.Peek())) cur.Take(1);

    auto offset = ParseOffset(cur);
    if (!offset || !cur.Done()) return std::nullopt;

    auto date = MakeDate(y, m, d);
    if (!date || !ValidTime(h, mi, s)) return std::nullopt;

    auto local = TimePoint{*date} + hours{h} + minutes{mi} + seconds{s};
    return local - *offset;
}

std::optional<TimePoint> ParseIsoUtc(std::string_view text) {
    Cursor cur(utils::Trim(text));
    int y{}, m{}, d{};

    if (!cur.Digits(4, 4, &y)) return std::nullopt;
    bool extended = cur.Expect('-');
    if (!cur.Digits(2, 2, &m)) return std::nullopt;
    if (extended && !cur.Expect('-')) return std::nullopt;
    if (!cur.Digits(2, 2, &d)) return std::nullopt;

    auto date = MakeDate(y, m, d);
    if (!date) return std::nullopt;
    if (cur.Done()) return TimePoint{*date};

    // Any single character separates the date from the time.
    cur.Take(1);

    int h{}, mi{}, s{};
    microseconds fraction{0};
    if (!cur.Digits(2, 2, &h)) return std::nullopt;
    if (cur.Expect(':')) {
        if (!cur.Digits(2, 2, &mi)) return std::nullopt;
        if (cur.Expect(':')) {
            if (!cur.Digits(2, 2, &s)) return std::nullopt;
            if (cur.Expect('.') || cur.Expect(',')) {
                int digit{};
                int scale = 100000;
                usize count = 0;
                i64 micros = 0;
                while (cur.Digits(1, 1, &digit)) {
                    if (scale > 0) {
                        micros += digit * scale;
                        scale /= 10;
                    }
                    count++;
                }
                if (count == 0) return std::nullopt;
                fraction = microseconds{micros};
            }
        }
    }
    if (!ValidTime(h, mi, s)) return std::nullopt;

    minutes offset{0};
    if (!cur.Done()) {
        auto parsed = ParseOffset(cur);
        if (!parsed || !cur.Done()) return std::nullopt;
        offset = *parsed;
    }

    auto local =
        TimePoint{*date} + hours{h} + minutes{mi} + seconds{s} + fraction;
    return local - offset;
}

std::string FormatIsoUtc(TimePoint time) {
    auto day_point = floor<days>(time);
    year_month_day ymd{day_point};
    auto tod = time - day_point;

    auto h = duration_cast<hours>(tod);
    tod -= h;
    auto mi = duration_cast<minutes>(tod);
    tod -= mi;
    auto s = duration_cast<seconds>(tod);
    tod -= s;

    char buffer[64];
    int len = std::snprintf(
        buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()), static_cast<int>(h.count()),
        static_cast<int>(mi.count()), static_cast<int>(s.count()));
    std::string res(buffer, static_cast<usize>(len));
    if (tod.count() != 0) {
        std::snprintf(buffer, sizeof(buffer), ".%06lld",
                      static_cast<long long>(tod.count()));
        res += buffer;
    }
    return res + "Z";
}
}  // namespace core::parse
