#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>

namespace vp {

// Returns current time in milliseconds since epoch
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// ---------- small date helpers ----------
// Dates are handled as day numbers (days since 1970-01-01) so that no
// timezone or DST rule can shift a calendar date.

static inline int days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static inline void civil_from_days(int z, int& y, int& m, int& d) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = z - era * 146097;
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    y = yoe + era * 400 + (m <= 2);
}

static inline bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

// Accepts "YYYY-MM-DD", optionally followed by 'T' or ' ' and a time of day.
// The time part is ignored. Returns nullopt for anything malformed.
static inline std::optional<int> try_parse_day(const std::string& s) {
    if (s.size() < 10) return std::nullopt;
    for (int i : {0, 1, 2, 3, 5, 6, 8, 9})
        if (s[i] < '0' || s[i] > '9') return std::nullopt;
    if (s[4] != '-' || s[7] != '-') return std::nullopt;
    if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') return std::nullopt;

    const int y = std::stoi(s.substr(0, 4));
    const int m = std::stoi(s.substr(5, 2));
    const int d = std::stoi(s.substr(8, 2));
    if (m < 1 || m > 12 || d < 1) return std::nullopt;
    static const int mdays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const int dim = (m == 2 && is_leap(y)) ? 29 : mdays[m - 1];
    if (d > dim) return std::nullopt;
    return days_from_civil(y, m, d);
}

static inline int parse_day(const std::string& s) {
    auto d = try_parse_day(s);
    if (!d) throw std::runtime_error("Bad date: " + s);
    return *d;
}

static inline std::string ymd_from_day(int day) {
    int y, m, d;
    civil_from_days(day, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return buf;
}

static inline std::string ymd_add_days(const std::string& ymd, int d) {
    return ymd_from_day(parse_day(ymd) + d);
}

static inline std::string today_local_ymd() {
    auto t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return ymd_from_day(days_from_civil(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday));
}

} // namespace vp
