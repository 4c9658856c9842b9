#include "series/date.h"

#include <cstdio>
#include <stdexcept>

namespace sde {

namespace {

constexpr time_t SECONDS_PER_DAY = 86400;

time_t floor_div(time_t a, time_t b) {
    time_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

} // anonymous namespace

Date Date::from_ymd(int year, int month, int day) {
    struct tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = 12;  // keep away from day edges
    time_t ts = timegm(&t);

    Date d = from_epoch(ts);

    // timegm normalises out-of-range fields (Feb 30 -> Mar 2); reject those.
    struct tm back{};
    time_t check = d.to_epoch();
    gmtime_r(&check, &back);
    if (back.tm_year != year - 1900 || back.tm_mon != month - 1 || back.tm_mday != day) {
        throw std::invalid_argument("invalid calendar date: " +
                                    std::to_string(year) + "-" + std::to_string(month) +
                                    "-" + std::to_string(day));
    }
    return d;
}

Date Date::parse(const std::string& iso) {
    int y = 0, m = 0, d = 0;
    if (iso.size() < 10 || iso[4] != '-' || iso[7] != '-' ||
        std::sscanf(iso.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) {
        throw std::invalid_argument("invalid ISO date: '" + iso + "'");
    }
    return from_ymd(y, m, d);
}

Date Date::from_epoch(time_t ts) {
    return Date(static_cast<int32_t>(floor_div(ts, SECONDS_PER_DAY)));
}

Date Date::today() {
    return from_epoch(std::time(nullptr));
}

int Date::weekday() const {
    // 1970-01-01 was a Thursday.
    int w = (days_ + 3) % 7;
    return w < 0 ? w + 7 : w;
}

std::string Date::iso() const {
    struct tm t{};
    time_t ts = to_epoch();
    gmtime_r(&ts, &t);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", t.tm_year + 1900, t.tm_mon + 1, t.tm_mday);
    return buf;
}


std::string format_timestamp(time_t ts) {
    struct tm t{};
    gmtime_r(&ts, &t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &t);
    return buf;
}

time_t parse_timestamp(const std::string& iso) {
    Date day = Date::parse(iso);
    int hh = 0, mm = 0, ss = 0;
    if (iso.size() >= 19 && (iso[10] == 'T' || iso[10] == ' ')) {
        if (std::sscanf(iso.c_str() + 11, "%2d:%2d:%2d", &hh, &mm, &ss) != 3) {
            throw std::invalid_argument("invalid ISO timestamp: '" + iso + "'");
        }
    }
    return day.to_epoch() + hh * 3600 + mm * 60 + ss;
}

} // namespace sde
