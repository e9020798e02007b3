#include "TimeUtils.hpp"
#include <cstdio>

namespace TimeUtils {

static int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : DAYS[month - 1];
}

std::string toIso8601(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

std::optional<std::time_t> fromIso8601(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SSZ
    if (text.size() != 20) return std::nullopt;

    std::tm tm{};
    char tail = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c%n",
        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &tail, &consumed) != 7)
        return std::nullopt;
    if (tail != 'Z' || consumed != 20) return std::nullopt;

    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31
        || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
        return std::nullopt;
    if (tm.tm_mday > daysInMonth(tm.tm_year, tm.tm_mon)) return std::nullopt;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return timegm(&tm);
}

std::string formatLocal(std::time_t t, bool withTime) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), withTime ? "%b %e, %Y %H:%M" : "%b %e, %Y", &tm);
    return std::string(buf);
}

}
