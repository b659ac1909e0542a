// EN: Civil date arithmetic (days-from-civil / civil-from-days) and timestamp formatting.
// FR: Arithmétique des dates civiles et formatage des horodatages.

#include "model/calendar_date.hpp"

#include <cstdio>
#include <regex>

namespace FIN {

bool CalendarDate::isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int CalendarDate::daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) {
        return 0;
    }
    return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

bool CalendarDate::isValid(int y, int m, int d) {
    return m >= 1 && m <= 12 && d >= 1 && d <= daysInMonth(y, m);
}

// EN: Howard Hinnant's days_from_civil.
// FR: days_from_civil de Howard Hinnant.
int64_t CalendarDate::toDayNumber() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::fromDayNumber(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    return CalendarDate(y, m, d);
}

CalendarDate CalendarDate::fromTimePoint(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    int64_t days = secs / 86400;
    if (secs % 86400 < 0) {
        --days;
    }
    return fromDayNumber(days);
}

CalendarDate CalendarDate::today() {
    return fromTimePoint(std::chrono::system_clock::now());
}

std::string CalendarDate::toIsoString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string CalendarDate::toCompactString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", year, month, day);
    return buf;
}

std::string CalendarDate::toMonthString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return buf;
}

int CalendarDate::dayOfWeek() const {
    // EN: 1970-01-01 was a Thursday.
    // FR: Le 1970-01-01 était un jeudi.
    int64_t weekday = (toDayNumber() + 4) % 7;
    return static_cast<int>(weekday < 0 ? weekday + 7 : weekday);
}

std::optional<CalendarDate> CalendarDate::parseIso(const std::string& text) {
    static const std::regex iso_regex(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch match;
    if (!std::regex_match(text, match, iso_regex)) {
        return std::nullopt;
    }
    int y = std::stoi(match[1].str());
    int m = std::stoi(match[2].str());
    int d = std::stoi(match[3].str());
    if (!isValid(y, m, d)) {
        return std::nullopt;
    }
    return CalendarDate(y, m, d);
}

std::string formatTimestamp(const Timestamp& tp) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    int64_t ms = ms_total % 1000;
    int64_t secs = ms_total / 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }
    int64_t days = secs / 86400;
    int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    CalendarDate date = CalendarDate::fromDayNumber(days);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  date.year, date.month, date.day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60), static_cast<int>(ms));
    return buf;
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    static const std::regex ts_regex(
        R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,3}))?Z$)");
    std::smatch match;
    if (!std::regex_match(text, match, ts_regex)) {
        return std::nullopt;
    }
    int y = std::stoi(match[1].str());
    int mo = std::stoi(match[2].str());
    int d = std::stoi(match[3].str());
    int h = std::stoi(match[4].str());
    int mi = std::stoi(match[5].str());
    int s = std::stoi(match[6].str());
    if (!CalendarDate::isValid(y, mo, d) || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }
    int ms = 0;
    if (match[7].matched) {
        std::string frac = match[7].str();
        while (frac.size() < 3) frac += '0';
        ms = std::stoi(frac);
    }

    int64_t secs = CalendarDate(y, mo, d).toDayNumber() * 86400 + h * 3600 + mi * 60 + s;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(secs * 1000 + ms)));
}

} // namespace FIN
