// EN: Day-precision civil date used by every transaction and detector, plus timestamp helpers.
// FR: Date civile à la journée utilisée par les transactions et les détecteurs, plus utilitaires d'horodatage.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace FIN {

// EN: Proleptic Gregorian date. Day numbers count days since 1970-01-01.
// FR: Date grégorienne proleptique. Les numéros de jour comptent depuis le 1970-01-01.
struct CalendarDate {
    int year{1970};
    int month{1};
    int day{1};

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    static bool isValid(int y, int m, int d);
    static bool isLeapYear(int y);
    static int daysInMonth(int y, int m);

    static CalendarDate fromDayNumber(int64_t days);
    int64_t toDayNumber() const;

    // EN: Today in UTC.
    // FR: Aujourd'hui en UTC.
    static CalendarDate today();
    static CalendarDate fromTimePoint(std::chrono::system_clock::time_point tp);

    CalendarDate addDays(int64_t days) const { return fromDayNumber(toDayNumber() + days); }
    CalendarDate endOfMonth() const { return CalendarDate(year, month, daysInMonth(year, month)); }
    CalendarDate startOfMonth() const { return CalendarDate(year, month, 1); }

    // EN: 0 = Sunday ... 6 = Saturday.
    // FR: 0 = dimanche ... 6 = samedi.
    int dayOfWeek() const;

    // EN: Signed number of days from this date to other.
    // FR: Nombre signé de jours de cette date jusqu'à other.
    int64_t daysUntil(const CalendarDate& other) const { return other.toDayNumber() - toDayNumber(); }

    std::string toIsoString() const;      // YYYY-MM-DD
    std::string toCompactString() const;  // YYYYMMDD
    std::string toMonthString() const;    // YYYY-MM

    // EN: Parse strict YYYY-MM-DD. Returns nullopt for malformed or impossible dates.
    // FR: Parse strict YYYY-MM-DD. Retourne nullopt si malformé ou impossible.
    static std::optional<CalendarDate> parseIso(const std::string& text);

    bool operator==(const CalendarDate& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }
    bool operator<(const CalendarDate& o) const { return toDayNumber() < o.toDayNumber(); }
    bool operator>(const CalendarDate& o) const { return o < *this; }
    bool operator<=(const CalendarDate& o) const { return !(o < *this); }
    bool operator>=(const CalendarDate& o) const { return !(*this < o); }
};

// EN: Inclusive date range.
// FR: Plage de dates inclusive.
struct DateRange {
    CalendarDate start;
    CalendarDate end;

    bool contains(const CalendarDate& date) const { return start <= date && date <= end; }
    int64_t spanDays() const { return start.daysUntil(end); }

    bool operator==(const DateRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const DateRange& o) const { return !(*this == o); }
};

using Timestamp = std::chrono::system_clock::time_point;

// EN: ISO-8601 UTC with milliseconds, e.g. 2024-01-31T10:15:00.000Z.
// FR: ISO-8601 UTC avec millisecondes, ex. 2024-01-31T10:15:00.000Z.
std::string formatTimestamp(const Timestamp& tp);
std::optional<Timestamp> parseTimestamp(const std::string& text);

} // namespace FIN
