#pragma once

#include <cstdint>

namespace NCalendar {

    struct SDate {
        int  year  = 0;
        int  month = 0;
        int  day   = 0;

        bool operator==(const SDate& other) const = default;
    };

    bool          isLeapYear(int year);
    int           daysInMonth(int year, int month);
    bool          isValidDate(const SDate& date);

    // throws std::invalid_argument when the date does not exist
    void          validateDate(const SDate& date);

    int           dayOfYear(const SDate& date);
    SDate         nextDay(const SDate& date);
    SDate         previousDay(const SDate& date);

    // yyyymmdd, orders like the date itself
    std::int64_t  dateKey(const SDate& date);
}
