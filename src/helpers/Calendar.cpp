#include "Calendar.hpp"
#include <format>
#include <stdexcept>

namespace NCalendar {

    bool isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    int daysInMonth(int year, int month) {
        static constexpr int MONTH_DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12)
            return 0;
        if (month == 2 && isLeapYear(year))
            return 29;
        return MONTH_DAYS[month - 1];
    }

    bool isValidDate(const SDate& date) {
        return date.month >= 1 && date.month <= 12 && date.day >= 1 && date.day <= daysInMonth(date.year, date.month);
    }

    void validateDate(const SDate& date) {
        if (!isValidDate(date))
            throw std::invalid_argument(std::format("invalid calendar date {:04}-{:02}-{:02}", date.year, date.month, date.day));
    }

    int dayOfYear(const SDate& date) {
        validateDate(date);

        int doy = date.day;
        for (int m = 1; m < date.month; ++m)
            doy += daysInMonth(date.year, m);
        return doy;
    }

    SDate nextDay(const SDate& date) {
        SDate next = date;
        if (++next.day > daysInMonth(next.year, next.month)) {
            next.day = 1;
            if (++next.month > 12) {
                next.month = 1;
                ++next.year;
            }
        }
        return next;
    }

    SDate previousDay(const SDate& date) {
        SDate prev = date;
        if (--prev.day < 1) {
            if (--prev.month < 1) {
                prev.month = 12;
                --prev.year;
            }
            prev.day = daysInMonth(prev.year, prev.month);
        }
        return prev;
    }

    std::int64_t dateKey(const SDate& date) {
        return (std::int64_t)date.year * 10000LL + (std::int64_t)date.month * 100LL + date.day;
    }
}
