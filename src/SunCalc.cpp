#include "SunCalc.hpp"
#include "helpers/Calendar.hpp"
#include <cmath>
#include <cstdio>
#include <format>
#include <stdexcept>

namespace NSunCalc {

    // ------------------ Constructor ------------------

    CSunCalculator::CSunCalculator(double latitude) : m_latitude(latitude) {
        if (std::isnan(latitude) || latitude <= -MAX_LATITUDE || latitude >= MAX_LATITUDE)
            throw std::invalid_argument(std::format("latitude {} is outside (-90, 90)", latitude));
    }

    // ------------------ Public API ------------------

    SSunTimes CSunCalculator::compute(int dayOfYear) const {
        if (dayOfYear < 1 || dayOfYear > MAX_DAY_OF_YEAR)
            throw std::invalid_argument(std::format("day of year {} is outside [1, 366]", dayOfYear));

        const double cosHA = calcCosHourAngleSunrise(m_latitude, calcSunDeclination(dayOfYear));

        SSunTimes    times{};
        if (cosHA > 1.0) {
            // polar night
            times.sunrise        = HOURS_AT_NOON;
            times.sunset         = HOURS_AT_NOON;
            times.daylength      = 0.0;
            times.sunriseMissing = true;
            times.sunsetMissing  = true;
        } else if (cosHA < -1.0) {
            // midnight sun
            times.sunrise        = 0.0;
            times.sunset         = HOURS_PER_DAY;
            times.daylength      = HOURS_PER_DAY;
            times.sunriseMissing = true;
            times.sunsetMissing  = true;
        } else {
            const double halfDay = rad2deg(std::acos(cosHA)) / DEGREES_PER_HOUR;
            times.sunrise        = HOURS_AT_NOON - halfDay;
            times.sunset         = HOURS_AT_NOON + halfDay;
            times.daylength      = times.sunset - times.sunrise;
        }

        return times;
    }

    SSunTimes CSunCalculator::compute(int year, int month, int day) const {
        return compute(NCalendar::dayOfYear({year, month, day}));
    }

    double CSunCalculator::latitude() const {
        return m_latitude;
    }

    std::string CSunCalculator::formatTime(double decimalHours) {
        if (decimalHours < 0)
            return "--:--";

        double totalMinutes = std::round(decimalHours * MINUTES_PER_HOUR);
        totalMinutes        = std::fmod(totalMinutes, MINUTES_PER_DAY);

        int  h = static_cast<int>(totalMinutes / MINUTES_PER_HOUR);
        int  m = static_cast<int>(std::fmod(totalMinutes, MINUTES_PER_HOUR));

        char buf[6];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
        return std::string(buf);
    }

    // ------------------ Math Helpers ------------------

    double CSunCalculator::deg2rad(double deg) {
        return deg * M_PI / HALF_CIRCLE_DEGREES;
    }
    double CSunCalculator::rad2deg(double rad) {
        return rad * HALF_CIRCLE_DEGREES / M_PI;
    }

    // ------------------ Solar Geometry ------------------

    double CSunCalculator::calcDayAngle(int dayOfYear) {
        return 2.0 * M_PI / DAYS_PER_YEAR * (dayOfYear - 1);
    }

    // degrees
    double CSunCalculator::calcSunDeclination(int dayOfYear) {
        const double g = calcDayAngle(dayOfYear);
        return rad2deg(DECLINATION_BASE - DECLINATION_COS1 * std::cos(g) + DECLINATION_SIN1 * std::sin(g) - DECLINATION_COS2 * std::cos(2 * g) +
                       DECLINATION_SIN2 * std::sin(2 * g) - DECLINATION_COS3 * std::cos(3 * g) + DECLINATION_SIN3 * std::sin(3 * g));
    }

    // outside [-1, 1] the sun does not cross the horizon that day
    double CSunCalculator::calcCosHourAngleSunrise(double lat, double solarDec) {
        const double latRad = deg2rad(lat);
        const double sdRad  = deg2rad(solarDec);
        return (std::sin(deg2rad(SOLAR_STANDARD_ALTITUDE)) - std::sin(latRad) * std::sin(sdRad)) / (std::cos(latRad) * std::cos(sdRad));
    }

} // namespace NSunCalc
