#ifndef SUNCALC_HPP
#define SUNCALC_HPP

#include <string>

namespace NSunCalc {

    struct SSunTimes {
        double sunrise;   // decimal hours (local solar time)
        double sunset;    // decimal hours (local solar time)
        double daylength; // hours, 0 in polar night and 24 under the midnight sun
        bool   sunriseMissing{false};
        bool   sunsetMissing{false};
    };

    class CSunCalculator {
      public:
        // throws std::invalid_argument unless -90 < latitude < 90
        explicit CSunCalculator(double latitude);

        // dayOfYear in [1, 366], throws std::invalid_argument otherwise
        SSunTimes          compute(int dayOfYear) const;
        SSunTimes          compute(int year, int month, int day) const;
        double             latitude() const;
        static std::string formatTime(double decimalHours);

      private:
        double m_latitude;

        // Math helpers
        static double deg2rad(double deg);
        static double rad2deg(double rad);

        // Spencer (1971) series
        static double calcDayAngle(int dayOfYear);
        static double calcSunDeclination(int dayOfYear);
        static double calcCosHourAngleSunrise(double lat, double solarDec);

        // Shared constants
        static constexpr double HOURS_PER_DAY            = 24.0;
        static constexpr double HOURS_AT_NOON            = 12.0;
        static constexpr double DEGREES_PER_HOUR         = 15.0;
        static constexpr double DAYS_PER_YEAR            = 365.0;
        static constexpr double HALF_CIRCLE_DEGREES      = 180.0;
        static constexpr double SOLAR_STANDARD_ALTITUDE  = -0.8333;
        static constexpr double MAX_LATITUDE             = 90.0;
        static constexpr int    MAX_DAY_OF_YEAR          = 366;
        static constexpr double MINUTES_PER_HOUR         = 60.0;
        static constexpr double MINUTES_PER_DAY          = 1440.0;
        static constexpr double DECLINATION_BASE         = 0.006918;
        static constexpr double DECLINATION_COS1         = 0.399912;
        static constexpr double DECLINATION_SIN1         = 0.070257;
        static constexpr double DECLINATION_COS2         = 0.006758;
        static constexpr double DECLINATION_SIN2         = 0.000907;
        static constexpr double DECLINATION_COS3         = 0.002697;
        static constexpr double DECLINATION_SIN3         = 0.00148;
    };

} // namespace NSunCalc

#endif // SUNCALC_HPP
