#pragma once

#include "helpers/Calendar.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace NTempSeries {

    constexpr int HOURS_PER_DAY = 24;

    enum eExtreme : std::uint8_t {
        EXTREME_TMIN = 0,
        EXTREME_TMAX,
    };

    const char* extremeName(eExtreme extreme);

    struct SHourlyRecord {
        int                   year  = 0;
        int                   month = 0;
        int                   day   = 0;
        int                   hour  = 0;
        std::optional<double> temperature;

        NCalendar::SDate      date() const {
            return {year, month, day};
        }
    };

    // provenance of a daily value, carried with the value itself
    struct SObserved {};
    struct SSolved {
        size_t equations = 0;
        double fitError  = 0.0; // RMS residual of the least squares fit
    };
    struct SProxy {
        std::string station;
        double      meanBias = 0.0;
    };
    struct SInterpolated {};
    struct SMissing {};

    using TProvenance = std::variant<SObserved, SSolved, SProxy, SInterpolated, SMissing>;

    struct SDailyValue {
        std::optional<double> value;
        TProvenance           provenance = SMissing{};

        bool                  known() const {
            return value.has_value();
        }
        bool observed() const {
            return std::holds_alternative<SObserved>(provenance);
        }
        void set(double v, TProvenance source) {
            value      = v;
            provenance = std::move(source);
        }
    };

    struct SDailyRecord {
        int              year  = 0;
        int              month = 0;
        int              day   = 0;
        SDailyValue      tmin;
        SDailyValue      tmax;

        NCalendar::SDate date() const {
            return {year, month, day};
        }
        SDailyValue& value(eExtreme extreme) {
            return extreme == EXTREME_TMIN ? tmin : tmax;
        }
        const SDailyValue& value(eExtreme extreme) const {
            return extreme == EXTREME_TMIN ? tmin : tmax;
        }
    };

    using TDailyExtremes = std::vector<SDailyRecord>;

    // observed values are tagged SObserved, absent ones SMissing
    SDailyRecord   makeDailyRecord(int year, int month, int day, std::optional<double> tmin, std::optional<double> tmax);

    std::string    provenanceName(const TProvenance& provenance);

    // throws std::invalid_argument on invalid dates or a gap between consecutive days
    void           validateDayTable(const TDailyExtremes& daily);

    // every calendar day from the earliest to the latest hourly date, both extremes missing
    TDailyExtremes dailyTableFromHourly(const std::vector<SHourlyRecord>& hourly);

    struct SHourlyGrid {
        // observed temperature per day index and hour
        std::vector<std::array<std::optional<double>, HOURS_PER_DAY>> temperatures;
        // day index of each input record, aligned with the hourly vector
        std::vector<size_t>                                           dayOf;
    };

    // maps every hourly record onto the day table; throws std::invalid_argument
    // on invalid hours, duplicate hours or dates outside the table
    SHourlyGrid indexHourly(const std::vector<SHourlyRecord>& hourly, const TDailyExtremes& daily);
}
