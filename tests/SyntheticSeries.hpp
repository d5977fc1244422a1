#pragma once

#include "SeriesCurve.hpp"
#include "TempSeries.hpp"
#include <vector>

// Day tables and hourly series that follow the diurnal curve exactly.
namespace NSynthetic {

    struct SSeries {
        NTempSeries::TDailyExtremes              daily;
        std::vector<NTempSeries::SHourlyRecord> hourly;
    };

    inline NTempSeries::TDailyExtremes dayTable(NCalendar::SDate start, const std::vector<double>& tmin, const std::vector<double>& tmax) {
        NTempSeries::TDailyExtremes daily;
        NCalendar::SDate            date = start;
        for (size_t i = 0; i < tmin.size(); ++i) {
            daily.push_back(NTempSeries::makeDailyRecord(date.year, date.month, date.day, tmin[i], tmax[i]));
            date = NCalendar::nextDay(date);
        }
        return daily;
    }

    inline SSeries idealSeries(double latitude, NCalendar::SDate start, const std::vector<double>& tmin, const std::vector<double>& tmax) {
        SSeries                        series{.daily = dayTable(start, tmin, tmax)};

        const NSunCalc::CSunCalculator calculator(latitude);
        const NDiurnal::CSeriesCurve   curve(calculator, series.daily);

        for (size_t day = 0; day < series.daily.size(); ++day) {
            const auto& rec = series.daily[day];
            for (int hour = 0; hour < NTempSeries::HOURS_PER_DAY; ++hour)
                series.hourly.push_back({.year = rec.year, .month = rec.month, .day = rec.day, .hour = hour, .temperature = curve.idealizedAt(day, hour, series.daily)});
        }

        return series;
    }

    inline std::vector<NTempSeries::SHourlyRecord> withoutTemperatures(std::vector<NTempSeries::SHourlyRecord> hourly) {
        for (auto& rec : hourly)
            rec.temperature.reset();
        return hourly;
    }

    inline NTempSeries::TDailyExtremes withoutExtremes(NTempSeries::TDailyExtremes daily) {
        for (auto& rec : daily) {
            rec.tmin = {};
            rec.tmax = {};
        }
        return daily;
    }

    inline size_t indexOf(size_t day, int hour) {
        return day * NTempSeries::HOURS_PER_DAY + hour;
    }
}
