#include "TempSeries.hpp"
#include <format>
#include <stdexcept>
#include <unordered_map>

namespace NTempSeries {

    const char* extremeName(eExtreme extreme) {
        return extreme == EXTREME_TMIN ? "Tmin" : "Tmax";
    }

    SDailyRecord makeDailyRecord(int year, int month, int day, std::optional<double> tmin, std::optional<double> tmax) {
        SDailyRecord record{.year = year, .month = month, .day = day};
        if (tmin)
            record.tmin.set(*tmin, SObserved{});
        if (tmax)
            record.tmax.set(*tmax, SObserved{});
        return record;
    }

    std::string provenanceName(const TProvenance& provenance) {
        struct {
            std::string operator()(const SObserved&) const {
                return "observed";
            }
            std::string operator()(const SSolved&) const {
                return "solved";
            }
            std::string operator()(const SProxy& proxy) const {
                return "proxy:" + proxy.station;
            }
            std::string operator()(const SInterpolated&) const {
                return "interpolated";
            }
            std::string operator()(const SMissing&) const {
                return "missing";
            }
        } visitor;

        return std::visit(visitor, provenance);
    }

    void validateDayTable(const TDailyExtremes& daily) {
        for (size_t i = 0; i < daily.size(); ++i) {
            NCalendar::validateDate(daily[i].date());

            if (i > 0 && NCalendar::nextDay(daily[i - 1].date()) != daily[i].date())
                throw std::invalid_argument(std::format("day table is not consecutive: {:04}-{:02}-{:02} follows {:04}-{:02}-{:02}", daily[i].year, daily[i].month,
                                                        daily[i].day, daily[i - 1].year, daily[i - 1].month, daily[i - 1].day));
        }
    }

    TDailyExtremes dailyTableFromHourly(const std::vector<SHourlyRecord>& hourly) {
        TDailyExtremes daily;
        if (hourly.empty())
            return daily;

        NCalendar::SDate first = hourly.front().date(), last = first;
        for (const auto& rec : hourly) {
            NCalendar::validateDate(rec.date());
            if (NCalendar::dateKey(rec.date()) < NCalendar::dateKey(first))
                first = rec.date();
            if (NCalendar::dateKey(rec.date()) > NCalendar::dateKey(last))
                last = rec.date();
        }

        for (auto date = first; NCalendar::dateKey(date) <= NCalendar::dateKey(last); date = NCalendar::nextDay(date))
            daily.push_back(makeDailyRecord(date.year, date.month, date.day, std::nullopt, std::nullopt));

        return daily;
    }

    SHourlyGrid indexHourly(const std::vector<SHourlyRecord>& hourly, const TDailyExtremes& daily) {
        std::unordered_map<std::int64_t, size_t> dayIndex;
        dayIndex.reserve(daily.size());
        for (size_t i = 0; i < daily.size(); ++i)
            dayIndex[NCalendar::dateKey(daily[i].date())] = i;

        SHourlyGrid grid;
        grid.temperatures.resize(daily.size());
        grid.dayOf.reserve(hourly.size());

        std::vector<std::array<bool, HOURS_PER_DAY>> seen(daily.size());
        for (auto& s : seen)
            s.fill(false);

        for (const auto& rec : hourly) {
            if (rec.hour < 0 || rec.hour >= HOURS_PER_DAY)
                throw std::invalid_argument(std::format("invalid hour {} on {:04}-{:02}-{:02}", rec.hour, rec.year, rec.month, rec.day));

            const auto it = dayIndex.find(NCalendar::dateKey(rec.date()));
            if (it == dayIndex.end())
                throw std::invalid_argument(std::format("hourly record {:04}-{:02}-{:02} is outside the day table", rec.year, rec.month, rec.day));

            if (seen[it->second][rec.hour])
                throw std::invalid_argument(std::format("duplicate hour {} on {:04}-{:02}-{:02}", rec.hour, rec.year, rec.month, rec.day));

            seen[it->second][rec.hour]                = true;
            grid.temperatures[it->second][rec.hour] = rec.temperature;
            grid.dayOf.push_back(it->second);
        }

        return grid;
    }
}
