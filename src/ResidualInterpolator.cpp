#include "ResidualInterpolator.hpp"
#include "SeriesCurve.hpp"
#include "helpers/Log.hpp"
#include <optional>

using namespace NTempSeries;

namespace NResidual {

    const char* hourSourceName(eHourSource source) {
        switch (source) {
            case HOUR_OBSERVED: return "observed";
            case HOUR_INTERPOLATED: return "interpolated";
            case HOUR_IDEALIZED: return "idealized";
            case HOUR_MISSING: return "missing";
        }
        return "unknown";
    }

    CResidualInterpolator::CResidualInterpolator(double latitude) : m_calculator(latitude) {}

    SHourlyReconstruction CResidualInterpolator::reconstruct(const std::vector<SHourlyRecord>& hourly, const TDailyExtremes& daily) const {
        validateDayTable(daily);

        const auto                         grid = indexHourly(hourly, daily);
        const NDiurnal::CSeriesCurve       curve(m_calculator, daily);

        // one slot per hour of the day table, slot index is the absolute hour
        const size_t                       n = daily.size() * HOURS_PER_DAY;
        std::vector<std::optional<double>> idealized(n), residual(n);

        SHourlyReconstruction              result{.sources = std::vector<eHourSource>(n, HOUR_MISSING)};
        result.hourly.reserve(n);

        for (size_t day = 0; day < daily.size(); ++day) {
            for (int hour = 0; hour < HOURS_PER_DAY; ++hour) {
                const size_t slot     = day * HOURS_PER_DAY + hour;
                const auto&  observed = grid.temperatures[day][hour];

                idealized[slot] = curve.idealizedAt(day, hour, daily);
                if (idealized[slot] && observed)
                    residual[slot] = *observed - *idealized[slot];

                result.hourly.push_back({.year = daily[day].year, .month = daily[day].month, .day = daily[day].day, .hour = hour, .temperature = observed});
            }
        }

        std::optional<size_t> previousAnchor;
        size_t                nextAnchor = 0;
        size_t                missing    = 0;

        for (size_t i = 0; i < n; ++i) {
            if (result.hourly[i].temperature) {
                result.sources[i] = HOUR_OBSERVED;
                if (residual[i])
                    previousAnchor = i;
                continue;
            }

            if (!idealized[i]) {
                ++missing;
                continue;
            }

            if (nextAnchor <= i) {
                nextAnchor = i + 1;
                while (nextAnchor < n && !residual[nextAnchor])
                    ++nextAnchor;
            }

            double deviation = 0.0;
            if (previousAnchor && nextAnchor < n) {
                const double from = *residual[*previousAnchor];
                const double to   = *residual[nextAnchor];
                deviation         = from + (to - from) * (double)(i - *previousAnchor) / (double)(nextAnchor - *previousAnchor);
                result.sources[i] = HOUR_INTERPOLATED;
            } else
                result.sources[i] = HOUR_IDEALIZED;

            result.hourly[i].temperature = *idealized[i] + deviation;
        }

        if (missing > 0)
            Debug::log(WARN, "interpolator: {} hours left missing, their daily extremes are incomplete", missing);

        return result;
    }
}
