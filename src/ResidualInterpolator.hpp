#pragma once

#include "SunCalc.hpp"
#include "TempSeries.hpp"
#include <cstdint>
#include <vector>

namespace NResidual {

    enum eHourSource : std::uint8_t {
        HOUR_OBSERVED = 0,
        HOUR_INTERPOLATED, // curve plus a residual interpolated between observed hours
        HOUR_IDEALIZED,    // curve alone, no observed hour on one side
        HOUR_MISSING,      // the daily extremes around this hour are incomplete
    };

    const char* hourSourceName(eHourSource source);

    struct SHourlyReconstruction {
        std::vector<NTempSeries::SHourlyRecord> hourly;
        std::vector<eHourSource>                sources;
    };

    // Rebuilds the hourly series as idealized curve + interpolated deviation from
    // it, which keeps the daily course inside gaps instead of bridging them with
    // straight lines.
    class CResidualInterpolator {
      public:
        explicit CResidualInterpolator(double latitude);

        // daily must be the day table the hourly records fall into. The result
        // holds one record per hour of the day table in calendar order, whatever
        // the order of the input and whichever hour records it lacks.
        SHourlyReconstruction reconstruct(const std::vector<NTempSeries::SHourlyRecord>& hourly, const NTempSeries::TDailyExtremes& daily) const;

      private:
        NSunCalc::CSunCalculator m_calculator;
    };
}
