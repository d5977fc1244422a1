#pragma once

#include "DiurnalModel.hpp"
#include "TempSeries.hpp"
#include <optional>
#include <vector>

namespace NDiurnal {

    struct SExtremeRef {
        size_t                day      = 0;
        NTempSeries::eExtreme variable = NTempSeries::EXTREME_TMIN;

        bool                  operator==(const SExtremeRef& other) const = default;
    };

    struct SExtremeTerm {
        SExtremeRef ref;
        double      coefficient = 0.0;
    };

    struct SSeriesEquation {
        double                    constant = 0.0;
        std::vector<SExtremeTerm> terms;

        double                    coefficientOf(const SExtremeRef& ref) const;
    };

    // The diurnal curve laid over a day table. The first and last day stand in
    // for their own missing neighbours.
    class CSeriesCurve {
      public:
        CSeriesCurve(const NSunCalc::CSunCalculator& calculator, const NTempSeries::TDailyExtremes& daily);

        SSeriesEquation       equationAt(size_t day, int hour) const;

        // nullopt while any extreme the hour depends on is unknown
        std::optional<double> idealizedAt(size_t day, int hour, const NTempSeries::TDailyExtremes& daily) const;

      private:
        SExtremeRef             resolve(size_t day, eExtremeSlot slot) const;

        std::vector<SSunWindow> m_windows;
    };
}
