#pragma once

#include "Options.hpp"
#include "SeriesCurve.hpp"
#include "TempSeries.hpp"
#include <vector>

namespace NExtremeSolver {

    struct SUnknownDiagnostics {
        size_t                day       = 0;
        NTempSeries::eExtreme variable  = NTempSeries::EXTREME_TMIN;
        size_t                equations = 0; // usable equations at the last attempt
        bool                  solved    = false;
        double                fitError  = 0.0;
    };

    struct SSolveResult {
        NTempSeries::TDailyExtremes      daily;
        std::vector<SUnknownDiagnostics> diagnostics;
        size_t                           passes = 0;
    };

    // Estimates missing daily Tmin/Tmax from the observed hours around them.
    class CExtremeSolver {
      public:
        // throws std::invalid_argument on a bad latitude or minEquations < 1
        CExtremeSolver(double latitude, const SReconstructionOptions& options);

        SSolveResult solve(const std::vector<NTempSeries::SHourlyRecord>& hourly, const NTempSeries::TDailyExtremes& daily) const;

      private:
        struct SRow {
            std::vector<double> coefficients;
            double              rhs = 0.0;
        };

        struct SSolution {
            std::vector<double> values;
            double              fitError = 0.0;
        };

        struct SUnknownState {
            NDiurnal::SExtremeRef ref;
            size_t                equations = 0;
            bool                  solved    = false;
            double                fitError  = 0.0;
        };

        // rows over the observed hours of days d-1..d+1 whose only unknowns are in `targets`
        std::vector<SRow>        collectRows(const std::vector<NDiurnal::SExtremeRef>& targets, const NDiurnal::CSeriesCurve& curve, const NTempSeries::SHourlyGrid& grid,
                                             const NTempSeries::TDailyExtremes& daily, std::vector<size_t>& counts) const;

        std::optional<SSolution> leastSquares(const std::vector<SRow>& rows, size_t unknowns) const;

        NSunCalc::CSunCalculator m_calculator;
        size_t                   m_minEquations;
    };
}
