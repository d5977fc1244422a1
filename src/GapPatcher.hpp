#pragma once

#include "Options.hpp"
#include "TempSeries.hpp"
#include <map>
#include <string>
#include <vector>

namespace NGapPatcher {

    using TProxySeries = std::map<std::string, NTempSeries::TDailyExtremes>;

    struct SVariableCounts {
        size_t                        solved       = 0;
        size_t                        interpolated = 0;
        size_t                        stillMissing = 0;
        std::map<std::string, size_t> patchedByStation;

        size_t                        patched() const;
        size_t                        total() const;
    };

    struct SStationBias {
        std::string           station;
        NTempSeries::eExtreme variable = NTempSeries::EXTREME_TMIN;
        size_t                overlap  = 0;
        double                meanBias = 0.0; // mean(proxy - target)
        double                sdBias   = 0.0; // sd(proxy - target)
        double                sdRatio  = 0.0; // sd(proxy) / sd(target), reported only
        bool                  used     = false;
        size_t                filled   = 0;
    };

    struct SPatchReport {
        SVariableCounts           tmin;
        SVariableCounts           tmax;
        std::vector<SStationBias> stations;

        const SVariableCounts&    counts(NTempSeries::eExtreme variable) const;
    };

    struct SPatchResult {
        NTempSeries::TDailyExtremes daily;
        SPatchReport                report;
    };

    // Fills the daily extremes the solver left open, from bias-corrected proxy
    // stations first and linear interpolation last.
    class CGapPatcher {
      public:
        explicit CGapPatcher(const SReconstructionOptions& options);

        // throws std::invalid_argument if the priority names an unknown station
        SPatchResult        patch(const NTempSeries::TDailyExtremes& daily, const TProxySeries& proxies) const;

        static SStationBias biasStatistics(const NTempSeries::TDailyExtremes& target, const NTempSeries::TDailyExtremes& proxy, NTempSeries::eExtreme variable,
                                           const std::string& station);

      private:
        std::vector<std::string> stationOrder(const TProxySeries& proxies) const;
        size_t                   applyProxy(NTempSeries::TDailyExtremes& daily, const NTempSeries::TDailyExtremes& proxy, SStationBias& bias) const;
        static void              interpolate(NTempSeries::TDailyExtremes& daily, NTempSeries::eExtreme variable);
        static SPatchReport      buildReport(const NTempSeries::TDailyExtremes& daily, std::vector<SStationBias>&& stations);

        SReconstructionOptions   m_options;
    };
}
