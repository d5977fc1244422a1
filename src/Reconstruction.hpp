#pragma once

#include "ExtremeSolver.hpp"
#include "GapPatcher.hpp"
#include "Options.hpp"
#include "ResidualInterpolator.hpp"
#include "TempSeries.hpp"
#include <vector>

struct SReconstructionInput {
    double                                  latitude = 0.0;
    std::vector<NTempSeries::SHourlyRecord> hourly;
    // calendar-complete day table, derived from the hourly dates when empty
    NTempSeries::TDailyExtremes             daily;
    NGapPatcher::TProxySeries               proxies;
};

struct SReconstructionResult {
    std::vector<NTempSeries::SHourlyRecord>           hourly;
    std::vector<NResidual::eHourSource>               sources;
    NTempSeries::TDailyExtremes                       daily;
    NGapPatcher::SPatchReport                         report;
    std::vector<NExtremeSolver::SUnknownDiagnostics>  solverDiagnostics;

    std::vector<std::optional<double>>                temperatures() const;
};

// solver -> patcher -> residual interpolation
class CTemperatureReconstructor {
  public:
    explicit CTemperatureReconstructor(const SReconstructionOptions& options);

    // throws std::invalid_argument on out-of-domain input
    SReconstructionResult reconstruct(const SReconstructionInput& input) const;

  private:
    SReconstructionOptions m_options;
};
