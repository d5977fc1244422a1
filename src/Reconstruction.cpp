#include "Reconstruction.hpp"
#include "helpers/Log.hpp"

using namespace NTempSeries;

std::vector<std::optional<double>> SReconstructionResult::temperatures() const {
    std::vector<std::optional<double>> result;
    result.reserve(hourly.size());
    for (const auto& rec : hourly)
        result.push_back(rec.temperature);
    return result;
}

CTemperatureReconstructor::CTemperatureReconstructor(const SReconstructionOptions& options) : m_options(options) {}

SReconstructionResult CTemperatureReconstructor::reconstruct(const SReconstructionInput& input) const {
    const auto daily = input.daily.empty() ? dailyTableFromHourly(input.hourly) : input.daily;

    Debug::log(LOG, "reconstruct: {} hourly records over {} days at latitude {:.2f}, {} proxy stations", input.hourly.size(), daily.size(), input.latitude,
               input.proxies.size());

    const NExtremeSolver::CExtremeSolver          solver(input.latitude, m_options);
    const NGapPatcher::CGapPatcher                patcher(m_options);
    const NResidual::CResidualInterpolator        interpolator(input.latitude);

    auto                                          solved  = solver.solve(input.hourly, daily);
    auto                                          patched = patcher.patch(solved.daily, input.proxies);
    auto                                          hourly  = interpolator.reconstruct(input.hourly, patched.daily);

    SReconstructionResult result{
        .hourly            = std::move(hourly.hourly),
        .sources           = std::move(hourly.sources),
        .daily             = std::move(patched.daily),
        .report            = std::move(patched.report),
        .solverDiagnostics = std::move(solved.diagnostics),
    };

    size_t counts[4] = {0, 0, 0, 0};
    for (const auto source : result.sources)
        ++counts[source];

    Debug::log(LOG, "reconstruct: {} observed, {} interpolated, {} idealized, {} missing hours", counts[NResidual::HOUR_OBSERVED], counts[NResidual::HOUR_INTERPOLATED],
               counts[NResidual::HOUR_IDEALIZED], counts[NResidual::HOUR_MISSING]);
    Debug::log(LOG, "reconstruct: Tmin {} solved, {} patched, {} interpolated, {} missing; Tmax {} solved, {} patched, {} interpolated, {} missing", result.report.tmin.solved,
               result.report.tmin.patched(), result.report.tmin.interpolated, result.report.tmin.stillMissing, result.report.tmax.solved, result.report.tmax.patched(),
               result.report.tmax.interpolated, result.report.tmax.stillMissing);

    return result;
}
