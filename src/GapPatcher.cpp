#include "GapPatcher.hpp"
#include "helpers/Log.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <variant>

using namespace NTempSeries;

namespace NGapPatcher {

    size_t SVariableCounts::patched() const {
        size_t n = 0;
        for (const auto& [station, count] : patchedByStation)
            n += count;
        return n;
    }

    size_t SVariableCounts::total() const {
        return solved + patched() + interpolated + stillMissing;
    }

    const SVariableCounts& SPatchReport::counts(eExtreme variable) const {
        return variable == EXTREME_TMIN ? tmin : tmax;
    }

    CGapPatcher::CGapPatcher(const SReconstructionOptions& options) : m_options(options) {}

    static double sampleSd(double sum, double sumSq, size_t n) {
        if (n < 2)
            return 0.0;
        const double mean = sum / n;
        return std::sqrt(std::max(0.0, (sumSq - n * mean * mean) / (n - 1)));
    }

    static std::unordered_map<std::int64_t, size_t> indexByDate(const TDailyExtremes& series) {
        std::unordered_map<std::int64_t, size_t> index;
        index.reserve(series.size());
        for (size_t i = 0; i < series.size(); ++i)
            index[NCalendar::dateKey(series[i].date())] = i;
        return index;
    }

    SStationBias CGapPatcher::biasStatistics(const TDailyExtremes& target, const TDailyExtremes& proxy, eExtreme variable, const std::string& station) {
        SStationBias bias{.station = station, .variable = variable};

        const auto   proxyIndex = indexByDate(proxy);

        double       sumDiff = 0, sumDiffSq = 0, sumP = 0, sumPSq = 0, sumT = 0, sumTSq = 0;
        for (const auto& rec : target) {
            const auto& t = rec.value(variable);
            if (!t.observed())
                continue;

            const auto it = proxyIndex.find(NCalendar::dateKey(rec.date()));
            if (it == proxyIndex.end())
                continue;

            const auto& p = proxy[it->second].value(variable).value;
            if (!p)
                continue;

            const double diff = *p - *t.value;
            sumDiff += diff;
            sumDiffSq += diff * diff;
            sumP += *p;
            sumPSq += *p * *p;
            sumT += *t.value;
            sumTSq += *t.value * *t.value;
            ++bias.overlap;
        }

        if (bias.overlap == 0)
            return bias;

        bias.meanBias        = sumDiff / bias.overlap;
        bias.sdBias          = sampleSd(sumDiff, sumDiffSq, bias.overlap);

        const double sdProxy  = sampleSd(sumP, sumPSq, bias.overlap);
        const double sdTarget = sampleSd(sumT, sumTSq, bias.overlap);
        bias.sdRatio          = sdTarget > 0 ? sdProxy / sdTarget : std::numeric_limits<double>::quiet_NaN();

        return bias;
    }

    std::vector<std::string> CGapPatcher::stationOrder(const TProxySeries& proxies) const {
        if (m_options.proxyPriority.empty()) {
            std::vector<std::string> order;
            for (const auto& [name, series] : proxies)
                order.push_back(name);
            return order;
        }

        for (const auto& name : m_options.proxyPriority) {
            if (!proxies.contains(name))
                throw std::invalid_argument(std::format("proxy priority names unknown station '{}'", name));
        }

        if (m_options.proxyPriority.size() < proxies.size())
            Debug::log(WARN, "patcher: {} proxy stations supplied but only {} are in the priority list", proxies.size(), m_options.proxyPriority.size());

        return m_options.proxyPriority;
    }

    size_t CGapPatcher::applyProxy(TDailyExtremes& daily, const TDailyExtremes& proxy, SStationBias& bias) const {
        const auto proxyIndex = indexByDate(proxy);

        size_t     filled = 0;
        for (auto& rec : daily) {
            auto& target = rec.value(bias.variable);
            if (target.known())
                continue;

            const auto it = proxyIndex.find(NCalendar::dateKey(rec.date()));
            if (it == proxyIndex.end())
                continue;

            const auto& p = proxy[it->second].value(bias.variable).value;
            if (!p)
                continue;

            target.set(*p - bias.meanBias, SProxy{.station = bias.station, .meanBias = bias.meanBias});
            ++filled;
        }

        return filled;
    }

    void CGapPatcher::interpolate(TDailyExtremes& daily, eExtreme variable) {
        std::optional<size_t> lastKnown;

        for (size_t i = 0; i < daily.size(); ++i) {
            if (!daily[i].value(variable).known())
                continue;

            if (lastKnown && i - *lastKnown > 1) {
                const double from = *daily[*lastKnown].value(variable).value;
                const double to   = *daily[i].value(variable).value;
                const double span = (double)(i - *lastKnown);

                for (size_t j = *lastKnown + 1; j < i; ++j)
                    daily[j].value(variable).set(from + (to - from) * (j - *lastKnown) / span, SInterpolated{});
            }

            lastKnown = i;
        }
    }

    SPatchReport CGapPatcher::buildReport(const TDailyExtremes& daily, std::vector<SStationBias>&& stations) {
        SPatchReport report;
        report.stations = std::move(stations);

        for (const auto& rec : daily) {
            for (const auto variable : {EXTREME_TMIN, EXTREME_TMAX}) {
                auto& counts = variable == EXTREME_TMIN ? report.tmin : report.tmax;

                std::visit(
                    [&counts](const auto& source) {
                        using T = std::decay_t<decltype(source)>;
                        if constexpr (std::is_same_v<T, SSolved>)
                            ++counts.solved;
                        else if constexpr (std::is_same_v<T, SProxy>)
                            ++counts.patchedByStation[source.station];
                        else if constexpr (std::is_same_v<T, SInterpolated>)
                            ++counts.interpolated;
                        else if constexpr (std::is_same_v<T, SMissing>)
                            ++counts.stillMissing;
                    },
                    rec.value(variable).provenance);
            }
        }

        return report;
    }

    SPatchResult CGapPatcher::patch(const TDailyExtremes& daily, const TProxySeries& proxies) const {
        validateDayTable(daily);

        SPatchResult              result{.daily = daily};
        std::vector<SStationBias> stations;

        const auto                order = stationOrder(proxies);

        for (const auto variable : {EXTREME_TMIN, EXTREME_TMAX}) {
            for (const auto& name : order) {
                const auto& proxy = proxies.at(name);
                auto        bias  = biasStatistics(daily, proxy, variable, name);

                if (bias.overlap == 0)
                    Debug::log(WARN, "patcher: station {} has no {} overlap with the target, skipping", name, extremeName(variable));
                else if (std::abs(bias.meanBias) > m_options.maxMeanBias || bias.sdBias > m_options.maxStdevBias)
                    Debug::log(WARN, "patcher: station {} rejected for {} (mean bias {:.2f}, sd bias {:.2f})", name, extremeName(variable), bias.meanBias, bias.sdBias);
                else {
                    bias.used   = true;
                    bias.filled = applyProxy(result.daily, proxy, bias);
                    Debug::log(LOG, "patcher: station {} filled {} {} values (mean bias {:.2f})", name, bias.filled, extremeName(variable), bias.meanBias);
                }

                stations.push_back(std::move(bias));
            }

            if (m_options.interpolateGaps)
                interpolate(result.daily, variable);
        }

        result.report = buildReport(result.daily, std::move(stations));

        if (result.report.tmin.stillMissing + result.report.tmax.stillMissing > 0)
            Debug::log(WARN, "patcher: {} Tmin and {} Tmax values remain missing", result.report.tmin.stillMissing, result.report.tmax.stillMissing);

        return result;
    }
}
