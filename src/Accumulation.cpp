#include "Accumulation.hpp"
#include <algorithm>
#include <cmath>

namespace NAccumulation {

    // Dynamic Model parameters
    static constexpr double E0              = 4153.5;
    static constexpr double E1              = 12888.8;
    static constexpr double A0              = 139500.0;
    static constexpr double A1              = 2.567e18;
    static constexpr double SLP             = 1.6;
    static constexpr double TETMLT          = 277.0;
    static constexpr double KELVIN_OFFSET   = 273.0;
    static constexpr double PORTION_LEVEL   = 1.0;

    static constexpr double CHILLING_LOWER  = 0.0;
    static constexpr double CHILLING_UPPER  = 7.2;

    SChillState advanceChill(const SChillState& state, double temperature) {
        const double tk   = temperature + KELVIN_OFFSET;
        const double sr   = std::exp(SLP * TETMLT * (tk - TETMLT) / tk);
        const double xi   = sr / (1.0 + sr);
        const double xs   = A0 / A1 * std::exp((E1 - E0) / tk);
        const double ak1  = A1 * std::exp(-E1 / tk);

        // once the precursor reached the portion level, its converted share is gone
        const double start = state.intermediate < PORTION_LEVEL ? state.intermediate : state.intermediate * (1.0 - state.conversion);

        SChillState  next = state;
        next.intermediate = xs - (xs - start) * std::exp(-ak1);

        if (next.intermediate >= PORTION_LEVEL) {
            next.conversion = xi;
            next.portions += next.intermediate * xi;
        }

        return next;
    }

    SHeatState advanceHeat(const SHeatState& state, double temperature, double baseTemperature) {
        return {.total = state.total + std::max(0.0, temperature - baseTemperature)};
    }

    SChillingHoursState advanceChillingHours(const SChillingHoursState& state, double temperature) {
        return {.hours = state.hours + (temperature > CHILLING_LOWER && temperature <= CHILLING_UPPER ? 1.0 : 0.0)};
    }

    // folds `advance` over the series, `total` reads the running sum out of a state
    template <typename State, typename Advance, typename Total>
    static SAccumulationSeries fold(const std::vector<std::optional<double>>& temperatures, eAccumulationOutput output, Advance advance, Total total) {
        SAccumulationSeries series;
        series.values.reserve(temperatures.size());

        State state{};
        for (const auto& t : temperatures) {
            if (!t) {
                series.values.push_back(std::nullopt);
                ++series.missingHours;
                continue;
            }

            const double before = total(state);
            state               = advance(state, *t);
            series.values.push_back(output == OUTPUT_CUMULATIVE ? total(state) : total(state) - before);
        }

        series.total = total(state);
        return series;
    }

    SAccumulationSeries chillPortions(const std::vector<std::optional<double>>& temperatures, eAccumulationOutput output) {
        return fold<SChillState>(
            temperatures, output, [](const SChillState& s, double t) { return advanceChill(s, t); }, [](const SChillState& s) { return s.portions; });
    }

    SAccumulationSeries heatHours(const std::vector<std::optional<double>>& temperatures, double baseTemperature, eAccumulationOutput output) {
        return fold<SHeatState>(
            temperatures, output, [baseTemperature](const SHeatState& s, double t) { return advanceHeat(s, t, baseTemperature); }, [](const SHeatState& s) { return s.total; });
    }

    SAccumulationSeries chillingHours(const std::vector<std::optional<double>>& temperatures, eAccumulationOutput output) {
        return fold<SChillingHoursState>(
            temperatures, output, [](const SChillingHoursState& s, double t) { return advanceChillingHours(s, t); }, [](const SChillingHoursState& s) { return s.hours; });
    }
}
