#pragma once

#include <cstdint>
#include <optional>
#include <vector>

// Sequential accumulation models over an hourly temperature series (degrees C).
// Each model is a state struct folded over the hours in calendar order; a
// missing hour yields a missing output and leaves the state untouched.
namespace NAccumulation {

    enum eAccumulationOutput : std::uint8_t {
        OUTPUT_CUMULATIVE = 0,
        OUTPUT_PER_HOUR,
    };

    struct SAccumulationOptions {
        double              heatBaseTemperature = 4.0;
        eAccumulationOutput output              = OUTPUT_CUMULATIVE;
    };

    // Dynamic Model (Fishman, Erez & Couvillon 1987)
    struct SChillState {
        double intermediate = 0.0; // thermally labile precursor
        double conversion   = 0.0; // share of the precursor fixed when it last reached 1
        double portions     = 0.0; // accumulated chill portions
    };

    struct SHeatState {
        double total = 0.0; // degree hours above the base temperature
    };

    struct SChillingHoursState {
        double hours = 0.0;
    };

    struct SAccumulationSeries {
        std::vector<std::optional<double>> values;
        double                             total        = 0.0;
        size_t                             missingHours = 0;
    };

    SChillState         advanceChill(const SChillState& state, double temperature);
    SHeatState          advanceHeat(const SHeatState& state, double temperature, double baseTemperature);
    SChillingHoursState advanceChillingHours(const SChillingHoursState& state, double temperature);

    SAccumulationSeries chillPortions(const std::vector<std::optional<double>>& temperatures, eAccumulationOutput output = OUTPUT_CUMULATIVE);
    SAccumulationSeries heatHours(const std::vector<std::optional<double>>& temperatures, double baseTemperature, eAccumulationOutput output = OUTPUT_CUMULATIVE);
    SAccumulationSeries chillingHours(const std::vector<std::optional<double>>& temperatures, eAccumulationOutput output = OUTPUT_CUMULATIVE);
}
