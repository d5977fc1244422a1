#include "Reconstruction.hpp"
#include "Accumulation.hpp"
#include "SyntheticSeries.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <variant>

using namespace NTempSeries;
using NSynthetic::indexOf;

namespace {
    const std::vector<double> TMIN = {2.0, 4.0, 3.0, 5.0, 1.0, 0.5, 2.5, 4.5, 6.0, 3.5};
    const std::vector<double> TMAX = {12.0, 15.0, 13.5, 16.0, 11.0, 10.0, 13.0, 17.5, 19.0, 14.0};
}

TEST(Reconstruction, FillsHoursAndExtremesEndToEnd) {
    const auto series = NSynthetic::idealSeries(51.0, {2019, 10, 1}, TMIN, TMAX);

    SReconstructionInput input{.latitude = 51.0, .hourly = series.hourly, .daily = series.daily};

    // a day without extremes but with hours, a day without either, and a hole in the hours
    input.daily[3].tmin = {};
    input.daily[3].tmax = {};
    input.daily[6].tmin = {};
    input.daily[6].tmax = {};
    for (int hour = 0; hour < HOURS_PER_DAY; ++hour)
        input.hourly[indexOf(6, hour)].temperature.reset();
    for (int hour = 10; hour <= 17; ++hour)
        input.hourly[indexOf(8, hour)].temperature.reset();

    const auto result = CTemperatureReconstructor({}).reconstruct(input);

    ASSERT_EQ(result.hourly.size(), series.hourly.size());
    ASSERT_EQ(result.daily.size(), series.daily.size());

    EXPECT_NEAR(*result.daily[3].tmin.value, TMIN[3], 1e-8);
    EXPECT_NEAR(*result.daily[3].tmax.value, TMAX[3], 1e-8);
    EXPECT_TRUE(std::holds_alternative<SSolved>(result.daily[3].tmax.provenance));

    // day 6 has no hours of its own: the evening before pins its minimum, which
    // in turn frees the maximum in the next morning's equations
    for (const auto variable : {EXTREME_TMIN, EXTREME_TMAX}) {
        ASSERT_TRUE(result.daily[6].value(variable).known());
        EXPECT_TRUE(std::holds_alternative<SSolved>(result.daily[6].value(variable).provenance));
    }
    EXPECT_NEAR(*result.daily[6].tmin.value, TMIN[6], 1e-8);
    EXPECT_NEAR(*result.daily[6].tmax.value, TMAX[6], 1e-6);

    for (size_t i = 0; i < result.hourly.size(); ++i)
        EXPECT_TRUE(result.hourly[i].temperature.has_value()) << i;

    for (int hour = 10; hour <= 17; ++hour) {
        const size_t i = indexOf(8, hour);
        EXPECT_EQ(result.sources[i], NResidual::HOUR_INTERPOLATED);
        EXPECT_NEAR(*result.hourly[i].temperature, *series.hourly[i].temperature, 1e-8);
    }

    // observed hours pass through bit for bit
    EXPECT_EQ(*result.hourly[indexOf(2, 13)].temperature, *series.hourly[indexOf(2, 13)].temperature);
    EXPECT_EQ(result.sources[indexOf(2, 13)], NResidual::HOUR_OBSERVED);

    EXPECT_EQ(result.report.tmin.total() + result.report.tmax.total(), 4u);
    EXPECT_EQ(result.report.tmin.solved + result.report.tmax.solved, 4u);
    EXPECT_EQ(result.solverDiagnostics.size(), 4u);

    const auto heat = NAccumulation::heatHours(result.temperatures(), 4.0);
    EXPECT_EQ(heat.missingHours, 0u);
    EXPECT_GT(heat.total, 0.0);
}

TEST(Reconstruction, HourlyOnlyInputDerivesTheDayTable) {
    const auto series = NSynthetic::idealSeries(40.0, {2020, 2, 27}, {1.0, 2.0, 3.0, 2.0}, {9.0, 11.0, 12.0, 10.0});

    SReconstructionInput input{.latitude = 40.0, .hourly = series.hourly};
    input.hourly[indexOf(2, 12)].temperature.reset();

    const auto result = CTemperatureReconstructor({}).reconstruct(input);

    ASSERT_EQ(result.daily.size(), 4u);
    EXPECT_EQ(result.daily[2].month, 2);
    EXPECT_EQ(result.daily[2].day, 29);

    for (size_t day = 0; day < 4; ++day) {
        EXPECT_NEAR(*result.daily[day].tmin.value, *series.daily[day].tmin.value, 1e-8);
        EXPECT_NEAR(*result.daily[day].tmax.value, *series.daily[day].tmax.value, 1e-8);
    }
    EXPECT_EQ(result.report.tmin.solved + result.report.tmax.solved, 8u);
    EXPECT_NEAR(*result.hourly[indexOf(2, 12)].temperature, *series.hourly[indexOf(2, 12)].temperature, 1e-8);
}

TEST(Reconstruction, ProxyFillsWhatHoursCannot) {
    const auto series = NSynthetic::idealSeries(51.0, {2019, 10, 1}, TMIN, TMAX);

    SReconstructionInput input{.latitude = 51.0, .hourly = NSynthetic::withoutTemperatures(series.hourly), .daily = series.daily};
    input.daily[5].tmax = {};

    TDailyExtremes proxy = series.daily;
    for (auto& rec : proxy) {
        rec.tmin.set(*rec.tmin.value + 1.0, SObserved{});
        rec.tmax.set(*rec.tmax.value + 1.0, SObserved{});
    }
    input.proxies["airport"] = proxy;

    const auto result = CTemperatureReconstructor({.proxyPriority = {"airport"}}).reconstruct(input);

    EXPECT_DOUBLE_EQ(*result.daily[5].tmax.value, TMAX[5]);
    EXPECT_EQ(provenanceName(result.daily[5].tmax.provenance), "proxy:airport");
    EXPECT_EQ(result.report.tmax.patchedByStation.at("airport"), 1u);

    // no observed hours at all: everything comes from the curve
    for (const auto source : result.sources)
        EXPECT_EQ(source, NResidual::HOUR_IDEALIZED);
}

TEST(Reconstruction, RejectsOutOfDomainInput) {
    const auto series = NSynthetic::idealSeries(51.0, {2019, 10, 1}, {1.0}, {5.0});

    EXPECT_THROW(CTemperatureReconstructor({}).reconstruct({.latitude = 91.0, .hourly = series.hourly}), std::invalid_argument);

    auto broken       = series.hourly;
    broken[3].hour    = 25;
    EXPECT_THROW(CTemperatureReconstructor({}).reconstruct({.latitude = 51.0, .hourly = broken}), std::invalid_argument);

    EXPECT_THROW(CTemperatureReconstructor({.minEquations = 0}).reconstruct({.latitude = 51.0, .hourly = series.hourly}), std::invalid_argument);
}
