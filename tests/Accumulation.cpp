#include "Accumulation.hpp"
#include <gtest/gtest.h>

using namespace NAccumulation;

namespace {
    std::vector<std::optional<double>> constant(double temperature, size_t hours) {
        return std::vector<std::optional<double>>(hours, temperature);
    }
}

TEST(Accumulation, ChillPortionsFavourCoolTemperatures) {
    const auto cool = chillPortions(constant(5.0, 1000));
    const auto warm = chillPortions(constant(15.0, 1000));
    const auto cold = chillPortions(constant(-5.0, 1000));

    EXPECT_GT(cool.total, 25.0);
    EXPECT_LT(cool.total, 40.0);
    EXPECT_DOUBLE_EQ(warm.total, 0.0);
    EXPECT_LT(cold.total, 0.01);
    EXPECT_GT(cool.total, warm.total);
}

TEST(Accumulation, ChillStateAdvancesMonotonically) {
    SChillState state;
    double      previous = 0.0;
    for (int hour = 0; hour < 200; ++hour) {
        state = advanceChill(state, 6.0);
        EXPECT_GE(state.portions, previous);
        previous = state.portions;
    }
    EXPECT_GT(state.portions, 0.0);
}

TEST(Accumulation, MissingHoursPassThrough) {
    std::vector<std::optional<double>> temps = constant(4.0, 48);
    std::vector<std::optional<double>> holey = temps;
    holey.insert(holey.begin() + 20, std::nullopt);
    holey.insert(holey.begin() + 21, std::nullopt);

    const auto full = chillPortions(temps);
    const auto gaps = chillPortions(holey);

    ASSERT_EQ(gaps.values.size(), holey.size());
    EXPECT_FALSE(gaps.values[20].has_value());
    EXPECT_FALSE(gaps.values[21].has_value());
    EXPECT_EQ(gaps.missingHours, 2u);
    EXPECT_EQ(full.missingHours, 0u);

    // the state skips missing hours untouched
    EXPECT_DOUBLE_EQ(gaps.total, full.total);
    EXPECT_DOUBLE_EQ(*gaps.values[22], *full.values[20]);
}

TEST(Accumulation, PerHourOutputSumsToCumulative) {
    std::vector<std::optional<double>> temps;
    for (int hour = 0; hour < 24 * 30; ++hour)
        temps.push_back(hour % 24 < 12 ? 2.0 : 9.0);

    const auto cumulative = chillPortions(temps, OUTPUT_CUMULATIVE);
    const auto perHour    = chillPortions(temps, OUTPUT_PER_HOUR);

    double     sum = 0.0;
    for (size_t i = 0; i < temps.size(); ++i) {
        sum += *perHour.values[i];
        EXPECT_NEAR(sum, *cumulative.values[i], 1e-9);
    }
    EXPECT_DOUBLE_EQ(perHour.total, cumulative.total);
}

TEST(Accumulation, HeatHoursAboveBase) {
    const std::vector<std::optional<double>> temps = {2.0, 4.0, 10.0, std::nullopt, 6.5};

    const auto                               cumulative = heatHours(temps, 4.0);
    EXPECT_DOUBLE_EQ(cumulative.total, 8.5);
    EXPECT_DOUBLE_EQ(*cumulative.values[2], 6.0);
    EXPECT_FALSE(cumulative.values[3].has_value());

    const auto perHour = heatHours(temps, 4.0, OUTPUT_PER_HOUR);
    EXPECT_DOUBLE_EQ(*perHour.values[0], 0.0);
    EXPECT_DOUBLE_EQ(*perHour.values[4], 2.5);

    EXPECT_DOUBLE_EQ(heatHours(temps, 0.0).total, 22.5);
}

TEST(Accumulation, ChillingHoursCountTheOpenClosedBand) {
    const std::vector<std::optional<double>> temps = {-1.0, 0.0, 0.1, 7.2, 7.3, std::nullopt, 3.0};

    const auto                               hours = chillingHours(temps);
    EXPECT_DOUBLE_EQ(hours.total, 3.0);
    EXPECT_EQ(hours.missingHours, 1u);

    const auto perHour = chillingHours(temps, OUTPUT_PER_HOUR);
    EXPECT_DOUBLE_EQ(*perHour.values[1], 0.0);
    EXPECT_DOUBLE_EQ(*perHour.values[3], 1.0);
    EXPECT_DOUBLE_EQ(*perHour.values[4], 0.0);
}
