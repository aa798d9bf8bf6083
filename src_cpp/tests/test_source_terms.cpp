// src_cpp/tests/test_source_terms.cpp
#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "SourceTerms_cpp.h"

using namespace KineticCore;

TEST(RechargeSource, RainfallMinusInfiltration) {
    const SourceTermCalculator_cpp calculator(9.81);
    const std::vector<double> S = calculator.compute_recharge_source({1e-3, 2e-3, 0.0}, {0.0, 5e-4, 1e-3});
    ASSERT_EQ(S.size(), 3u);
    EXPECT_DOUBLE_EQ(S[0], 1e-3);
    EXPECT_DOUBLE_EQ(S[1], 1.5e-3);
    EXPECT_DOUBLE_EQ(S[2], -1e-3);
    EXPECT_THROW(calculator.compute_recharge_source({1.0, 2.0}, {0.0}), std::invalid_argument);
}

TEST(BedSlopeGradient, LinearBedIsExactEverywhere) {
    const SourceTermCalculator_cpp calculator(9.81);
    const double dx = 0.25;
    std::vector<double> z(8);
    for (size_t i = 0; i < z.size(); ++i) {
        z[i] = 0.5 * (i + 0.5) * dx;
    }
    const std::vector<double> dZdx = calculator.compute_bed_slope_gradient(z, dx);
    ASSERT_EQ(dZdx.size(), z.size());
    for (double slope : dZdx) {
        EXPECT_NEAR(slope, 0.5, 1e-12);
    }
}

TEST(BedSlopeGradient, CentralInsideOneSidedAtEnds) {
    const SourceTermCalculator_cpp calculator(9.81);
    const std::vector<double> z = {0.0, 1.0, 4.0, 9.0};
    const std::vector<double> dZdx = calculator.compute_bed_slope_gradient(z, 1.0);
    EXPECT_DOUBLE_EQ(dZdx[0], 1.0); // (1 - 0) / 1
    EXPECT_DOUBLE_EQ(dZdx[1], 2.0); // (4 - 0) / 2
    EXPECT_DOUBLE_EQ(dZdx[2], 4.0); // (9 - 1) / 2
    EXPECT_DOUBLE_EQ(dZdx[3], 5.0); // (9 - 4) / 1
}

TEST(BedSlopeGradient, DegenerateGrids) {
    const SourceTermCalculator_cpp calculator(9.81);
    const std::vector<double> single = calculator.compute_bed_slope_gradient({3.0}, 0.1);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], 0.0);

    const std::vector<double> pair = calculator.compute_bed_slope_gradient({1.0, 2.0}, 0.5);
    ASSERT_EQ(pair.size(), 2u);
    EXPECT_DOUBLE_EQ(pair[0], 2.0);
    EXPECT_DOUBLE_EQ(pair[1], 2.0);
}

TEST(SourceTermsAllCells, MassAndMomentumContributions) {
    const double g = 9.81;
    const SourceTermCalculator_cpp calculator(g);
    const StateVector U = {{1.0, 0.5}, {2.0, -1.0}};
    const std::vector<double> velocity = {0.5, -0.5};
    const std::vector<double> recharge = {1e-3, -2e-3};
    const std::vector<double> slope = {0.0, 0.1};
    const StateVector S = calculator.calculate_source_terms_all_cells(U, velocity, recharge, slope);
    ASSERT_EQ(S.size(), 2u);
    EXPECT_DOUBLE_EQ(S[0][0], 1e-3);
    EXPECT_DOUBLE_EQ(S[0][1], 1e-3 * 0.5);
    EXPECT_DOUBLE_EQ(S[1][0], -2e-3);
    EXPECT_DOUBLE_EQ(S[1][1], -2e-3 * -0.5 - g * 2.0 * 0.1);

    EXPECT_THROW(calculator.calculate_source_terms_all_cells(U, {0.5}, recharge, slope), std::invalid_argument);
}

TEST(RainfallTimeseries, LinearInterpolationClampedAtEnds) {
    const std::vector<TimeseriesPoint_cpp> series = {{0.0, 0.0}, {10.0, 2e-3}, {20.0, 1e-3}};
    EXPECT_DOUBLE_EQ(interpolate_timeseries(series, -5.0), 0.0);
    EXPECT_DOUBLE_EQ(interpolate_timeseries(series, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(interpolate_timeseries(series, 5.0), 1e-3);
    EXPECT_DOUBLE_EQ(interpolate_timeseries(series, 10.0), 2e-3);
    EXPECT_DOUBLE_EQ(interpolate_timeseries(series, 15.0), 1.5e-3);
    EXPECT_DOUBLE_EQ(interpolate_timeseries(series, 100.0), 1e-3);
}

TEST(RainfallTimeseries, EmptySeriesIsNaN) {
    EXPECT_TRUE(std::isnan(interpolate_timeseries({}, 1.0)));
}
