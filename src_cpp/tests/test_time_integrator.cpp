// src_cpp/tests/test_time_integrator.cpp
#include <gtest/gtest.h>

#include <stdexcept>

#include "TimeIntegrator_cpp.h"

using namespace KineticCore;

TEST(TimeIntegrator, RequiresCallables) {
    const TimeIntegrator_cpp::PostStepFunction identity = [](const StateVector& U) { return U; };
    EXPECT_THROW({ TimeIntegrator_cpp integrator(TimeScheme_cpp::FORWARD_EULER, nullptr, identity); }, std::invalid_argument);
    const TimeIntegrator_cpp::RHSFunction zero_rhs = [](const StateVector& U, double) { return StateVector(U.size()); };
    EXPECT_THROW({ TimeIntegrator_cpp integrator(TimeScheme_cpp::FORWARD_EULER, zero_rhs, nullptr); }, std::invalid_argument);
}

TEST(TimeIntegrator, ForwardEulerThenPostStep) {
    double seen_time = -1.0;
    TimeIntegrator_cpp integrator(
        TimeScheme_cpp::FORWARD_EULER,
        [&seen_time](const StateVector& U, double t) {
            seen_time = t;
            StateVector rhs(U.size());
            for (size_t i = 0; i < U.size(); ++i) {
                rhs[i] = {-2.0, 1.0};
            }
            return rhs;
        },
        [](const StateVector& U) {
            StateVector out = U;
            for (auto& U_cell : out) {
                if (U_cell[0] < 0.0) {
                    U_cell = {0.0, 0.0};
                }
            }
            return out;
        });

    const StateVector U0 = {{1.0, 0.0}, {0.1, 0.0}};
    const StateVector U1 = integrator.step(U0, 0.25, 3.0);
    ASSERT_EQ(U1.size(), 2u);
    EXPECT_DOUBLE_EQ(seen_time, 3.0);
    EXPECT_DOUBLE_EQ(U1[0][0], 0.5);
    EXPECT_DOUBLE_EQ(U1[0][1], 0.25);
    EXPECT_EQ(U1[1][0], 0.0); // 负水深被步后修正截断
    EXPECT_EQ(U1[1][1], 0.0);
    EXPECT_EQ(integrator.get_scheme(), TimeScheme_cpp::FORWARD_EULER);
}

TEST(TimeIntegrator, RhsSizeMismatchIsAnError) {
    TimeIntegrator_cpp integrator(
        TimeScheme_cpp::FORWARD_EULER,
        [](const StateVector&, double) { return StateVector(1); },
        [](const StateVector& U) { return U; });
    EXPECT_THROW(integrator.step({{1.0, 0.0}, {1.0, 0.0}}, 0.1, 0.0), std::runtime_error);
    EXPECT_TRUE(integrator.step({}, 0.1, 0.0).empty());
}
