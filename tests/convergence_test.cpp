#include "convergence.hpp"
#include "integration_errors.hpp"
#include "pv_cell_model.hpp"

#include <cmath>
#include <gtest/gtest.h>

// Order-of-accuracy checks against the closed-form Newton cooling solution
class ConvergenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        system = make_newton_cooling_system();
        params = Parameters{{"k", 1.0}, {"T_ambient", 290.0}};
        exact = [this](double t) { return State{newton_cooling_exact(t, 0.0, 300.0, params)}; };
    }

    ConvergenceReport run(const Stepper &stepper) {
        return convergence_study(system, params, {300.0}, 0.0, 1.0, exact, stepper, 10, 3);
    }

    OdeSystem system;
    Parameters params;
    ExactSolution exact;
};

TEST_F(ConvergenceTest, ForwardEulerIsFirstOrder) {
    ConvergenceReport report = run(ForwardEulerStepper());

    ASSERT_EQ(report.points.size(), 4u);
    ASSERT_EQ(report.error_ratios.size(), 3u);
    for (double ratio : report.error_ratios) {
        EXPECT_GT(ratio, 1.8);
        EXPECT_LT(ratio, 2.2);
    }
    EXPECT_NEAR(report.observed_order, 1.0, 0.1);
}

TEST_F(ConvergenceTest, MidpointIsSecondOrder) {
    ConvergenceReport report = run(MidpointRK2Stepper());

    for (double ratio : report.error_ratios) {
        EXPECT_GT(ratio, 3.5);
        EXPECT_LT(ratio, 4.5);
    }
    EXPECT_NEAR(report.observed_order, 2.0, 0.2);
}

TEST_F(ConvergenceTest, RK4IsFourthOrder) {
    ConvergenceReport report = run(RK4Stepper());

    for (double ratio : report.error_ratios) {
        EXPECT_GT(ratio, 14.0);
        EXPECT_LT(ratio, 18.0);
    }
    EXPECT_NEAR(report.observed_order, 4.0, 0.2);
}

TEST_F(ConvergenceTest, StepCountsDoubleEachLevel) {
    ConvergenceReport report = run(RK4Stepper());

    EXPECT_EQ(report.points[0].n_steps, 10);
    EXPECT_EQ(report.points[3].n_steps, 80);
    EXPECT_DOUBLE_EQ(report.points[1].dt, 0.05);
    for (std::size_t i = 1; i < report.points.size(); ++i) {
        EXPECT_LT(report.points[i].error, report.points[i - 1].error);
    }
}

TEST_F(ConvergenceTest, RejectsInvalidStudies) {
    RK4Stepper rk4;
    EXPECT_THROW(convergence_study(system, params, {300.0}, 0.0, 1.0, exact,
                                   EulerMaruyamaStepper(), 10, 3),
                 ConfigurationError);
    EXPECT_THROW(convergence_study(system, params, {300.0}, 0.0, 1.0, exact, rk4, 0, 3),
                 ConfigurationError);
    EXPECT_THROW(convergence_study(system, params, {300.0}, 0.0, 1.0, exact, rk4, 10, 0),
                 ConfigurationError);
    EXPECT_THROW(convergence_study(system, params, {300.0}, 0.0, 1.0, ExactSolution(), rk4, 10,
                                   3),
                 ConfigurationError);
    EXPECT_THROW(convergence_study(system, params, {300.0, 300.0}, 0.0, 1.0, exact, rk4, 10, 3),
                 ConfigurationError);
}

TEST_F(ConvergenceTest, RejectsRefinementBeyondIntRange) {
    RK4Stepper rk4;
    // 2048 * 2^20 steps does not fit in an int
    EXPECT_THROW(convergence_study(system, params, {300.0}, 0.0, 1.0, exact, rk4, 2048, 20),
                 ConfigurationError);
}
