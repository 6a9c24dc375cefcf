#include "integrate.hpp"
#include "pv_cell_model.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <vector>

// Test fixture for the PV cell thermal models
class PvCellModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        params = default_pv_cell_parameters();
        opts.t0 = 0.0;
        opts.t_end = 600.0;
        opts.n_steps = 6000;
    }

    Parameters params;
    IntegrateOpts opts;
    RK4Stepper rk4;
};

// ============================================================================
// RIGHT-HAND SIDE
// ============================================================================

TEST_F(PvCellModelTest, HeatingRateMatchesEnergyBalance) {
    const double T = 300.0;
    const double Ta = 290.0;
    double expected = 2.0 - 0.05 * (T - Ta) - 5e-11 * (std::pow(T, 4) - std::pow(Ta, 4)) -
                      20.0 / T;

    EXPECT_NEAR(cell_heating_rate(0.0, T, params), expected, 1e-12);
    EXPECT_NEAR(single_cell_derivatives(0.0, {T}, params)[0], expected, 1e-12);
}

TEST_F(PvCellModelTest, HeatsBelowAndCoolsAboveSteadyState) {
    EXPECT_GT(cell_heating_rate(0.0, 300.0, params), 0.0) << "Cell below steady state should warm";
    EXPECT_LT(cell_heating_rate(0.0, 400.0, params), 0.0) << "Cell above steady state should cool";
}

TEST_F(PvCellModelTest, ZeroTemperatureIsSingular) {
    try {
        cell_heating_rate(3.0, 0.0, params);
        FAIL() << "Expected NumericalSingularityError";
    } catch (const NumericalSingularityError &e) {
        EXPECT_FALSE(e.hasStepIndex());
        EXPECT_EQ(e.time(), 3.0);
        ASSERT_EQ(e.state().size(), 1u);
        EXPECT_EQ(e.state()[0], 0.0);
    }
}

TEST_F(PvCellModelTest, CoupledSingularityReportsFullState) {
    try {
        coupled_cells_derivatives(1.0, {300.0, 0.0}, params);
        FAIL() << "Expected NumericalSingularityError";
    } catch (const NumericalSingularityError &e) {
        EXPECT_EQ(e.state(), (State{300.0, 0.0}));
    }
}

TEST_F(PvCellModelTest, RejectsWrongStateDimension) {
    EXPECT_THROW(single_cell_derivatives(0.0, {300.0, 310.0}, params), ConfigurationError);
    EXPECT_THROW(coupled_cells_derivatives(0.0, {300.0}, params), ConfigurationError);
}

TEST_F(PvCellModelTest, WrongDimensionInitialStateIsConfigurationError) {
    opts.n_steps = 10;
    EXPECT_THROW(integrate(make_single_cell_system(), params, {300.0, 310.0}, opts, rk4),
                 ConfigurationError);
    EXPECT_THROW(integrate(make_coupled_cells_system(), params, {300.0}, opts, rk4),
                 ConfigurationError);
}

TEST_F(PvCellModelTest, MissingCoefficientIsConfigurationError) {
    Parameters partial{{"T_ambient", 290.0}, {"c1", 2.0}};
    EXPECT_THROW(cell_heating_rate(0.0, 300.0, partial), ConfigurationError);
}

TEST_F(PvCellModelTest, DiffusionIsConstantAmplitude) {
    EXPECT_EQ(single_cell_diffusion(0.0, {300.0}, params), (State{0.5}));
    EXPECT_EQ(coupled_cells_diffusion(0.0, {300.0, 310.0}, params), (State{0.5, 0.5}));
}

TEST_F(PvCellModelTest, NewtonCoolingExactSolution) {
    Parameters p{{"k", 0.5}, {"T_ambient", 290.0}};
    EXPECT_DOUBLE_EQ(newton_cooling_exact(2.0, 2.0, 310.0, p), 310.0);
    EXPECT_NEAR(newton_cooling_exact(4.0, 2.0, 310.0, p), 290.0 + 20.0 * std::exp(-1.0), 1e-12);
}

// ============================================================================
// SYSTEM DESCRIPTORS
// ============================================================================

TEST_F(PvCellModelTest, SystemsDeclareTheirParameters) {
    OdeSystem single = make_single_cell_system();
    OdeSystem coupled = make_coupled_cells_system();
    OdeSystem cooling = make_newton_cooling_system();

    EXPECT_TRUE(single.hasDiffusion());
    EXPECT_TRUE(coupled.hasDiffusion());
    EXPECT_FALSE(cooling.hasDiffusion());

    EXPECT_NO_THROW(params.require(single.required_parameters));
    EXPECT_NO_THROW(params.require(coupled.required_parameters));
    EXPECT_THROW(params.require(cooling.required_parameters), ConfigurationError);

    EXPECT_EQ(single.state_names, (std::vector<std::string>{"T"}));
    EXPECT_EQ(coupled.state_names, (std::vector<std::string>{"T1", "T2"}));
}

// ============================================================================
// DYNAMICS
// ============================================================================

TEST_F(PvCellModelTest, SingleCellReachesSteadyState) {
    Trajectory traj = integrate(make_single_cell_system(), params, {300.0}, opts, rk4);

    const double T_ss = traj.finalState()[0];
    EXPECT_GT(T_ss, 320.0);
    EXPECT_LT(T_ss, 330.0);
    EXPECT_LT(std::abs(cell_heating_rate(0.0, T_ss, params)), 1e-6)
        << "Net heating should vanish at steady state";
}

TEST_F(PvCellModelTest, SingleCellApproachesSteadyStateMonotonically) {
    opts.t_end = 100.0;
    opts.n_steps = 1000;
    Trajectory traj = integrate(make_single_cell_system(), params, {300.0}, opts, rk4);

    for (std::size_t j = 1; j < traj.size(); ++j) {
        EXPECT_GE(traj.states[j][0], traj.states[j - 1][0]);
    }
}

TEST_F(PvCellModelTest, IdenticalCoupledCellsStayIdentical) {
    opts.t_end = 120.0;
    opts.n_steps = 1200;
    Trajectory traj = integrate(make_coupled_cells_system(), params, {305.0, 305.0}, opts, rk4);

    for (const auto &s : traj.states) {
        EXPECT_EQ(s[0], s[1]);
    }
}

TEST_F(PvCellModelTest, StrongerCouplingEqualizesFaster) {
    opts.t_end = 10.0;
    opts.n_steps = 100;

    Parameters weak = params;
    weak.set("c6", 0.01);
    Parameters strong = params;
    strong.set("c6", 1.0);

    OdeSystem cells = make_coupled_cells_system();
    State y_weak = integrate(cells, weak, {300.0, 320.0}, opts, rk4).finalState();
    State y_strong = integrate(cells, strong, {300.0, 320.0}, opts, rk4).finalState();

    EXPECT_LT(std::abs(y_strong[1] - y_strong[0]), std::abs(y_weak[1] - y_weak[0]));
    EXPECT_LT(std::abs(y_strong[1] - y_strong[0]), 1e-3);
}

TEST_F(PvCellModelTest, SingularInitialStateFailsAtFirstStep) {
    try {
        integrate(make_single_cell_system(), params, {0.0}, opts, rk4);
        FAIL() << "Expected NumericalSingularityError";
    } catch (const NumericalSingularityError &e) {
        EXPECT_EQ(e.stepIndex(), 0u);
        EXPECT_EQ(e.partialTrajectory().size(), 1u);
    }
}
