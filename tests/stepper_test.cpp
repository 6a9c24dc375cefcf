#include "explicit_steps.hpp"
#include "integration_errors.hpp"
#include "pv_cell_model.hpp"
#include "stepper.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <vector>

class StepperTest : public ::testing::Test {
protected:
    void SetUp() override {
        system = make_newton_cooling_system();
        params = Parameters{{"k", 0.5}, {"T_ambient", 290.0}};
    }

    OdeSystem system;
    Parameters params;
};

// Test factory and name round trip
TEST_F(StepperTest, FactoryCreatesAllTypes) {
    std::vector<StepperType> types = {StepperType::FORWARD_EULER, StepperType::RK2_MIDPOINT,
                                      StepperType::RK4, StepperType::EULER_MARUYAMA};
    std::vector<int> orders = {1, 2, 4, 1};

    for (size_t i = 0; i < types.size(); i++) {
        auto stepper = createStepper(types[i]);
        ASSERT_NE(stepper, nullptr);
        EXPECT_EQ(stepper->order(), orders[i]) << "Unexpected order for " << stepper->getType();
        EXPECT_EQ(parseStepperType(stepperTypeToString(types[i])), types[i]);
    }
}

TEST_F(StepperTest, ParseAcceptsAliasesCaseInsensitively) {
    EXPECT_EQ(parseStepperType("Euler"), StepperType::FORWARD_EULER);
    EXPECT_EQ(parseStepperType("forward-euler"), StepperType::FORWARD_EULER);
    EXPECT_EQ(parseStepperType("MIDPOINT"), StepperType::RK2_MIDPOINT);
    EXPECT_EQ(parseStepperType("rk2"), StepperType::RK2_MIDPOINT);
    EXPECT_EQ(parseStepperType("RK4"), StepperType::RK4);
    EXPECT_EQ(parseStepperType("em"), StepperType::EULER_MARUYAMA);
    EXPECT_EQ(parseStepperType("Euler_Maruyama"), StepperType::EULER_MARUYAMA);
}

TEST_F(StepperTest, ParseRejectsUnknownName) {
    EXPECT_THROW(parseStepperType("milstein"), ConfigurationError);
    EXPECT_THROW(parseStepperType(""), ConfigurationError);
}

TEST_F(StepperTest, OnlyEulerMaruyamaIsStochastic) {
    EXPECT_FALSE(ForwardEulerStepper().isStochastic());
    EXPECT_FALSE(MidpointRK2Stepper().isStochastic());
    EXPECT_FALSE(RK4Stepper().isStochastic());
    EXPECT_TRUE(EulerMaruyamaStepper().isStochastic());
}

// Test that the polymorphic wrappers agree with the free step functions
TEST_F(StepperTest, AdvanceMatchesFreeFunctions) {
    State y = {300.0};
    double dt = 0.1;
    DerivativeFunction f = [this](double t, const std::vector<double> &s) {
        return newton_cooling_derivatives(t, s, params);
    };

    EXPECT_EQ(ForwardEulerStepper().advance(0.0, y, dt, system, params, {}),
              euler_step(0.0, dt, y, f));
    EXPECT_EQ(MidpointRK2Stepper().advance(0.0, y, dt, system, params, {}),
              rk2_midpoint_step(0.0, dt, y, f));
    EXPECT_EQ(RK4Stepper().advance(0.0, y, dt, system, params, {}), rk4_step(0.0, dt, y, f));
}

TEST_F(StepperTest, DeterministicSteppersIgnoreIncrement) {
    State y = {300.0};
    RK4Stepper rk4;
    EXPECT_EQ(rk4.advance(0.0, y, 0.1, system, params, {}),
              rk4.advance(0.0, y, 0.1, system, params, {5.0}));
}

TEST_F(StepperTest, EulerMaruyamaRequiresDiffusion) {
    EulerMaruyamaStepper em;
    EXPECT_THROW(em.advance(0.0, {300.0}, 0.1, system, params, {0.1}), ConfigurationError);
}

TEST_F(StepperTest, EulerMaruyamaAddsScaledIncrement) {
    OdeSystem noisy = make_constant_noise_system(2);
    Parameters p{{"sigma", 2.0}};
    EulerMaruyamaStepper em;

    State next = em.advance(0.0, {1.0, -1.0}, 0.01, noisy, p, {0.25, -0.5});

    EXPECT_DOUBLE_EQ(next[0], 1.0 + 2.0 * 0.25);
    EXPECT_DOUBLE_EQ(next[1], -1.0 + 2.0 * (-0.5));
}

TEST_F(StepperTest, SteppersAreInterchangeableThroughBasePointer) {
    std::vector<std::unique_ptr<Stepper>> steppers;
    steppers.push_back(createStepper(StepperType::FORWARD_EULER));
    steppers.push_back(createStepper(StepperType::RK2_MIDPOINT));
    steppers.push_back(createStepper(StepperType::RK4));

    for (const auto &stepper : steppers) {
        State next = stepper->advance(0.0, {300.0}, 0.01, system, params, {});
        ASSERT_EQ(next.size(), 1u);
        EXPECT_LT(next[0], 300.0) << stepper->getType() << " should cool towards ambient";
        EXPECT_GT(next[0], 290.0) << stepper->getType() << " should not overshoot ambient";
    }
}
