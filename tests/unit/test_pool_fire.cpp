/**
 * @file test_pool_fire.cpp
 * @brief Unit tests for the pool fire thermal radiation model
 */

#include <gtest/gtest.h>
#include "HazardErrors.hpp"
#include "PoolFire.hpp"

#include <cmath>

using namespace HAZCON;

namespace {
double relTol(double x, double rel = 1e-9, double abs_min = 1e-12) {
    return std::max(abs_min, std::abs(x) * rel);
}

const double kPi = HazardConstants::PI;

// Gasoline pool with a measured burning rate
PoolFire gasolinePool() {
    return PoolFire("gasoline",
                    {{"boiling_point", std::nullopt},
                     {"combustion_heat", 41030000.0},
                     {"specific_heat_capacity", std::nullopt},
                     {"gasification_heat", std::nullopt},
                     {"burning_speed", 0.0781}},
                    {{"env_temp", 25.0}, {"pool_radius", 24.7}, {"air_density", 1.293}});
}
} // namespace

TEST(PoolFireTest, SuppliedBurningSpeedIsNotRecorded) {
    auto fire = gasolinePool();
    EXPECT_DOUBLE_EQ(fire.burningSpeed(), 0.0781);
    EXPECT_FALSE(fire.getResults().contains("burning_speed"));
}

TEST(PoolFireTest, BurningSpeedFromBoilingPoint) {
    PoolFire fire("hexane",
                  {{"boiling_point", 60.0},
                   {"combustion_heat", 4.6e7},
                   {"specific_heat_capacity", 2000.0},
                   {"gasification_heat", 3.5e5},
                   {"burning_speed", std::nullopt}},
                  {{"env_temp", 20.0}, {"pool_radius", 5.0}, {"air_density", 1.2}});

    const double expected = 1e-3 * 4.6e7 / (2000.0 * 40.0 + 3.5e5);
    EXPECT_NEAR(expected, 0.10698, 1e-5);
    EXPECT_NEAR(fire.burningSpeed(), expected, relTol(expected));
    EXPECT_TRUE(fire.getResults().contains("burning_speed"));
}

TEST(PoolFireTest, BurningSpeedBelowAmbientBoilingPoint) {
    PoolFire fire("propane",
                  {{"boiling_point", -42.0},
                   {"combustion_heat", 4.6e7},
                   {"specific_heat_capacity", 2000.0},
                   {"gasification_heat", 3.5e5}},
                  {{"env_temp", 20.0}, {"pool_radius", 5.0}, {"air_density", 1.2}});

    EXPECT_NEAR(fire.burningSpeed(), 1e-3 * 4.6e7 / 3.5e5, 1e-12);
}

TEST(PoolFireTest, BurningSpeedNeedsMaterialData) {
    PoolFire fire("unknown",
                  {{"boiling_point", 60.0},
                   {"combustion_heat", 4.6e7},
                   {"specific_heat_capacity", std::nullopt},
                   {"gasification_heat", 3.5e5},
                   {"burning_speed", std::nullopt}},
                  {{"env_temp", 20.0}});
    try {
        fire.burningSpeed();
        FAIL() << "Missing heat capacity should throw";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), parameterError("specific_heat_capacity"));
    }
}

TEST(PoolFireTest, FlameHeightThomasCorrelation) {
    auto fire = gasolinePool();

    const double r = 24.7;
    const double expected = 84.0 * r * std::pow(0.0781 / (1.293 * std::sqrt(19.6 * r)), 0.6);
    EXPECT_NEAR(fire.flameHeight(), expected, relTol(expected));
    EXPECT_NEAR(fire.flameHeight(), 60.272865, 1e-5);
}

TEST(PoolFireTest, HeatRadiationAndFlux) {
    auto fire = gasolinePool();
    const double eta = 0.35;

    EXPECT_NEAR(fire.heatRadiation(eta), 761819438.17, 1.0);
    EXPECT_NEAR(fire.heatRadiationStrengthAt(100.0, eta), 6062.3665, 1e-3);

    ResultLog results = fire.getResults();
    EXPECT_TRUE(results.contains("flame_height"));
    EXPECT_TRUE(results.contains("heat_radiation (eta=0.35)"));
    EXPECT_TRUE(results.contains("strength at 100 m (eta=0.35)"));
}

TEST(PoolFireTest, RadiusForInjuryThresholds) {
    auto fire = gasolinePool();
    const double eta = 0.35;

    EXPECT_NEAR(fire.heatRadiationRadiusFor(37500.0, eta), 40.207351, 1e-5);
    EXPECT_NEAR(fire.heatRadiationRadiusFor(25000.0, eta), 49.243747, 1e-5);
    EXPECT_NEAR(fire.heatRadiationRadiusFor(12500.0, eta), 69.641174, 1e-5);
    EXPECT_TRUE(fire.getResults().contains("radius at 37500 W/m2 (eta=0.35)"));

    // Flux at the returned radius equals the target
    double r = fire.heatRadiationRadiusFor(25000.0, eta);
    EXPECT_NEAR(fire.heatRadiationStrengthAt(r, eta), 25000.0, 1e-6);
}

TEST(PoolFireTest, DefaultCoefficientsUsePlainLabels) {
    auto fire = gasolinePool();

    double q = fire.heatRadiation();
    EXPECT_TRUE(fire.getResults().contains("heat_radiation"));

    double strength = fire.heatRadiationStrengthAt(100.0, HazardConstants::DEFAULT_COMBUSTION_EFFICIENCY, 0.8);
    EXPECT_NEAR(strength, 0.8 * q / (4.0 * kPi * 1e4), relTol(strength));
    EXPECT_NEAR(strength, 3325.641, 1e-3);
    EXPECT_TRUE(fire.getResults().contains("strength at 100 m (theta=0.8)"));
}

TEST(PoolFireTest, InvalidArgumentsRejected) {
    auto fire = gasolinePool();
    EXPECT_THROW(fire.heatRadiation(0.0), ValidationError);
    EXPECT_THROW(fire.heatRadiationStrengthAt(0.0), ValidationError);
    EXPECT_THROW(fire.heatRadiationStrengthAt(10.0, 0.24, 0.0), ValidationError);
    EXPECT_THROW(fire.heatRadiationRadiusFor(-1.0), ValidationError);

    PoolFire no_radius("gasoline", {{"combustion_heat", 41030000.0}, {"burning_speed", 0.0781}},
                       {{"air_density", 1.293}});
    EXPECT_THROW(no_radius.flameHeight(), ValidationError);
}

TEST(PoolFireTest, ReportTitle) {
    auto fire = gasolinePool();
    EXPECT_EQ(fire.getType(), ModelType::POOL_FIRE);
    EXPECT_NE(fire.getInfo().find("Pool Fire Model Reports"), std::string::npos);
}
