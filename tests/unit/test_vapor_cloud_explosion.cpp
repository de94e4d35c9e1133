/**
 * @file test_vapor_cloud_explosion.cpp
 * @brief Unit tests for the TNT-equivalence vapor cloud explosion model
 */

#include <gtest/gtest.h>
#include "HazardErrors.hpp"
#include "VaporCloudExplosion.hpp"

#include <cmath>

using namespace HAZCON;

namespace {
double relTol(double x, double rel = 1e-6, double abs_min = 1e-9) {
    return std::max(abs_min, std::abs(x) * rel);
}

// 23.7 t of gasoline, TNT blast energy 4675 kJ/kg
VaporCloudExplosion gasolineCloud() {
    return VaporCloudExplosion("gasoline",
                               {{"material_density", 790.0}, {"combustion_heat", 45980.0}},
                               {{"tnt_explosive_energy", 4675.0},
                                {"material_volume", std::nullopt},
                                {"material_weight", 23700.0}});
}
} // namespace

TEST(VaporCloudExplosionTest, SuppliedWeightIsUsedDirectly) {
    auto vce = gasolineCloud();
    EXPECT_DOUBLE_EQ(vce.materialWeight(), 23700.0);
    EXPECT_FALSE(vce.getResults().contains("material_weight"));
}

TEST(VaporCloudExplosionTest, WeightFallsBackToVolumeTimesDensity) {
    VaporCloudExplosion vce("gasoline",
                            {{"material_density", 790.0}, {"combustion_heat", 45980.0}},
                            {{"tnt_explosive_energy", std::nullopt},
                             {"material_volume", 30.0},
                             {"material_weight", std::nullopt}});

    EXPECT_DOUBLE_EQ(vce.materialWeight(), 23700.0);
    auto recorded = vce.getResults().find("material_weight");
    ASSERT_TRUE(recorded.has_value());
    EXPECT_DOUBLE_EQ(*recorded, 23700.0);
}

TEST(VaporCloudExplosionTest, FallbackNeedsVolumeAndDensity) {
    VaporCloudExplosion no_volume("gasoline",
                                  {{"material_density", 790.0}, {"combustion_heat", 45980.0}},
                                  {{"material_volume", std::nullopt}, {"material_weight", 0.0}});
    EXPECT_THROW(no_volume.materialWeight(), ValidationError);

    VaporCloudExplosion no_density("gasoline",
                                   {{"material_density", std::nullopt}, {"combustion_heat", 45980.0}},
                                   {{"material_volume", 30.0}, {"material_weight", std::nullopt}});
    try {
        no_density.materialWeight();
        FAIL() << "Missing density should throw";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), parameterError("material_density"));
    }
}

TEST(VaporCloudExplosionTest, ExplosiveEnergyAndTntMass) {
    auto vce = gasolineCloud();

    const double energy = 0.04 * 1.8 * 45980.0 * 23700.0;
    EXPECT_NEAR(vce.explosiveEnergy(), energy, relTol(energy));
    EXPECT_NEAR(energy, 78460272.0, 1e-3);

    EXPECT_NEAR(vce.turnToTnt(), energy / 4675.0, relTol(energy / 4675.0));

    ResultLog results = vce.getResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results.entries()[0].first, "explosive_energy");
    EXPECT_EQ(results.entries()[1].first, "tnt_weight");
}

TEST(VaporCloudExplosionTest, AbsentTntEnergyDefaults) {
    VaporCloudExplosion vce("gasoline",
                            {{"material_density", 790.0}, {"combustion_heat", 45980.0}},
                            {{"tnt_explosive_energy", std::nullopt},
                             {"material_volume", std::nullopt},
                             {"material_weight", 23700.0}});
    EXPECT_NEAR(vce.turnToTnt(), 17435.616, 1e-3);
}

TEST(VaporCloudExplosionTest, OverpressureAtDistances) {
    auto vce = gasolineCloud();

    EXPECT_NEAR(vce.waveOverpressureAt(50.0), 0.1345733, 1e-6);
    EXPECT_NEAR(vce.waveOverpressureAt(100.0), 0.0345917, 1e-6);
    // Scaled distance beyond the table
    EXPECT_DOUBLE_EQ(vce.waveOverpressureAt(200.0), 0.0);

    ResultLog results = vce.getResults();
    EXPECT_TRUE(results.contains("overpressure at 50 m"));
    EXPECT_TRUE(results.contains("overpressure at 200 m"));

    // Scaled distance on the 1000 kg reference curve, shown in the report
    const double scale = 0.1 * std::cbrt(78460272.0 / 4675.0);
    ASSERT_TRUE(results.contains("relative distance at 50 m"));
    EXPECT_NEAR(*results.find("relative distance at 50 m"), 50.0 / scale, 1e-6);
    EXPECT_NEAR(*results.find("relative distance at 50 m"), 19.529027, 1e-5);
    EXPECT_NE(vce.getInfo().find("relative distance at 50 m"), std::string::npos);
}

TEST(VaporCloudExplosionTest, RadiusForOverpressures) {
    auto vce = gasolineCloud();

    EXPECT_NEAR(vce.waveRadiusFor(0.1), 56.614891, 1e-5);
    EXPECT_NEAR(vce.waveRadiusFor(0.05), 82.653749, 1e-5);
    EXPECT_NEAR(vce.waveRadiusFor(0.02), 143.152657, 1e-5);
    EXPECT_TRUE(vce.getResults().contains("radius at 0.1 MPa"));
    EXPECT_NEAR(*vce.getResults().find("relative distance at 0.1 MPa"), 22.1126746, 1e-6);

    // Radius and overpressure invert each other at a table knot
    const double scale = 0.1 * std::cbrt(vce.turnToTnt());
    EXPECT_NEAR(vce.waveOverpressureAt(12.0 * scale), 0.5, 1e-9);
}

TEST(VaporCloudExplosionTest, NonDefaultCoefficientsGetOwnLabels) {
    auto vce = gasolineCloud();
    double defaults = vce.turnToTnt();
    double custom = vce.turnToTnt(0.1, 1.8);

    EXPECT_NEAR(custom / defaults, 2.5, 1e-12);
    ResultLog results = vce.getResults();
    EXPECT_TRUE(results.contains("tnt_weight"));
    EXPECT_TRUE(results.contains("tnt_weight (alpha=0.1, beta=1.8)"));
    EXPECT_TRUE(results.contains("explosive_energy (alpha=0.1, beta=1.8)"));
}

TEST(VaporCloudExplosionTest, RepeatedCallsAreMemoized) {
    auto vce = gasolineCloud();
    double first = vce.waveRadiusFor(0.1);
    size_t recorded = vce.getResults().size();

    EXPECT_DOUBLE_EQ(vce.waveRadiusFor(0.1), first);
    EXPECT_EQ(vce.getResults().size(), recorded);
}

TEST(VaporCloudExplosionTest, InvalidArgumentsRejected) {
    auto vce = gasolineCloud();
    EXPECT_THROW(vce.waveOverpressureAt(0.0), ValidationError);
    EXPECT_THROW(vce.waveOverpressureAt(-5.0), ValidationError);
    EXPECT_THROW(vce.waveRadiusFor(0.0), ValidationError);
    EXPECT_THROW(vce.turnToTnt(0.0, 1.8), ValidationError);

    VaporCloudExplosion no_heat("gasoline", {{"material_density", 790.0}},
                                {{"material_weight", 23700.0}});
    EXPECT_THROW(no_heat.explosiveEnergy(), ValidationError);
}

TEST(VaporCloudExplosionTest, ReportTitle) {
    auto vce = gasolineCloud();
    vce.turnToTnt();
    std::string info = vce.getInfo();
    EXPECT_NE(info.find("Vapor Cloud Explosion Model Reports"), std::string::npos);
    EXPECT_NE(info.find("tnt_weight"), std::string::npos);
    EXPECT_EQ(vce.getType(), ModelType::VAPOR_CLOUD_EXPLOSION);
}
