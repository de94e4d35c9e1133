/**
 * @file test_point_source_gas_diffusion.cpp
 * @brief Unit tests for the Gaussian plume of a continuous point release
 */

#include <gtest/gtest.h>
#include "HazardErrors.hpp"
#include "PointSourceGasDiffusion.hpp"

#include <cmath>

using namespace HAZCON;

namespace {

// 25 g/s hydrogen, 1.5 m/s wind, class E at night
PointSourceGasDiffusion hydrogenLeak(double source_strength = 25000.0) {
    return PointSourceGasDiffusion("H2", {},
                                   {{"wind_speed", 1.5},
                                    {"center_longitude", 121.0583333},
                                    {"center_latitude", 30.62083333},
                                    {"total_cloudiness", 5.0},
                                    {"low_cloudiness", 4.0},
                                    {"source_strength", source_strength}},
                                   "2019-01-01 00:00:00");
}

} // namespace

TEST(PointSourceGasDiffusionTest, SourceStrengthMustBePositive) {
    EXPECT_DOUBLE_EQ(*hydrogenLeak().sourceStrength(), 25000.0);
    EXPECT_FALSE(hydrogenLeak(0.0).sourceStrength().has_value());
    EXPECT_THROW(hydrogenLeak(0.0).concentrationAt(100.0), ValidationError);
}

TEST(PointSourceGasDiffusionTest, GroundSourceOnAxis) {
    auto plume = hydrogenLeak();
    double c = plume.concentrationAt(100.0);

    // C = Q / (pi u sy sz)
    DiffusionWidths w = plume.diffusionParameters(std::nullopt, 100.0);
    EXPECT_NEAR(c, 25000.0 / (HazardConstants::PI * 1.5 * w.sigma_y * w.sigma_z), 1e-9);
    EXPECT_NEAR(c, 252.627817, 1e-5);
}

TEST(PointSourceGasDiffusionTest, ElevatedSourceAtGroundLevel) {
    auto plume = hydrogenLeak();
    EXPECT_NEAR(plume.concentrationAt(100.0, 0.0, 0.0, 5.0), 91.059104, 1e-5);
    EXPECT_TRUE(plume.getResults().contains("concentration(100, 0, 0, 5)"));
}

TEST(PointSourceGasDiffusionTest, CrosswindOffsetAtGround) {
    auto plume = hydrogenLeak();
    EXPECT_NEAR(plume.concentrationAt(100.0, 10.0, 0.0, 0.0), 62.992697, 1e-5);
}

TEST(PointSourceGasDiffusionTest, GeneralReceptorWithReflection) {
    auto plume = hydrogenLeak();
    EXPECT_NEAR(plume.concentrationAt(100.0, 10.0, 2.0, 5.0), 26.075966, 1e-5);
    EXPECT_NEAR(plume.concentrationAt(100.0, 0.0, 2.0, 5.0), 104.575843, 1e-5);
    EXPECT_NEAR(plume.concentrationAt(100.0, 0.0, 2.0, 0.0), 214.573419, 1e-5);
}

TEST(PointSourceGasDiffusionTest, TracesAreFlooredToZero) {
    auto plume = hydrogenLeak();
    EXPECT_DOUBLE_EQ(plume.concentrationAt(100.0, 100.0, 0.0, 0.0), 0.0);
    EXPECT_NEAR(plume.concentrationAt(5000.0, 500.0, 0.0, 0.0), 0.0288934, 1e-6);
}

TEST(PointSourceGasDiffusionTest, ReceptorPositionResolvesDistance) {
    auto plume = hydrogenLeak();
    double by_point = plume.concentrationAt(GeoPoint(121.07, 30.63), std::nullopt);
    double by_distance = plume.concentrationAt(
        geographicalDistance(GeoPoint(121.0583333, 30.62083333), GeoPoint(121.07, 30.63)));
    EXPECT_NEAR(by_point, by_distance, 1e-12);
    EXPECT_GT(by_point, 0.0);

    EXPECT_THROW(plume.concentrationAt(std::nullopt, std::nullopt), ValidationError);
}

TEST(PointSourceGasDiffusionTest, InvalidReceptorRejected) {
    auto plume = hydrogenLeak();
    EXPECT_THROW(plume.concentrationAt(100.0, -1.0), ValidationError);
    EXPECT_THROW(plume.concentrationAt(100.0, 0.0, -1.0), ValidationError);
    EXPECT_THROW(plume.concentrationAt(100.0, 0.0, 0.0, -1.0), ValidationError);
    // No plume width at the source itself
    EXPECT_THROW(plume.concentrationAt(0.0), ComputationError);
}

TEST(PointSourceGasDiffusionTest, CrosswindHalfWidth) {
    auto plume = hydrogenLeak();
    EXPECT_NEAR(plume.verticalExtentFor(30.0, 360.0, 100.0, 5.0), 22.444118, 1e-5);
    EXPECT_TRUE(plume.getResults().contains("area(30mg/m3) b"));

    // Far above anything the release can produce
    EXPECT_DOUBLE_EQ(plume.verticalExtentFor(1e9, 360.0, 100.0, 5.0), 0.0);

    EXPECT_THROW(plume.verticalExtentFor(0.0, 360.0, 100.0), ComputationError);
    EXPECT_THROW(plume.verticalExtentFor(-1.0, 360.0, 100.0), ValidationError);
    EXPECT_THROW(plume.verticalExtentFor(30.0, 0.0, 100.0), ValidationError);
}

TEST(PointSourceGasDiffusionTest, DistributionOfElevatedRelease) {
    auto plume = hydrogenLeak();
    ConcentrationDistribution dist = plume.distributionFor({30.0, 1e6}, 360.0, 0.0, 5.0, 10.0, true);

    // ceil(1.5 * 360) = 540 m sampled every 10 m
    ASSERT_EQ(dist.axis_profile.size(), 54u);
    EXPECT_DOUBLE_EQ(dist.axis_profile.front().first, 10.0);
    EXPECT_DOUBLE_EQ(dist.axis_profile.back().first, 540.0);

    EXPECT_DOUBLE_EQ(dist.peak_distance, 100.0);
    EXPECT_NEAR(dist.peak_concentration, 91.059104, 1e-5);

    ASSERT_EQ(dist.regions.size(), 2u);
    const ConcentrationRegion& region = dist.regions[0];
    ASSERT_TRUE(region.bounded());
    EXPECT_DOUBLE_EQ(*region.start, 50.0);
    EXPECT_DOUBLE_EQ(*region.end, 310.0);
    EXPECT_DOUBLE_EQ(*region.semi_major, 130.0);
    EXPECT_NEAR(*region.semi_minor, 28.366883, 1e-5);
    // The half-width is solved at x = a, not at the region centre
    EXPECT_DOUBLE_EQ(*region.semi_minor, plume.verticalExtentFor(30.0, 360.0, 130.0, 5.0));
    EXPECT_GT(std::abs(*region.semi_minor - plume.verticalExtentFor(30.0, 360.0, 180.0, 5.0)), 1.0);

    EXPECT_FALSE(dist.regions[1].bounded());
    EXPECT_DOUBLE_EQ(dist.regions[1].target, 1e6);

    ResultLog results = plume.getResults();
    EXPECT_DOUBLE_EQ(*results.find("peak distance(m)"), 100.0);
    EXPECT_DOUBLE_EQ(*results.find("area(30mg/m3) a"), 130.0);
    EXPECT_FALSE(results.contains("area(1000000mg/m3) a"));
}

TEST(PointSourceGasDiffusionTest, DistributionOfGroundRelease) {
    auto plume = hydrogenLeak();
    ConcentrationDistribution dist = plume.distributionFor({30.0}, 360.0);

    EXPECT_TRUE(dist.axis_profile.empty());
    EXPECT_DOUBLE_EQ(dist.peak_distance, 10.0);
    EXPECT_NEAR(dist.peak_concentration, 12932.1034, 1e-3);

    ASSERT_EQ(dist.regions.size(), 1u);
    EXPECT_DOUBLE_EQ(*dist.regions[0].start, 10.0);
    EXPECT_DOUBLE_EQ(*dist.regions[0].end, 340.0);
    EXPECT_DOUBLE_EQ(*dist.regions[0].semi_major, 165.0);
    EXPECT_NEAR(*dist.regions[0].semi_minor, 36.009063, 1e-5);
}

TEST(PointSourceGasDiffusionTest, DistributionArgumentsChecked) {
    auto plume = hydrogenLeak();
    EXPECT_THROW(plume.distributionFor({30.0}, 360.0, 0.0, 5.0, 600.0), ValidationError);
    EXPECT_THROW(plume.distributionFor({30.0}, 360.0, 0.0, 5.0, 0.0), ValidationError);
    EXPECT_THROW(plume.distributionFor({30.0}, 0.0), ValidationError);
    EXPECT_THROW(plume.distributionFor({30.0}, 360.0, 0.0, -5.0), ValidationError);
    EXPECT_THROW(plume.distributionFor({-30.0}, 360.0), ValidationError);
}

TEST(PointSourceGasDiffusionTest, SchemaAddsSourceStrength) {
    ParameterSchema schema = PointSourceGasDiffusion::schema();
    EXPECT_TRUE(schema.material.empty());
    ASSERT_EQ(schema.environment.size(), 7u);
    EXPECT_EQ(schema.environment.back().name, "source_strength");
    ASSERT_NE(schema.find("start_datetime"), nullptr);
    EXPECT_TRUE(schema.find("start_datetime")->textual);
}
