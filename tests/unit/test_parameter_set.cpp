/**
 * @file test_parameter_set.cpp
 * @brief Unit tests for ParameterSet, ResultLog and the model type keywords
 */

#include <gtest/gtest.h>
#include "HAZCON.hpp"
#include "HazardErrors.hpp"
#include "ParameterSet.hpp"

using namespace HAZCON;

TEST(ParameterSetTest, KeepsInsertionOrder) {
    ParameterSet params({{"material_density", 790.0},
                         {"combustion_heat", 45980.0},
                         {"material_volume", std::nullopt}});

    ASSERT_EQ(params.size(), 3u);
    std::vector<std::string> expected = {"material_density", "combustion_heat", "material_volume"};
    EXPECT_EQ(params.names(), expected);
    EXPECT_EQ(params.entries()[1].first, "combustion_heat");
}

TEST(ParameterSetTest, DuplicateNameIsRejected) {
    ParameterList list = {{"wind_speed", 1.5}, {"wind_speed", 2.0}};

    try {
        ParameterSet params(list);
        FAIL() << "Duplicate parameter names should throw";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "model parameter is not unique: wind_speed");
    }
}

TEST(ParameterSetTest, AbsentValuesAreTracked) {
    ParameterSet params({{"boiling_point", std::nullopt},
                         {"combustion_heat", 41030000.0},
                         {"gasification_heat", std::nullopt}});

    EXPECT_TRUE(params.contains("boiling_point"));
    EXPECT_TRUE(params.isAbsent("boiling_point"));
    EXPECT_FALSE(params.isAbsent("combustion_heat"));
    // Never supplied is not the same as supplied without a value
    EXPECT_FALSE(params.isAbsent("burning_speed"));
    EXPECT_FALSE(params.get("burning_speed").has_value());

    std::vector<std::string> expected = {"boiling_point", "gasification_heat"};
    EXPECT_EQ(params.absentNames(), expected);
}

TEST(ParameterSetTest, SetOverwritesInPlace) {
    ParameterSet params({{"pool_radius", 10.0}, {"env_temp", 25.0}});

    params.set("pool_radius", 24.7);
    params.set("air_density", 1.293);

    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params.entries()[0].first, "pool_radius");
    EXPECT_DOUBLE_EQ(*params.get("pool_radius"), 24.7);
    EXPECT_EQ(params.entries()[2].first, "air_density");

    params.set("env_temp", std::nullopt);
    EXPECT_TRUE(params.isAbsent("env_temp"));
}

TEST(ParameterSetTest, EmptySet) {
    ParameterSet params;
    EXPECT_TRUE(params.empty());
    EXPECT_TRUE(params.absentNames().empty());
}

TEST(ResultLogTest, RecordOverwritesExistingLabel) {
    ResultLog log;
    log.record("tnt_weight", 1.0);
    log.record("explosive_energy", 2.0);
    log.record("tnt_weight", 3.0);

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.entries()[0].first, "tnt_weight");
    EXPECT_DOUBLE_EQ(log.entries()[0].second, 3.0);
    EXPECT_TRUE(log.contains("explosive_energy"));
    EXPECT_FALSE(log.find("flame_height").has_value());
}

TEST(ResultLogTest, LabelValuesPrintCompactly) {
    EXPECT_EQ(formatLabelValue(0.1), "0.1");
    EXPECT_EQ(formatLabelValue(100.0), "100");
    EXPECT_EQ(formatLabelValue(37500.0), "37500");
    EXPECT_EQ(formatLabelValue(0.35), "0.35");
}

TEST(ModelTypeTest, KeywordsParseCaseInsensitively) {
    EXPECT_EQ(parseModelType("VAPOR_CLOUD_EXPLOSION"), ModelType::VAPOR_CLOUD_EXPLOSION);
    EXPECT_EQ(parseModelType("vce"), ModelType::VAPOR_CLOUD_EXPLOSION);
    EXPECT_EQ(parseModelType("pool_fire"), ModelType::POOL_FIRE);
    EXPECT_EQ(parseModelType("Gas_Diffusion"), ModelType::POINT_SOURCE_GAS_DIFFUSION);
    EXPECT_THROW(parseModelType("JET_FIRE"), ValidationError);

    for (ModelType type : allModelTypes()) {
        EXPECT_EQ(parseModelType(modelTypeName(type)), type);
    }
}

TEST(HazardErrorTest, ParameterMessageFormat) {
    EXPECT_EQ(parameterError("wind_speed"), "parameter \"wind_speed\" loss or error.");

    ComputationError err("zero");
    const HazardError& base = err;
    EXPECT_STREQ(base.what(), "zero");
}
