/**
 * @file test_scenarios.cpp
 * @brief End-to-end runs of the shipped scenario files
 *
 * Each test loads a configuration from config/, runs it through the
 * ScenarioRunner and checks the response against hand-computed values.
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "ScenarioRunner.hpp"
#include <petsc.h>

#include <cstdio>
#include <map>
#include <string>

using namespace HAZCON;

namespace {

std::string configPath(const std::string& name) {
    return std::string(HAZCON_CONFIG_DIR) + "/" + name;
}

std::map<std::string, double> outputMap(const ScenarioResponse& response) {
    std::map<std::string, double> result;
    for (const auto& entry : response.outputs) {
        result[entry.first] = entry.second;
    }
    return result;
}

ScenarioResponse runFile(const std::string& name) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(configPath(name))) << name;
    ConfigReader::ValidationResult validation = reader.validate();
    EXPECT_TRUE(validation.valid) << name;
    EXPECT_TRUE(validation.warnings.empty()) << name;
    return ScenarioRunner().run(reader);
}

} // namespace

class ScenarioIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
};

TEST_F(ScenarioIntegrationTest, VaporCloudExplosionFile) {
    ScenarioResponse response = runFile("vapor_cloud_explosion.config");
    ASSERT_TRUE(response.ok()) << response.message;

    auto out = outputMap(response);
    EXPECT_NEAR(out.at("explosive_energy"), 78460272.0, 1e-2);
    EXPECT_NEAR(out.at("tnt_weight"), 16782.945882, 1e-5);
    EXPECT_NEAR(out.at("overpressure at 50 m"), 0.1345733, 1e-6);
    EXPECT_NEAR(out.at("overpressure at 100 m"), 0.0345917, 1e-6);
    EXPECT_DOUBLE_EQ(out.at("overpressure at 200 m"), 0.0);
    EXPECT_NEAR(out.at("radius at 0.1 MPa"), 56.614891, 1e-5);
    EXPECT_NEAR(out.at("radius at 0.05 MPa"), 82.653749, 1e-5);
    EXPECT_NEAR(out.at("radius at 0.02 MPa"), 143.152657, 1e-5);

    // Radii grow as the threshold falls
    EXPECT_LT(out.at("radius at 0.1 MPa"), out.at("radius at 0.05 MPa"));
    EXPECT_LT(out.at("radius at 0.05 MPa"), out.at("radius at 0.02 MPa"));
}

TEST_F(ScenarioIntegrationTest, PoolFireFile) {
    ScenarioResponse response = runFile("pool_fire.config");
    ASSERT_TRUE(response.ok()) << response.message;

    auto out = outputMap(response);
    EXPECT_NEAR(out.at("flame_height"), 60.272865, 1e-5);
    EXPECT_NEAR(out.at("heat_radiation (eta=0.35)"), 761819438.17, 1.0);
    EXPECT_NEAR(out.at("strength at 100 m (eta=0.35)"), 6062.3665, 1e-3);
    EXPECT_NEAR(out.at("radius at 37500 W/m2 (eta=0.35)"), 40.207351, 1e-5);
    EXPECT_NEAR(out.at("radius at 25000 W/m2 (eta=0.35)"), 49.243747, 1e-5);
    EXPECT_NEAR(out.at("radius at 12500 W/m2 (eta=0.35)"), 69.641174, 1e-5);
    EXPECT_EQ(out.count("burning_speed"), 0u);
}

TEST_F(ScenarioIntegrationTest, GasDispersionFile) {
    ScenarioResponse response = runFile("gas_dispersion.config");
    ASSERT_TRUE(response.ok()) << response.message;

    ASSERT_EQ(response.text_outputs.size(), 1u);
    EXPECT_EQ(response.text_outputs[0].first, "atmospheric_stability");
    EXPECT_EQ(response.text_outputs[0].second, "E");

    auto out = outputMap(response);
    EXPECT_NEAR(out.at("concentration(100, 0, 0, 5)"), 91.059104, 1e-5);
    EXPECT_TRUE(out.count("concentration(500, 0, 0, 5)"));
    EXPECT_DOUBLE_EQ(out.at("peak distance(m)"), 100.0);
    EXPECT_NEAR(out.at("peak concentration(mg/m3)"), 91.059104, 1e-5);
    EXPECT_DOUBLE_EQ(out.at("area(30mg/m3) a"), 130.0);
    EXPECT_NEAR(out.at("area(30mg/m3) b"), 28.366883, 1e-5);
    EXPECT_TRUE(response.axis_profile.empty());
    ASSERT_EQ(response.regions.size(), 1u);
    EXPECT_DOUBLE_EQ(*response.regions[0].start, 50.0);
    EXPECT_DOUBLE_EQ(*response.regions[0].end, 310.0);

    EXPECT_NE(response.report.find("start_datetime"), std::string::npos);
    EXPECT_NE(response.report.find("2019-01-01 00:00:00"), std::string::npos);
}

TEST_F(ScenarioIntegrationTest, GeneratedTemplatesRun) {
    const std::string file = "test_scenario_template.config";

    for (ModelType model : allModelTypes()) {
        if (rank == 0) {
            ASSERT_TRUE(ConfigReader::generateTemplate(file, model));
        }
        MPI_Barrier(PETSC_COMM_WORLD);

        ConfigReader reader;
        ASSERT_TRUE(reader.loadFile(file));
        ScenarioResponse response = ScenarioRunner().run(reader);
        EXPECT_TRUE(response.ok()) << modelTypeName(model) << ": " << response.message;
        EXPECT_FALSE(response.outputs.empty()) << modelTypeName(model);

        MPI_Barrier(PETSC_COMM_WORLD);
    }

    if (rank == 0) {
        std::remove(file.c_str());
    }
}
