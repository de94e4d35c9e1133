/**
 * @file test_hazard_model.cpp
 * @brief Unit tests for the HazardModel base: state, schema and audit report
 */

#include <gtest/gtest.h>
#include "HazardErrors.hpp"
#include "HazardModel.hpp"
#include "PoolFire.hpp"
#include "VaporCloudExplosion.hpp"

#include <sstream>

using namespace HAZCON;

namespace {

// Minimal concrete model exposing the derivation cache
class SampleModel : public HazardModel {
public:
    using HazardModel::HazardModel;
    using HazardModel::cached;
    using HazardModel::storeDerived;

    ModelType getType() const override { return ModelType::POOL_FIRE; }

protected:
    std::string reportTitle() const override { return "sample model reports"; }
};

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        result.push_back(line);
    }
    return result;
}

} // namespace

TEST(HazardModelTest, DuplicateParametersRejected) {
    EXPECT_THROW(SampleModel("x", {{"a", 1.0}, {"a", 2.0}}, {}), ValidationError);
    EXPECT_THROW(SampleModel("x", {}, {{"b", 1.0}, {"b", std::nullopt}}), ValidationError);
}

TEST(HazardModelTest, AbsentCoversMissingAndNullValues) {
    SampleModel model("water", {{"density", std::nullopt}}, {{"wind_speed", 2.0}});

    EXPECT_TRUE(model.isAbsent("density"));
    EXPECT_TRUE(model.isAbsent("never_given"));
    EXPECT_FALSE(model.isAbsent("wind_speed"));
}

TEST(HazardModelTest, AccessorsReturnCopies) {
    SampleModel model("water", {{"density", 1000.0}}, {});

    ParameterSet copy = model.getMaterialParams();
    copy.set("density", 1.0);
    EXPECT_DOUBLE_EQ(*model.getMaterialParams().get("density"), 1000.0);

    model.setMaterial("brine");
    EXPECT_EQ(model.getMaterial(), "brine");
}

TEST(HazardModelTest, ReplacingParametersClearsCache) {
    SampleModel model("water", {{"density", 1000.0}}, {});
    model.storeDerived("mass", 5.0);
    ASSERT_TRUE(model.cached("mass").has_value());

    model.setEnvironmentParams(ParameterSet({{"wind_speed", std::nullopt}}));
    EXPECT_FALSE(model.cached("mass").has_value());
    EXPECT_TRUE(model.isAbsent("wind_speed"));
}

TEST(HazardModelTest, RecordedResultsKeepOrder) {
    SampleModel model("water", {}, {});
    model.recordResult("first", 1.0);
    model.recordResult("second", 2.0);
    model.recordResult("first", 10.0);
    model.recordTextResult("class", "D");
    model.recordTextResult("class", "E");

    ResultLog results = model.getResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results.entries()[0].first, "first");
    EXPECT_DOUBLE_EQ(results.entries()[0].second, 10.0);

    auto text = model.getTextResults();
    ASSERT_EQ(text.size(), 1u);
    EXPECT_EQ(text[0].second, "E");
}

TEST(HazardModelTest, ReportLayout) {
    SampleModel model("gasoline", {{"density", 790.0}, {"boiling_point", std::nullopt}},
                     {{"wind_speed", 1.5}});
    model.recordResult("flame_height", 60.5);

    std::string info = model.getInfo();
    auto rows = lines(info);
    ASSERT_FALSE(rows.empty());

    // Title is centred and title-cased
    EXPECT_NE(rows[0].find("Sample Model Reports"), std::string::npos);
    EXPECT_EQ(rows[1], std::string(80, '='));

    for (const auto& row : rows) {
        EXPECT_EQ(row.size(), 80u) << "Row: '" << row << "'";
    }

    EXPECT_NE(info.find("gasoline"), std::string::npos);
    EXPECT_NE(info.find("None"), std::string::npos);
    EXPECT_NE(info.find("flame_height"), std::string::npos);
    EXPECT_NE(info.find("60.5"), std::string::npos);
}

TEST(HazardModelTest, ReportHonoursCustomWidth) {
    SampleModel model("gasoline", {{"density", 790.0}}, {});
    for (const auto& row : lines(model.getInfo(60, 20))) {
        EXPECT_EQ(row.size(), 60u);
    }
}

TEST(ParameterSchemaTest, UniteDropsRepeatedNames) {
    std::vector<ParameterSpec> parent = {{"a", "m", ""}, {"b", "kg", ""}};
    std::vector<ParameterSpec> own = {{"b", "g", ""}, {"c", "s", ""}};

    auto united = unite(parent, own);
    ASSERT_EQ(united.size(), 3u);
    EXPECT_EQ(united[0].name, "a");
    EXPECT_EQ(united[1].name, "b");
    EXPECT_EQ(united[1].unit, "kg");
    EXPECT_EQ(united[2].name, "c");
}

TEST(ParameterSchemaTest, ModelSchemasCompose) {
    ParameterSchema vce = VaporCloudExplosion::schema();
    ASSERT_EQ(vce.material.size(), 2u);
    ASSERT_EQ(vce.environment.size(), 3u);
    EXPECT_EQ(vce.environment[2].name, "material_weight");
    ASSERT_NE(vce.find("combustion_heat"), nullptr);
    EXPECT_EQ(vce.find("combustion_heat")->unit, "kJ/kg");

    ParameterSchema fire = PoolFire::schema();
    EXPECT_EQ(fire.material.size(), 5u);
    EXPECT_EQ(fire.environment.size(), 3u);
    EXPECT_EQ(fire.find("wind_speed"), nullptr);
}

TEST(ParameterSchemaTest, MissingParametersIgnoreAbsentValues) {
    ParameterSchema schema = VaporCloudExplosion::schema();
    ParameterSet material({{"material_density", 790.0}});
    ParameterSet environment({{"material_volume", std::nullopt}, {"material_weight", 23700.0}});

    auto missing = missingParameters(schema, material, environment);
    std::vector<std::string> expected = {"combustion_heat", "tnt_explosive_energy"};
    EXPECT_EQ(missing, expected);
}
