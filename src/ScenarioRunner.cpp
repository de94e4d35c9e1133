#include "ScenarioRunner.hpp"
#include "HazardErrors.hpp"
#include "PointSourceGasDiffusion.hpp"
#include "PoolFire.hpp"
#include "VaporCloudExplosion.hpp"

namespace HAZCON {

namespace {

void runExplosion(VaporCloudExplosion& model, const ConfigReader::CalculationConfig& calc) {
    model.turnToTnt(calc.alpha, calc.beta);
    for (double d : calc.distances) {
        model.waveOverpressureAt(d, calc.alpha, calc.beta);
    }
    for (double p : calc.overpressures) {
        model.waveRadiusFor(p, calc.alpha, calc.beta);
    }
}

void runPoolFire(PoolFire& model, const ConfigReader::CalculationConfig& calc) {
    model.heatRadiation(calc.eta);
    for (double d : calc.distances) {
        model.heatRadiationStrengthAt(d, calc.eta, calc.theta);
    }
    for (double q : calc.strengths) {
        model.heatRadiationRadiusFor(q, calc.eta, calc.theta);
    }
}

void runGasDiffusion(PointSourceGasDiffusion& model, const ConfigReader::CalculationConfig& calc,
                     ScenarioResponse& response) {
    model.atmosphericStability();
    for (double x : calc.downwind_distances) {
        model.diffusionParameters(std::nullopt, x, calc.sampling_minutes);
        model.concentrationAt(std::nullopt, x, calc.crosswind_offset,
                              calc.ground_height, calc.source_height);
    }
    if (calc.elapsed_time > 0.0 && !calc.concentrations.empty()) {
        ConcentrationDistribution distribution =
            model.distributionFor(calc.concentrations, calc.elapsed_time, calc.ground_height,
                                  calc.source_height, calc.step, calc.axis_profile);
        response.regions = std::move(distribution.regions);
        response.axis_profile = std::move(distribution.axis_profile);
    }
}

} // anonymous namespace

ParameterSchema ScenarioRunner::schemaFor(ModelType model) {
    switch (model) {
        case ModelType::VAPOR_CLOUD_EXPLOSION:      return VaporCloudExplosion::schema();
        case ModelType::POOL_FIRE:                  return PoolFire::schema();
        case ModelType::POINT_SOURCE_GAS_DIFFUSION: return PointSourceGasDiffusion::schema();
    }
    throw ValidationError("Unknown model type");
}

std::unique_ptr<HazardModel> ScenarioRunner::createModel(const ConfigReader::ScenarioConfig& scenario) {
    switch (scenario.model) {
        case ModelType::VAPOR_CLOUD_EXPLOSION:
            return std::make_unique<VaporCloudExplosion>(
                scenario.material, scenario.material_params, scenario.environment_params);
        case ModelType::POOL_FIRE:
            return std::make_unique<PoolFire>(
                scenario.material, scenario.material_params, scenario.environment_params);
        case ModelType::POINT_SOURCE_GAS_DIFFUSION:
            return std::make_unique<PointSourceGasDiffusion>(
                scenario.material, scenario.material_params, scenario.environment_params,
                scenario.start_datetime);
    }
    throw ValidationError("Unknown model type");
}

ScenarioResponse ScenarioRunner::failure(const std::string& message) {
    ScenarioResponse response;
    response.code = 1;
    response.message = message;
    return response;
}

ScenarioResponse ScenarioRunner::run(const ConfigReader& config) const {
    ConfigReader::ScenarioConfig scenario;
    if (!config.parseScenarioConfig(scenario)) {
        return failure("Invalid scenario configuration");
    }
    ConfigReader::CalculationConfig calculation;
    if (!config.parseCalculationConfig(calculation)) {
        return failure("Invalid calculation configuration");
    }
    return run(scenario, calculation);
}

ScenarioResponse ScenarioRunner::run(const ConfigReader::ScenarioConfig& scenario,
                                     const ConfigReader::CalculationConfig& calculation) const {
    ScenarioResponse response;
    try {
        std::unique_ptr<HazardModel> model = createModel(scenario);

        switch (scenario.model) {
            case ModelType::VAPOR_CLOUD_EXPLOSION:
                runExplosion(static_cast<VaporCloudExplosion&>(*model), calculation);
                break;
            case ModelType::POOL_FIRE:
                runPoolFire(static_cast<PoolFire&>(*model), calculation);
                break;
            case ModelType::POINT_SOURCE_GAS_DIFFUSION:
                runGasDiffusion(static_cast<PointSourceGasDiffusion&>(*model), calculation, response);
                break;
        }

        response.outputs = model->getResults().entries();
        response.text_outputs = model->getTextResults();
        response.report = model->getInfo();
    } catch (const HazardError& e) {
        return failure(e.what());
    }
    return response;
}

} // namespace HAZCON
