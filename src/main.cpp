#include "HAZCON.hpp"
#include "ConfigReader.hpp"
#include "ScenarioRunner.hpp"
#include "UnitSystem.hpp"
#include <petsc.h>
#include <iostream>
#include <sstream>
#include <string>

static char help[] = "HAZCON - Industrial Hazard Consequence Models\n"
                    "Usage: hazcon [options]\n\n"
                    "Options:\n"
                    "  -c <file>                  Scenario file (.config)\n"
                    "  -generate_config <file>    Write a scenario template\n"
                    "  -model <type>              Model of the template or schema:\n"
                    "                             VAPOR_CLOUD_EXPLOSION, POOL_FIRE,\n"
                    "                             POINT_SOURCE_GAS_DIFFUSION\n"
                    "  -schema <type>             Print the parameters a model needs\n"
                    "  -units                     Print the unit database\n\n"
                    "Examples:\n"
                    "  hazcon -c config/vapor_cloud_explosion.config\n"
                    "  hazcon -generate_config pool_fire.config -model POOL_FIRE\n"
                    "  hazcon -schema POINT_SOURCE_GAS_DIFFUSION\n\n";

static void printSchema(MPI_Comm comm, HAZCON::ModelType model) {
    HAZCON::ParameterSchema schema = HAZCON::ScenarioRunner::schemaFor(model);

    auto print = [comm](const char* title, const std::vector<HAZCON::ParameterSpec>& specs) {
        PetscPrintf(comm, "%s\n", title);
        for (const auto& spec : specs) {
            PetscPrintf(comm, "  %-26s %-22s %s\n", spec.name.c_str(), spec.unit.c_str(),
                        spec.description.c_str());
        }
    };

    PetscPrintf(comm, "%s\n", HAZCON::modelTypeName(model).c_str());
    PetscPrintf(comm, "------------------------------------------------------------\n");
    print("[MATERIAL]", schema.material);
    print("[ENVIRONMENT]", schema.environment);
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int status = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char model_name[256] = "VAPOR_CLOUD_EXPLOSION";
        ierr = PetscOptionsGetString(nullptr, nullptr, "-model", model_name,
                                     sizeof(model_name), nullptr); CHKERRQ(ierr);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        char schema_name[256] = "";
        char config_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config = PETSC_FALSE;
        PetscBool schema_requested = PETSC_FALSE;
        PetscBool config_provided = PETSC_FALSE;
        PetscBool units_requested = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-schema", schema_name,
                                     sizeof(schema_name), &schema_requested); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-units", &units_requested); CHKERRQ(ierr);

        try {
            if (gen_config) {
                if (rank == 0) {
                    HAZCON::ModelType model = HAZCON::parseModelType(model_name);
                    if (HAZCON::ConfigReader::generateTemplate(generate_config, model)) {
                        PetscPrintf(comm, "Scenario template written to: %s\n", generate_config);
                        PetscPrintf(comm, "Edit this file to describe your scenario.\n");
                    } else {
                        status = 1;
                    }
                }
            } else if (schema_requested) {
                if (rank == 0) {
                    printSchema(comm, HAZCON::parseModelType(schema_name));
                }
            } else if (units_requested) {
                if (rank == 0) {
                    std::ostringstream os;
                    HAZCON::UnitSystemManager::getInstance().printDatabase(os);
                    PetscPrintf(comm, "%s", os.str().c_str());
                }
            } else if (!config_provided) {
                if (rank == 0) {
                    PetscPrintf(comm, "Error: Scenario file (-c) required\n");
                    PetscPrintf(comm, "Run with -help for usage information\n");
                    PetscPrintf(comm, "Generate template: hazcon -generate_config template.config\n");
                }
                status = 1;
            } else if (rank == 0) {
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "============================================================\n");
                PetscPrintf(comm, "  HAZCON - Industrial Hazard Consequence Models\n");
                PetscPrintf(comm, "  Version %s\n", HAZCON::HAZCON_VERSION);
                PetscPrintf(comm, "============================================================\n");
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Scenario file: %s\n\n", config_file);

                HAZCON::ConfigReader config;
                if (!config.loadFile(config_file)) {
                    status = 1;
                } else {
                    HAZCON::ConfigReader::ValidationResult check = config.validate();
                    for (const auto& warning : check.warnings) {
                        PetscPrintf(comm, "Warning: %s\n", warning.c_str());
                    }
                    for (const auto& error : check.errors) {
                        PetscPrintf(comm, "Error: %s\n", error.c_str());
                    }

                    HAZCON::ScenarioRunner runner;
                    HAZCON::ScenarioResponse response = check.valid
                        ? runner.run(config)
                        : HAZCON::ScenarioRunner::failure("Invalid scenario configuration");

                    PetscPrintf(comm, "Code:    %d\n", response.code);
                    PetscPrintf(comm, "Message: %s\n", response.message.c_str());

                    if (response.ok()) {
                        PetscPrintf(comm, "------------------------------------------------------------\n");
                        for (const auto& output : response.outputs) {
                            PetscPrintf(comm, "  %-44s %.6g\n", output.first.c_str(), output.second);
                        }
                        for (const auto& output : response.text_outputs) {
                            PetscPrintf(comm, "  %-44s %s\n", output.first.c_str(), output.second.c_str());
                        }
                        if (!response.regions.empty()) {
                            PetscPrintf(comm, "\nRegions above target concentration (m)\n");
                            for (const auto& region : response.regions) {
                                if (region.bounded()) {
                                    PetscPrintf(comm, "  %-12.6g start %-10.2f end %-10.2f a %-10.2f b %.2f\n",
                                                region.target, *region.start, *region.end,
                                                *region.semi_major, *region.semi_minor);
                                } else {
                                    PetscPrintf(comm, "  %-12.6g None (not reached on the axis)\n",
                                                region.target);
                                }
                            }
                        }
                        if (!response.axis_profile.empty()) {
                            PetscPrintf(comm, "\nDownwind axis profile (m, mg/m3)\n");
                            for (const auto& sample : response.axis_profile) {
                                PetscPrintf(comm, "  %10.2f  %.6g\n", sample.first, sample.second);
                            }
                        }
                        PetscPrintf(comm, "\n%s\n", response.report.c_str());
                    } else {
                        status = 1;
                    }
                }
            }
        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            status = 1;
        }
    }

    ierr = PetscFinalize();
    if (ierr) return static_cast<int>(ierr);
    return status;
}
