/*
 * Example: Vapor Cloud Explosion
 *
 * 23.7 t of gasoline vapour ignites. Converts the cloud to its TNT
 * equivalent and reports the blast overpressure at a few distances and
 * the radii of common damage thresholds.
 */

#include "VaporCloudExplosion.hpp"
#include "HazardErrors.hpp"
#include <petsc.h>
#include <iostream>

static char help[] = "Example: vapor cloud explosion of a gasoline release\n\n";

int main(int argc, char** argv) {
    PetscInitialize(&argc, &argv, nullptr, help);

    MPI_Comm comm = PETSC_COMM_WORLD;
    int rank;
    MPI_Comm_rank(comm, &rank);

    PetscReal alpha = HAZCON::HazardConstants::DEFAULT_TNT_ALPHA;
    PetscReal beta = HAZCON::HazardConstants::DEFAULT_GROUND_BETA;
    PetscOptionsGetReal(nullptr, nullptr, "-alpha", &alpha, nullptr);
    PetscOptionsGetReal(nullptr, nullptr, "-beta", &beta, nullptr);

    int status = 0;
    if (rank == 0) {
        std::cout << "================================================\n";
        std::cout << "  Vapor Cloud Explosion Example\n";
        std::cout << "================================================\n\n";

        try {
            HAZCON::VaporCloudExplosion vce("gasoline",
                {{"material_density", 790.0}, {"combustion_heat", 45980.0}},
                {{"tnt_explosive_energy", 4675.0},
                 {"material_volume", std::nullopt},
                 {"material_weight", 23700.0}});

            std::cout << "TNT equivalent:  " << vce.turnToTnt(alpha, beta) << " kg\n\n";

            for (double d : {50.0, 100.0, 200.0}) {
                std::cout << "Overpressure at " << d << " m: "
                          << vce.waveOverpressureAt(d, alpha, beta) << " MPa\n";
            }
            std::cout << "\n";

            // Thresholds: severe damage, window breakage, minor damage
            for (double p : {0.1, 0.05, 0.02}) {
                std::cout << "Radius at " << p << " MPa: "
                          << vce.waveRadiusFor(p, alpha, beta) << " m\n";
            }
            std::cout << "\n" << vce.getInfo() << "\n";
        } catch (const HAZCON::HazardError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }

    PetscFinalize();
    return status;
}
