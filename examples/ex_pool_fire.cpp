/*
 * Example: Pool Fire
 *
 * A gasoline pool of 24.7 m radius burns at a measured rate. Reports the
 * flame height, the radiant output, the flux at 100 m and the distances
 * of the 37.5, 25 and 12.5 kW/m2 injury thresholds.
 */

#include "PoolFire.hpp"
#include "HazardErrors.hpp"
#include <petsc.h>
#include <iostream>

static char help[] = "Example: pool fire thermal radiation\n\n";

int main(int argc, char** argv) {
    PetscInitialize(&argc, &argv, nullptr, help);

    MPI_Comm comm = PETSC_COMM_WORLD;
    int rank;
    MPI_Comm_rank(comm, &rank);

    PetscReal eta = 0.35;
    PetscOptionsGetReal(nullptr, nullptr, "-eta", &eta, nullptr);

    int status = 0;
    if (rank == 0) {
        std::cout << "================================================\n";
        std::cout << "  Pool Fire Example\n";
        std::cout << "================================================\n\n";

        try {
            HAZCON::PoolFire fire("gasoline",
                {{"boiling_point", std::nullopt},
                 {"combustion_heat", 41030000.0},
                 {"specific_heat_capacity", std::nullopt},
                 {"gasification_heat", std::nullopt},
                 {"burning_speed", 0.0781}},
                {{"env_temp", 25.0},
                 {"pool_radius", 24.7},
                 {"air_density", 1.293}});

            std::cout << "Flame height:    " << fire.flameHeight() << " m\n";
            std::cout << "Heat radiation:  " << fire.heatRadiation(eta) << " W\n";
            std::cout << "Flux at 100 m:   " << fire.heatRadiationStrengthAt(100.0, eta) << " W/m2\n\n";

            for (double q : {37500.0, 25000.0, 12500.0}) {
                std::cout << "Radius at " << q << " W/m2: "
                          << fire.heatRadiationRadiusFor(q, eta) << " m\n";
            }
            std::cout << "\n" << fire.getInfo() << "\n";
        } catch (const HAZCON::HazardError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }

    PetscFinalize();
    return status;
}
