#include "DislocCore.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

static char help[] = "disloccore - Volterra dislocation fields and SDVPN core structure\n"
                    "Usage: disloccore [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -o <file>                Profile output file (overrides [OUTPUT])\n"
                    "  -method <type>           SDVPN minimizer: RELAXATION, TAO_LMVM\n"
                    "  -sdvpn_tao_*             TAO options for the LMVM minimizer\n"
                    "  -info                    Per-iteration solver diagnostics\n\n"
                    "Examples:\n"
                    "  disloccore -c config/al_edge.config -o al_edge_profile.txt\n\n"
                    "  # Generate template configuration\n"
                    "  disloccore -generate_config my_config.config\n\n";

using namespace DislocCore;

static void writeProfile(std::ostream& out, const SDVPN& solver, const DisregistryProfile& profile,
                         const ConfigReader::OutputConfig& output) {
    out << std::setprecision(output.precision);
    out << "# x  delta_m  delta_n  delta_xi";
    if (output.write_density) out << "  rho_m  rho_n  rho_xi";
    out << "\n";

    std::vector<Vector3> rho;
    if (output.write_density) rho = solver.dislocationDensity(profile);

    for (int i = 0; i < profile.size(); ++i) {
        const Vector3& d = profile[i];
        out << profile.x()[i] << " " << d(0) << " " << d(1) << " " << d(2);
        if (output.write_density) {
            // Cell densities sit between points; the last point has none on fixed grids
            Vector3 r = i < static_cast<int>(rho.size()) ? rho[i] : Vector3::Zero();
            out << " " << r(0) << " " << r(1) << " " << r(2);
        }
        out << "\n";
    }
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                try {
                    ConfigReader::generateTemplate(generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(comm, "Error: %s\n", e.what());
                    ierr = PetscFinalize();
                    return 1;
                }
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                PetscPrintf(comm, "Edit this file to describe your dislocation.\n");
            }
            ierr = PetscFinalize();
            return 0;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_file[PETSC_MAX_PATH_LEN] = "";
        char method[256] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool method_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-method", method,
                                     sizeof(method), &method_provided); CHKERRQ(ierr);

        if (!config_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: disloccore -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  DislocCore - Dislocation Core Structure\n");
            PetscPrintf(comm, "  Version 1.0.0\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "Config file:   %s\n", config_file);
        }

        // The calculation is serial; other ranks only take part in PETSc setup
        int status = 0;
        if (rank == 0) {
            try {
                ConfigReader config;
                if (!config.loadFile(config_file)) {
                    throw std::runtime_error(std::string("Cannot read ") + config_file);
                }

                ConfigReader::ValidationResult check = config.validate();
                for (const auto& w : check.warnings) {
                    PetscPrintf(comm, "Warning: %s\n", w.c_str());
                }
                if (!check.valid) {
                    for (const auto& e : check.errors) {
                        PetscPrintf(comm, "Error: %s\n", e.c_str());
                    }
                    throw std::runtime_error("Invalid configuration");
                }

                ElasticConstants C = config.parseElasticConstants();
                DislocationGeometry geometry = config.parseDislocationGeometry();
                VolterraDislocation dislocation =
                    solveVolterraDislocation(C, geometry, config.parseVolterraOptions());

                Vector3 b = geometry.burgersInFrame();
                Matrix3 K = dislocation.K_tensor();
                PetscPrintf(comm, "Dislocation model: %s\n",
                            dislocation.isIsotropic() ? "isotropic closed form" : "anisotropic Stroh");
                PetscPrintf(comm, "Burgers (m, n, xi): %.6f %.6f %.6f angstrom\n", b(0), b(1), b(2));
                PetscPrintf(comm, "K tensor (eV/A^3):\n");
                for (int i = 0; i < 3; ++i) {
                    PetscPrintf(comm, "  %12.6f %12.6f %12.6f\n", K(i, 0), K(i, 1), K(i, 2));
                }
                PetscPrintf(comm, "K_coeff = %.6f GPa, preln = %.6f eV/A\n",
                            dislocation.K_coeff() * Units::EV_PER_ANGSTROM3_IN_GPA,
                            dislocation.preln());

                ConfigReader::GridConfig grid;
                config.parseGridConfig(grid);
                GammaSurface gamma = config.parseGammaSurface(b);

                int npoints = grid.npoints;
                double spacing = 2.0 * grid.xmax / (npoints - 1);
                ElasticKernel kernel =
                    ElasticKernel::fromDislocation(dislocation, spacing, npoints, grid.boundary);

                SDVPNOptions options;
                config.parseSolverOptions(options);
                if (method_provided) options.method = parseSolverMethod(method);

                SDVPN solver(gamma, kernel, b, options);
                solver.setAppliedStress(config.parseAppliedStress());
                solver.setSurfaceCorrection(config.parseSurfaceCorrection());

                DisregistryProfile initial = pnArctanDisregistry(
                    grid.xmax, npoints, b, grid.initial_halfwidth, grid.initial_shift);

                PetscPrintf(comm, "Grid: %d points, spacing %.4f angstrom, %s boundaries\n",
                            npoints, spacing, toString(grid.boundary).c_str());
                PetscPrintf(comm, "Solver: %s\n", toString(options.method).c_str());
                PetscPrintf(comm, "------------------------------------------------------------\n");

                double start_time = MPI_Wtime();
                SDVPNResult result = solver.solve(initial);
                double end_time = MPI_Wtime();

                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Status:        %s\n", toString(result.status).c_str());
                PetscPrintf(comm, "Iterations:    %d\n", result.iterations);
                PetscPrintf(comm, "Residual:      %.4e\n", result.residual);
                PetscPrintf(comm, "Energy:        %.10f eV/A\n", result.energy);
                PetscPrintf(comm, "  misfit       %.10f\n", solver.misfitEnergy(result.profile));
                PetscPrintf(comm, "  elastic      %.10f\n", solver.elasticEnergy(result.profile));
                PetscPrintf(comm, "  stress       %.10f\n", solver.stressEnergy(result.profile));
                PetscPrintf(comm, "  surface      %.10f\n", solver.surfaceEnergy(result.profile));
                for (int c = 0; c < 3; ++c) {
                    if (std::abs(b(c)) > 1e-8 * b.norm()) {
                        PetscPrintf(comm, "Core width (%s): %.4f angstrom\n",
                                    c == 0 ? "m" : (c == 1 ? "n" : "xi"),
                                    coreWidth(result.profile, b, c));
                    }
                }
                PetscPrintf(comm, "Wall time:     %.2f seconds\n", end_time - start_time);

                ConfigReader::OutputConfig output;
                config.parseOutputConfig(output);
                if (output_provided) output.profile_file = output_file;

                if (output.profile_file.empty()) {
                    writeProfile(std::cout, solver, result.profile, output);
                } else {
                    std::ofstream out(output.profile_file);
                    if (!out.is_open()) {
                        throw std::runtime_error("Cannot write profile: " + output.profile_file);
                    }
                    writeProfile(out, solver, result.profile, output);
                    PetscPrintf(comm, "Profile written to: %s\n", output.profile_file.c_str());
                }
                PetscPrintf(comm, "============================================================\n");

                if (!result.converged) {
                    PetscPrintf(comm, "Warning: SDVPN did not converge; profile is the best reached\n");
                }

            } catch (const std::exception& e) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
                status = 1;
            }
        }

        MPI_Bcast(&status, 1, MPI_INT, 0, comm);
        if (status == 1) {
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return 0;
}
