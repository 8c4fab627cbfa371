/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for the DislocCore GTest suite
 */

#include <gtest/gtest.h>
#include <mpi.h>
#include <petsc.h>

static char help[] = "DislocCore unit and physics tests\n";

int main(int argc, char **argv) {
    MPI_Init(&argc, &argv);

    // PETSc backs the solver logging, timing and the TAO minimizer
    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, help);
    if (ierr) {
        MPI_Finalize();
        return static_cast<int>(ierr);
    }

    ::testing::InitGoogleTest(&argc, argv);

    // Only print from rank 0
    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    if (rank != 0) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    PetscFinalize();
    MPI_Finalize();

    return result;
}
