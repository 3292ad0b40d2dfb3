/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for GTest test suite
 */

#include <gtest/gtest.h>
#include <mpi.h>
#include <petsc.h>

int main(int argc, char **argv) {
    MPI_Init(&argc, &argv);

    // PETSc provides PETSC_COMM_WORLD for tests that write scratch files
    PetscInitialize(&argc, &argv, nullptr, nullptr);

    ::testing::InitGoogleTest(&argc, argv);

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    // Only print from rank 0
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
