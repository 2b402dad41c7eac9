/*
 * MPI Wrapper Implementation
 */

#include "../include/mpi_wrapper.h"
#include <iostream>

// MPIEnvironment Implementation
MPIEnvironment::MPIEnvironment(int argc, char** argv)
    : rank(0), num_ranks(1), is_initialized(false) {

#ifdef USE_MPI
    int provided;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &num_ranks);
    is_initialized = true;

    if (rank == 0) {
        std::cout << "MPI initialized with " << num_ranks << " ranks" << std::endl;
    }
#else
    // Serial execution
    (void)argc;
    (void)argv;
    rank = 0;
    num_ranks = 1;
    is_initialized = false;
    std::cout << "Running in serial mode (MPI not available)" << std::endl;
#endif
}

MPIEnvironment::~MPIEnvironment() {
#ifdef USE_MPI
    if (is_initialized) {
        MPI_Finalize();
    }
#endif
}

double MPIEnvironment::barrier_with_timing() {
#ifdef USE_MPI
    if (is_initialized) {
        double start_time = MPI_Wtime();
        MPI_Barrier(MPI_COMM_WORLD);
        double end_time = MPI_Wtime();
        return end_time - start_time;
    }
#endif
    return 0.0;
}

bool MPIEnvironment::all_succeeded(bool local_success) {
#ifdef USE_MPI
    if (is_initialized) {
        int local_flag = local_success ? 1 : 0;
        int global_flag = 0;
        MPI_Allreduce(&local_flag, &global_flag, 1, MPI_INT, MPI_LAND, MPI_COMM_WORLD);
        return global_flag != 0;
    }
#endif
    return local_success;
}
