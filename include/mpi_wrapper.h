/*
 * MPI Wrapper for Independent Simulation Jobs
 *
 * Provides a clean interface for MPI operations with fallback to serial execution
 * when MPI is not available. Jobs (one Ising material, one phase-field case) are
 * dealt round-robin over ranks; each job runs serially on its rank.
 */

#ifndef MPI_WRAPPER_H
#define MPI_WRAPPER_H

#include <cstddef>
#include <string>

#ifdef USE_MPI
#include <mpi.h>
#endif

/**
 * MPI Environment Manager
 *
 * Handles MPI initialization, finalization, and provides rank/size information.
 * Falls back gracefully to serial execution when compiled without MPI.
 */
class MPIEnvironment {
private:
    int rank;
    int num_ranks;
    bool is_initialized;

public:
    MPIEnvironment(int argc, char** argv);
    ~MPIEnvironment();

    MPIEnvironment(const MPIEnvironment&) = delete;
    MPIEnvironment& operator=(const MPIEnvironment&) = delete;

    // Accessors
    int get_rank() const { return rank; }
    int get_num_ranks() const { return num_ranks; }
    bool is_master() const { return rank == 0; }
    bool using_mpi() const {
#ifdef USE_MPI
        return is_initialized;
#else
        return false;
#endif
    }

    // Round-robin assignment of job i to rank i % num_ranks
    bool owns_job(size_t job_index) const {
        return static_cast<int>(job_index % num_ranks) == rank;
    }

    /**
     * Barrier with timing - returns time spent waiting at barrier (seconds)
     */
    double barrier_with_timing();

    /**
     * Logical AND of a per-rank success flag over all ranks
     * Collective: every rank must call it, including ranks whose job failed.
     */
    bool all_succeeded(bool local_success);
};

/**
 * Seed for job number job_index, independent of the number of ranks
 */
inline long int get_job_seed(long int base_seed, size_t job_index) {
    // Keep the sign of the base seed
    long int offset = static_cast<long int>(job_index) * 12345;
    if (base_seed < 0) {
        return base_seed - offset;
    } else {
        return base_seed + offset;
    }
}

#endif // MPI_WRAPPER_H
