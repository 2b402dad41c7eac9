/*
 * Lennard-Jones Molecular Dynamics Engine Header
 *
 * Velocity-Verlet integration of N point particles in a periodic cubic
 * box with a truncated Lennard-Jones pair potential and an isokinetic
 * velocity-rescaling thermostat. Positions, velocities and forces are
 * N x 3 row-major Eigen matrices so that rows map directly onto the
 * [N, 3] C-order arrays written to disk.
 */

#ifndef MD_ENGINE_H
#define MD_ENGINE_H

#include "random.h"
#include "profiling.h"
#include "io/config_types.h"
#include <eigen3/Eigen/Dense>
#include <vector>

typedef Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor> ParticleArray;

// Offset added to the instantaneous temperature before rescaling
constexpr double THERMOSTAT_EPSILON = 1e-9;

struct LennardJonesParameters {
    double epsilon = 1.0;
    double sigma = 1.0;
    double cutoff = 2.5;            // rc, absolute length
    double mass = 1.0;
    double dt = 0.001;
    double velocity_clamp = 100.0;  // |v_i| per component is kept below this
};

/**
 * Complete mutable state of one MD run
 * Owned by the run routine and passed by reference to every step function.
 */
struct ParticleSystem {
    ParticleArray positions;
    ParticleArray velocities;
    ParticleArray forces;
    ParticleArray reference_positions;  // Positions at t = 0, for the MSD
    double box_length = 0.0;
    double potential_energy = 0.0;      // From the last force evaluation
    bool forces_current = false;

    int num_particles() const { return static_cast<int>(positions.rows()); }
};

struct RadialDistribution {
    Eigen::VectorXd r;   // Bin centres
    Eigen::VectorXd g;   // g(r) per bin
};

/**
 * Recorded output of a melting run, one entry per snapshot
 */
struct MeltingTrajectory {
    std::vector<ParticleArray> frames;
    std::vector<double> temps;
    std::vector<double> msd;
    std::vector<Eigen::VectorXd> rdfs;
    Eigen::VectorXd rdf_r_axis;
    std::vector<StageTimings> stage_timings;

    int num_frames() const { return static_cast<int>(frames.size()); }
};

// Simple cubic lattice of cells^3 particles with spacing a, box = cells * a
ParticleSystem create_cubic_lattice(int cells, double lattice_constant);

// Velocities drawn from the Maxwell-Boltzmann distribution at temperature T
void initialize_maxwell_boltzmann(ParticleSystem& system, double T, double mass,
                                  RandomGenerator& rng);

// Minimum-image convention applied in place to a set of displacement rows
void apply_minimum_image(ParticleArray& displacements, double box_length);

// Wrap every coordinate into [0, L)
void wrap_positions(ParticleSystem& system);

/**
 * All-pairs truncated Lennard-Jones forces, O(N^2)
 *
 * Pairs with 0 < r^2 < rc^2 contribute; coincident particles and pairs
 * beyond the cutoff contribute nothing. Updates forces and potential energy.
 */
void compute_forces(ParticleSystem& system, const LennardJonesParameters& params);

// Half kick, drift + wrap, force update, half kick; velocities clamped after each kick
void velocity_verlet_step(ParticleSystem& system, const LennardJonesParameters& params);

double kinetic_energy(const ParticleSystem& system, double mass);

// T = 2 KE / (3N), kB = 1
double kinetic_temperature(const ParticleSystem& system, double mass);

// v <- v * sqrt(T_target / (T_inst + THERMOSTAT_EPSILON))
void rescale_to_temperature(ParticleSystem& system, double target_temperature, double mass);

// Mean of |r - r_0|^2 with each displacement unwrapped by minimum image
double mean_squared_displacement(const ParticleSystem& system);

/**
 * Radial distribution function g(r)
 * Histogram of minimum-image pair distances on [0, r_max], normalised by
 * the ideal-gas shell population rho * 4 pi r^2 dr and N / 2.
 *
 * @param r_max Upper edge of the histogram, L/2 when non-positive
 */
RadialDistribution radial_distribution(const ParticleSystem& system, int n_bins, double r_max = -1.0);

LennardJonesParameters parameters_from_config(const IO::MeltingConfig& config);

/**
 * Full temperature ramp
 * Snapshots are taken whenever the step index within a temperature stage is
 * a multiple of record_interval, after the thermostat has been applied.
 */
MeltingTrajectory run_melting(const IO::MeltingConfig& config,
                              const IO::DiagnosticConfig& diagnostics,
                              long int seed);

#endif // MD_ENGINE_H
