/*
 * Ising Simulation Engine Header
 *
 * Single-spin-flip Metropolis sampler for the 2D Ising model on a
 * periodic L x L square lattice. Spins are stored in an Eigen integer
 * array; energy and magnetization are tracked incrementally.
 */

#ifndef ISING_ENGINE_H
#define ISING_ENGINE_H

#include "random.h"
#include <eigen3/Eigen/Dense>
#include <cmath>
#include <string>

// Critical temperature of the 2D square-lattice Ising model in units of J/kB
constexpr double ISING_CRITICAL_TEMPERATURE = 2.269;

// Inverse temperature used in place of 1/T at T = 0
constexpr double ZERO_TEMPERATURE_BETA = 1.0e6;

// Spin grid type: values are always +1 or -1
typedef Eigen::Array<int, Eigen::Dynamic, Eigen::Dynamic> SpinGrid;

/**
 * Material entry for a temperature sweep
 * The coupling is obtained by mapping the real Curie temperature onto
 * the 2D Ising critical temperature: J = Tc_real / 2.269
 */
struct IsingMaterial {
    std::string name;
    double curie_temperature;
};

inline double coupling_from_curie_temperature(double curie_temperature) {
    return curie_temperature / ISING_CRITICAL_TEMPERATURE;
}

class IsingSimulation {
private:
    // Core parameters
    int lattice_size;
    double coupling;      // J > 0 ferromagnetic
    double temperature;
    double beta;          // 1/T, or ZERO_TEMPERATURE_BETA at T = 0

    SpinGrid spins;
    RandomGenerator rng;

    // Statistics
    long int total_attempts;
    long int total_acceptances;

    // Tracked observables (updated incrementally during MC)
    double current_energy;
    long int current_spin_sum;

    inline int wrap(int i) const {
        if (i < 0) return i + lattice_size;
        if (i >= lattice_size) return i - lattice_size;
        return i;
    }

    inline int neighbor_sum(int i, int j) const {
        return spins(wrap(i + 1), j) + spins(wrap(i - 1), j) +
               spins(i, wrap(j + 1)) + spins(i, wrap(j - 1));
    }

    inline bool metropolis_test_fast(double energy_change) {
        if (energy_change <= 0.0) return true;
        double probability = std::exp(-energy_change * beta);
        return rng.uniform() < probability;
    }

public:
    IsingSimulation(int size, double J, double T, long int seed);

    // Main methods
    void initialize_lattice_uniform();
    void set_temperature(double T);
    void update_tracked_observables();
    void run_metropolis_step();
    void run_sweep();

    // Energy change of flipping site (i, j): 2 J s_ij * sum of 4 neighbours
    double flip_energy_change(int i, int j) const {
        return 2.0 * coupling * spins(i, j) * neighbor_sum(i, j);
    }

    // Measurements
    double get_energy() const;         // Recompute from scratch
    double get_magnetization() const;  // Per-site, recomputed, in [-1, 1]
    double get_tracked_energy() const { return current_energy; }
    double get_tracked_magnetization() const {
        return static_cast<double>(current_spin_sum) / (lattice_size * lattice_size);
    }
    double get_absolute_magnetization() const { return std::abs(get_tracked_magnetization()); }

    double get_acceptance_rate() const;
    void reset_statistics();

    double get_temperature() const { return temperature; }
    double get_beta() const { return beta; }

    // Spin access
    const SpinGrid& get_spins() const { return spins; }
    void set_spin(int i, int j, int spin);
};

#endif // ISING_ENGINE_H
