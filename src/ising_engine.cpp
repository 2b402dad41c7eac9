/*
 * Ising Simulation Engine Implementation
 */

#include "../include/ising_engine.h"
#include <cmath>
#include <stdexcept>

IsingSimulation::IsingSimulation(int size, double J, double T, long int seed)
    : lattice_size(size), coupling(J), temperature(0.0), beta(ZERO_TEMPERATURE_BETA),
      rng(seed), total_attempts(0), total_acceptances(0),
      current_energy(0.0), current_spin_sum(0) {

    if (size <= 0) {
        throw std::invalid_argument("Ising lattice size must be positive, got " + std::to_string(size));
    }
    set_temperature(T);

    spins.resize(lattice_size, lattice_size);
    initialize_lattice_uniform();
}

// All spins up. This is the start of every material sweep.
void IsingSimulation::initialize_lattice_uniform() {
    spins.setConstant(1);
    update_tracked_observables();
}

void IsingSimulation::set_temperature(double T) {
    if (T < 0.0 || !std::isfinite(T)) {
        throw std::invalid_argument("Temperature must be finite and non-negative");
    }
    temperature = T;
    beta = (T > 0.0) ? 1.0 / T : ZERO_TEMPERATURE_BETA;
}

void IsingSimulation::update_tracked_observables() {
    current_energy = get_energy();
    current_spin_sum = spins.sum();
}

// Single-spin-flip Metropolis step at a uniformly chosen site
void IsingSimulation::run_metropolis_step() {
    int i = rng.uniform_index(lattice_size);
    int j = rng.uniform_index(lattice_size);

    double energy_change = flip_energy_change(i, j);
    total_attempts++;

    if (metropolis_test_fast(energy_change)) {
        total_acceptances++;
        current_spin_sum -= 2 * spins(i, j);
        spins(i, j) = -spins(i, j);
        current_energy += energy_change;
    }
}

// One sweep = L^2 proposals
void IsingSimulation::run_sweep() {
    int proposals = lattice_size * lattice_size;
    for (int attempt = 0; attempt < proposals; attempt++) {
        run_metropolis_step();
    }
}

// E = -J sum_<ij> s_i s_j, each bond counted once (right and down neighbours)
double IsingSimulation::get_energy() const {
    long int bond_sum = 0;
    for (int i = 0; i < lattice_size; i++) {
        for (int j = 0; j < lattice_size; j++) {
            bond_sum += spins(i, j) * (spins(wrap(i + 1), j) + spins(i, wrap(j + 1)));
        }
    }
    return -coupling * static_cast<double>(bond_sum);
}

double IsingSimulation::get_magnetization() const {
    return static_cast<double>(spins.sum()) / (lattice_size * lattice_size);
}

double IsingSimulation::get_acceptance_rate() const {
    if (total_attempts == 0) return 0.0;
    return 100.0 * total_acceptances / total_attempts;
}

void IsingSimulation::reset_statistics() {
    total_attempts = 0;
    total_acceptances = 0;
}

void IsingSimulation::set_spin(int i, int j, int spin) {
    if (spin != 1 && spin != -1) {
        throw std::invalid_argument("Ising spin must be +1 or -1");
    }
    spins(i, j) = spin;
    update_tracked_observables();
}
