/*
 * Lennard-Jones Molecular Dynamics Engine Implementation
 *
 * Pair loops are written as batched Eigen row operations: for each
 * particle i the displacements to all j > i are formed at once, masked
 * by the cutoff and reduced.
 */

#include "../include/md_engine.h"
#include <iostream>
#include <iomanip>
#include <cmath>
#include <stdexcept>

ParticleSystem create_cubic_lattice(int cells, double lattice_constant) {
    if (cells <= 0) {
        throw std::invalid_argument("MD lattice needs at least one cell per side, got " +
                                    std::to_string(cells));
    }
    if (lattice_constant <= 0.0) {
        throw std::invalid_argument("MD lattice constant must be positive");
    }

    int n = cells * cells * cells;
    ParticleSystem system;
    system.box_length = cells * lattice_constant;
    system.positions.resize(n, 3);

    int index = 0;
    for (int i = 0; i < cells; i++) {
        for (int j = 0; j < cells; j++) {
            for (int k = 0; k < cells; k++) {
                system.positions(index, 0) = i * lattice_constant;
                system.positions(index, 1) = j * lattice_constant;
                system.positions(index, 2) = k * lattice_constant;
                index++;
            }
        }
    }

    system.velocities = ParticleArray::Zero(n, 3);
    system.forces = ParticleArray::Zero(n, 3);
    system.reference_positions = system.positions;
    system.forces_current = false;
    return system;
}

void initialize_maxwell_boltzmann(ParticleSystem& system, double T, double mass,
                                  RandomGenerator& rng) {
    double stddev = std::sqrt(T / mass);
    for (int i = 0; i < system.num_particles(); i++) {
        for (int d = 0; d < 3; d++) {
            system.velocities(i, d) = rng.gaussian(stddev);
        }
    }
}

void apply_minimum_image(ParticleArray& displacements, double box_length) {
    displacements.array() -= box_length * (displacements.array() / box_length).round();
}

void wrap_positions(ParticleSystem& system) {
    double L = system.box_length;
    system.positions.array() -= L * (system.positions.array() / L).floor();
    // x - L*floor(x/L) can round to exactly L for tiny negative x
    system.positions = (system.positions.array() >= L).select(0.0, system.positions.array()).matrix();
}

void compute_forces(ParticleSystem& system, const LennardJonesParameters& params) {
    const int n = system.num_particles();
    const double rc2 = params.cutoff * params.cutoff;
    const double sigma2 = params.sigma * params.sigma;
    const double L = system.box_length;

    system.forces.setZero(n, 3);
    double potential = 0.0;

    for (int i = 0; i < n - 1; i++) {
        const int rest = n - i - 1;

        // rij = r_j - r_i for all j > i
        ParticleArray rij = system.positions.bottomRows(rest).rowwise() - system.positions.row(i);
        apply_minimum_image(rij, L);

        Eigen::ArrayXd dist2 = rij.rowwise().squaredNorm().array();
        Eigen::ArrayXd within = ((dist2 < rc2) && (dist2 > 0.0)).cast<double>();
        if (within.sum() == 0.0) continue;

        Eigen::ArrayXd safe_dist2 = (dist2 > 0.0).select(dist2, 1.0);
        Eigen::ArrayXd inv_r2 = sigma2 * safe_dist2.inverse();
        Eigen::ArrayXd inv_r6 = inv_r2.cube();
        Eigen::ArrayXd inv_r12 = inv_r6.square();

        Eigen::ArrayXd f_scalar = within * 24.0 * params.epsilon * (2.0 * inv_r12 - inv_r6) * safe_dist2.inverse();
        potential += 4.0 * params.epsilon * (within * (inv_r12 - inv_r6)).sum();

        ParticleArray fij = (rij.array().colwise() * f_scalar).matrix();

        // Positive f_scalar is repulsive: i is pushed along -rij, j along +rij
        system.forces.row(i) -= fij.colwise().sum();
        system.forces.bottomRows(rest) += fij;
    }

    system.potential_energy = potential;
    system.forces_current = true;
}

static void clamp_velocities(ParticleSystem& system, double velocity_clamp) {
    system.velocities = system.velocities.cwiseMax(-velocity_clamp).cwiseMin(velocity_clamp);
}

void velocity_verlet_step(ParticleSystem& system, const LennardJonesParameters& params) {
    if (!system.forces_current) {
        compute_forces(system, params);
    }
    const double half_kick = 0.5 * params.dt / params.mass;

    system.velocities += half_kick * system.forces;
    clamp_velocities(system, params.velocity_clamp);

    system.positions += params.dt * system.velocities;
    wrap_positions(system);

    compute_forces(system, params);

    system.velocities += half_kick * system.forces;
    clamp_velocities(system, params.velocity_clamp);
}

double kinetic_energy(const ParticleSystem& system, double mass) {
    return 0.5 * mass * system.velocities.squaredNorm();
}

double kinetic_temperature(const ParticleSystem& system, double mass) {
    int n = system.num_particles();
    if (n == 0) return 0.0;
    return 2.0 * kinetic_energy(system, mass) / (3.0 * n);
}

void rescale_to_temperature(ParticleSystem& system, double target_temperature, double mass) {
    double current_T = kinetic_temperature(system, mass);
    system.velocities *= std::sqrt(target_temperature / (current_T + THERMOSTAT_EPSILON));
}

double mean_squared_displacement(const ParticleSystem& system) {
    if (system.num_particles() == 0) return 0.0;
    ParticleArray displacement = system.positions - system.reference_positions;
    apply_minimum_image(displacement, system.box_length);
    return displacement.rowwise().squaredNorm().mean();
}

RadialDistribution radial_distribution(const ParticleSystem& system, int n_bins, double r_max) {
    if (n_bins <= 0) {
        throw std::invalid_argument("RDF needs a positive number of bins");
    }
    const int n = system.num_particles();
    const double L = system.box_length;
    if (r_max <= 0.0) r_max = L / 2.0;

    const double dr = r_max / n_bins;
    const double rho = n / (L * L * L);

    // Distances of all distinct pairs, row i against rows i+1..n-1
    Eigen::ArrayXd dist(static_cast<Eigen::Index>(n) * (n - 1) / 2);
    Eigen::Index offset = 0;
    for (int i = 0; i < n - 1; i++) {
        const int rest = n - i - 1;
        ParticleArray rij = system.positions.bottomRows(rest).rowwise() - system.positions.row(i);
        apply_minimum_image(rij, L);
        dist.segment(offset, rest) = rij.rowwise().norm().array();
        offset += rest;
    }

    // Pairs inside each bin's outer edge; d == r_max closes the last bin
    Eigen::VectorXd within(n_bins);
    for (int k = 0; k < n_bins - 1; k++) {
        within(k) = static_cast<double>((dist < (k + 1) * dr).count());
    }
    within(n_bins - 1) = static_cast<double>((dist <= r_max).count());

    Eigen::VectorXd hist = within;
    hist.tail(n_bins - 1) -= within.head(n_bins - 1);

    RadialDistribution rdf;
    rdf.r.resize(n_bins);
    rdf.g.resize(n_bins);
    for (int k = 0; k < n_bins; k++) {
        double r = (k + 0.5) * dr;
        double n_ideal = 4.0 * M_PI * r * r * dr * rho;
        rdf.r(k) = r;
        rdf.g(k) = (n > 0) ? hist(k) / (n_ideal * n * 0.5) : 0.0;
    }
    return rdf;
}

LennardJonesParameters parameters_from_config(const IO::MeltingConfig& config) {
    LennardJonesParameters params;
    params.epsilon = config.epsilon;
    params.sigma = config.sigma;
    params.cutoff = config.cutoff * config.sigma;
    params.mass = config.mass;
    params.dt = config.dt;
    params.velocity_clamp = config.velocity_clamp;
    return params;
}

MeltingTrajectory run_melting(const IO::MeltingConfig& config,
                              const IO::DiagnosticConfig& diagnostics,
                              long int seed) {
    std::vector<double> temps = config.temperatures();
    if (temps.empty()) {
        throw std::invalid_argument("MD temperature schedule is empty");
    }
    if (config.steps_per_temperature <= 0 || config.record_interval <= 0) {
        throw std::invalid_argument("MD steps_per_temperature and record_interval must be positive");
    }
    if (config.dt <= 0.0 || config.mass <= 0.0 || config.cutoff <= 0.0) {
        throw std::invalid_argument("MD dt, mass and cutoff must be positive");
    }

    LennardJonesParameters params = parameters_from_config(config);
    ParticleSystem system = create_cubic_lattice(config.cells, config.lattice_constant);
    RandomGenerator rng(seed);

    initialize_maxwell_boltzmann(system, temps.front(), params.mass, rng);
    compute_forces(system, params);

    std::cout << "Starting MD simulation: N = " << system.num_particles()
              << ", L = " << std::fixed << std::setprecision(3) << system.box_length
              << ", rc = " << params.cutoff << ", dt = " << params.dt << std::endl;

    MeltingTrajectory trajectory;
    int frames_per_stage = (config.steps_per_temperature + config.record_interval - 1) / config.record_interval;
    trajectory.frames.reserve(temps.size() * frames_per_stage);

    for (size_t stage = 0; stage < temps.size(); stage++) {
        double T = temps[stage];
        Stopwatch stage_watch;
        StageTimings timings;

        for (int step = 0; step < config.steps_per_temperature; step++) {
            velocity_verlet_step(system, params);
            rescale_to_temperature(system, T, params.mass);

            if (step % config.record_interval == 0) {
                Stopwatch measure_watch;
                RadialDistribution rdf = radial_distribution(system, config.rdf_bins);
                if (trajectory.rdf_r_axis.size() == 0) {
                    trajectory.rdf_r_axis = rdf.r;
                }
                trajectory.frames.push_back(system.positions);
                trajectory.temps.push_back(T);
                trajectory.msd.push_back(mean_squared_displacement(system));
                trajectory.rdfs.push_back(rdf.g);
                timings.measurement_time += measure_watch.elapsed_seconds();
            }
        }

        timings.total_time = stage_watch.elapsed_seconds();
        timings.equilibration_time = timings.total_time - timings.measurement_time;
        timings.step_time_estimate = timings.equilibration_time / config.steps_per_temperature;
        trajectory.stage_timings.push_back(timings);

        bool report = diagnostics.progress_interval <= 1 ||
                      stage % diagnostics.progress_interval == 0 ||
                      stage + 1 == temps.size();
        if (report) {
            std::cout << "Finished T = " << std::fixed << std::setprecision(2) << T
                      << " (" << stage + 1 << "/" << temps.size() << ")"
                      << "  U/N = " << std::setprecision(4) << system.potential_energy / system.num_particles()
                      << "  MSD = " << trajectory.msd.back() << std::endl;
            if (diagnostics.enable_profiling) {
                print_stage_timing(timings);
            }
        }
    }

    std::cout << "Recorded " << trajectory.num_frames() << " frames" << std::endl;
    return trajectory;
}
