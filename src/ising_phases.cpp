/*
 * Ising Sweep Phases Implementation
 * 
 * Both phases modify the simulation object in-place, evolving the spin
 * configuration through Metropolis sweeps.
 */

#include "../include/ising_phases.h"
#include <iostream>
#include <iomanip>
#include <cmath>
#include <stdexcept>

double run_equilibration_phase(IsingSimulation& sim, int equilibration_steps) {
    Stopwatch watch;
    for (int sweep = 0; sweep < equilibration_steps; sweep++) {
        sim.run_sweep();
    }
    return watch.elapsed_seconds();
}

std::pair<IsingMeasurement, double> run_measurement_phase(IsingSimulation& sim,
                                                          int measurement_steps) {
    Stopwatch watch;
    IsingMeasurement data;
    data.magnetization_series.reserve(measurement_steps);

    sim.reset_statistics();
    double m_sum = 0.0;
    for (int sweep = 0; sweep < measurement_steps; sweep++) {
        sim.run_sweep();
        double abs_m = sim.get_absolute_magnetization();
        m_sum += abs_m;
        data.magnetization_series.push_back(abs_m);
    }

    if (measurement_steps > 0) {
        data.mean_abs_magnetization = m_sum / measurement_steps;
    }
    data.acceptance_rate = sim.get_acceptance_rate();

    return {data, watch.elapsed_seconds()};
}

std::vector<IsingTemperatureResult> run_temperature_sweep(const IsingMaterial& material,
                                                          const IO::IsingConfig& config,
                                                          const IO::DiagnosticConfig& diagnostics,
                                                          long int seed) {
    std::vector<double> temps = config.temperatures();
    if (temps.empty()) {
        throw std::invalid_argument("Ising temperature schedule is empty");
    }
    if (config.measurement_steps <= 0) {
        throw std::invalid_argument("Ising measurement_steps must be positive");
    }

    double J = coupling_from_curie_temperature(material.curie_temperature);
    std::cout << "Material " << material.name << ": Tc = " << std::fixed << std::setprecision(1)
              << material.curie_temperature << " K, J = " << std::setprecision(4) << J << std::endl;

    // Lattice initialised once (all up) and carried across temperatures
    IsingSimulation sim(config.lattice_size, J, temps.front(), seed);
    int sweep_count = config.equilibration_steps + config.measurement_steps;

    std::vector<IsingTemperatureResult> results;
    results.reserve(temps.size());

    for (size_t t_index = 0; t_index < temps.size(); t_index++) {
        double T = temps[t_index];
        Stopwatch point_watch;
        sim.set_temperature(T);

        IsingTemperatureResult result;
        result.T = T;
        result.timings.equilibration_time = run_equilibration_phase(sim, config.equilibration_steps);

        auto [measurement, measurement_time] = run_measurement_phase(sim, config.measurement_steps);
        result.timings.measurement_time = measurement_time;
        result.abs_magnetization = measurement.mean_abs_magnetization;
        result.acceptance_rate = measurement.acceptance_rate;
        result.snapshot = sim.get_spins();

        result.autocorrelation = 0.0;
        if (diagnostics.estimate_autocorrelation) {
            result.autocorrelation = estimate_autocorrelation(measurement.magnetization_series);
        }

        result.timings.total_time = point_watch.elapsed_seconds();
        result.timings.step_time_estimate = result.timings.total_time / sweep_count;

        bool report = diagnostics.progress_interval <= 1 ||
                      t_index % diagnostics.progress_interval == 0 ||
                      t_index + 1 == temps.size();
        if (report) {
            std::cout << material.name << ": T=" << std::setw(6) << std::setprecision(0) << std::fixed << T
                      << " K  M=" << std::setprecision(3) << result.abs_magnetization;
            if (diagnostics.estimate_autocorrelation) {
                std::cout << "  tau~" << std::setprecision(2)
                          << estimate_autocorrelation_time(result.autocorrelation) << " sweeps";
            }
            std::cout << std::endl;
            if (diagnostics.enable_profiling) {
                print_stage_timing(result.timings);
            }
        }

        results.push_back(std::move(result));
    }

    return results;
}
