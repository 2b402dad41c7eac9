/*
 * Ising Sweep Phases
 * 
 * Equilibration and measurement phases at one temperature, and the
 * continuous ascending temperature sweep for one material.
 */

#ifndef ISING_PHASES_H
#define ISING_PHASES_H

#include "ising_engine.h"
#include "profiling.h"
#include "io/config_types.h"
#include <vector>
#include <utility>

// Samples collected during the measurement phase
struct IsingMeasurement {
    double mean_abs_magnetization = 0.0;
    double acceptance_rate = 0.0;
    std::vector<double> magnetization_series;  // |M| after each sweep
};

// Result of one temperature point of a sweep
struct IsingTemperatureResult {
    double T;
    double abs_magnetization;
    double acceptance_rate;
    double autocorrelation;   // rho(1) of the |M| series, 0 if not estimated
    SpinGrid snapshot;        // Spin grid at the end of the measurement phase
    StageTimings timings;
};

/**
 * Run the equilibration phase: discarded sweeps
 * @param sim The simulation object (MODIFIED IN-PLACE)
 * @param equilibration_steps Number of sweeps
 * @return Time taken in seconds
 */
double run_equilibration_phase(IsingSimulation& sim, int equilibration_steps);

/**
 * Run the measurement phase: sweeps accumulating |M| after each one
 * @param sim The simulation object (MODIFIED IN-PLACE)
 * @param measurement_steps Number of sweeps
 * @return Collected samples and time taken in seconds
 */
std::pair<IsingMeasurement, double> run_measurement_phase(IsingSimulation& sim,
                                                          int measurement_steps);

/**
 * Sweep one material through the ascending temperature list
 *
 * The lattice starts all up and is never reset: the final configuration at
 * one temperature seeds the next one.
 */
std::vector<IsingTemperatureResult> run_temperature_sweep(const IsingMaterial& material,
                                                          const IO::IsingConfig& config,
                                                          const IO::DiagnosticConfig& diagnostics,
                                                          long int seed);

#endif // ISING_PHASES_H
