/*
 * Profiling and Diagnostics Module
 * 
 * Tools for profiling the precompute engines including:
 * - Timing measurements per temperature / stage / case
 * - Autocorrelation estimation
 * - Performance statistics
 */

#ifndef PROFILING_H
#define PROFILING_H

#include <vector>
#include <string>
#include <chrono>

/**
 * Timing data for one temperature point, MD stage or phase-field case
 */
struct StageTimings {
    double equilibration_time = 0.0;
    double measurement_time = 0.0;
    double output_time = 0.0;
    double total_time = 0.0;
    double step_time_estimate = 0.0;  // Seconds per sweep / MD step / CH step
};

/**
 * Wall-clock stopwatch
 */
class Stopwatch {
private:
    std::chrono::high_resolution_clock::time_point start_time;

public:
    Stopwatch() : start_time(std::chrono::high_resolution_clock::now()) {}

    double elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock::now() - start_time;
        return elapsed.count();
    }
};

/**
 * Simple autocorrelation estimator
 * Computes lag-1 autocorrelation coefficient from time series
 * 
 * @param series Time series data
 * @return Lag-1 autocorrelation coefficient rho(1)
 */
double estimate_autocorrelation(const std::vector<double>& series);

/**
 * Estimate autocorrelation time from lag-1 autocorrelation
 * Uses approximation: tau = (1 + rho) / (1 - rho)
 * 
 * @param rho Lag-1 autocorrelation coefficient
 * @return Estimated autocorrelation time in sweeps
 */
double estimate_autocorrelation_time(double rho);

/**
 * Print profiling report for a whole engine run
 * 
 * @param all_timings Timing data for each temperature / stage / case
 * @param unit_name What one entry is ("temperature", "stage", "case")
 */
void print_profiling_report(const std::vector<StageTimings>& all_timings,
                            const std::string& unit_name);

/**
 * Print one-line timing summary
 */
void print_stage_timing(const StageTimings& timings);

#endif // PROFILING_H
