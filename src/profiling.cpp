/*
 * Profiling and Diagnostics Module Implementation
 */

#include "../include/profiling.h"
#include <iostream>
#include <iomanip>
#include <cmath>

double estimate_autocorrelation(const std::vector<double>& series) {
    if (series.size() < 3) return 0.0;
    
    // Compute mean
    double mean = 0.0;
    for (double val : series) mean += val;
    mean /= series.size();
    
    // Compute lag-0 and lag-1 covariance
    double c0 = 0.0, c1 = 0.0;
    for (size_t i = 0; i < series.size(); i++) {
        c0 += (series[i] - mean) * (series[i] - mean);
    }
    for (size_t i = 0; i + 1 < series.size(); i++) {
        c1 += (series[i] - mean) * (series[i+1] - mean);
    }
    
    c0 /= series.size();
    c1 /= (series.size() - 1);
    
    if (c0 > 1e-15) {
        return c1 / c0;
    }
    return 0.0;
}

double estimate_autocorrelation_time(double rho) {
    if (rho >= 1.0) return 1e10;   // Infinite correlation
    if (rho <= -1.0) return 1.0;   // Anti-correlated
    return (1.0 + rho) / (1.0 - rho);
}

void print_profiling_report(const std::vector<StageTimings>& all_timings,
                            const std::string& unit_name) {
    if (all_timings.empty()) return;
    
    std::cout << "\n========================================" << std::endl;
    std::cout << "  PROFILING SUMMARY" << std::endl;
    std::cout << "========================================" << std::endl;
    
    double total_walltime = 0.0;
    double total_equilibration = 0.0;
    double total_measurement = 0.0;
    double total_output = 0.0;
    
    for (const auto& t : all_timings) {
        total_walltime += t.total_time;
        total_equilibration += t.equilibration_time;
        total_measurement += t.measurement_time;
        total_output += t.output_time;
    }
    double denominator = total_walltime > 0.0 ? total_walltime : 1.0;
    
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Total simulation time: " << total_walltime << " s ("
              << total_walltime / 60.0 << " min)" << std::endl;
    std::cout << "  Equilibration time: " << total_equilibration << " s ("
              << 100.0 * total_equilibration / denominator << "%)" << std::endl;
    std::cout << "  Measurement time:   " << total_measurement << " s ("
              << 100.0 * total_measurement / denominator << "%)" << std::endl;
    std::cout << "  Output time:        " << total_output << " s ("
              << 100.0 * total_output / denominator << "%)" << std::endl;
    
    if (all_timings[0].step_time_estimate > 0.0) {
        std::cout << "\nStep performance:" << std::endl;
        std::cout << "  Time per step: " << std::scientific << std::setprecision(3)
                  << all_timings[0].step_time_estimate << " s" << std::endl;
        std::cout << "  Steps per second: " << std::fixed << std::setprecision(0)
                  << 1.0 / all_timings[0].step_time_estimate << std::endl;
    }
    
    std::cout << "\nNumber of " << unit_name << " points: " << all_timings.size() << std::endl;
    std::cout << "Average time per " << unit_name << ": " << std::setprecision(3)
              << total_walltime / all_timings.size() << " s" << std::endl;
    std::cout << "========================================\n" << std::endl;
}

void print_stage_timing(const StageTimings& timings) {
    std::cout << "  Timing: Total=" << std::fixed << std::setprecision(2) << timings.total_time << "s"
              << " (Equilibration=" << timings.equilibration_time << "s"
              << ", Measurement=" << timings.measurement_time << "s"
              << ", Output=" << timings.output_time << "s)" << std::endl;
    
    if (timings.step_time_estimate > 0.0) {
        std::cout << "  Step time: " << std::scientific << std::setprecision(2)
                  << timings.step_time_estimate << " s/step" << std::endl;
    }
}
