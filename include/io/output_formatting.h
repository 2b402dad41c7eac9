/*
 * Output Formatting Utilities
 *
 * Functions for formatted console output
 */

#ifndef OUTPUT_FORMATTING_H
#define OUTPUT_FORMATTING_H

#include "config_types.h"
#include <iostream>
#include <iomanip>
#include <string>

namespace IO {

/**
 * Print the program banner
 */
inline void print_banner(const std::string& program_name) {
    std::cout << "\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  Precompute engines for materials science demos\n";
    std::cout << "  Ising magnetization | Lennard-Jones melting | Cahn-Hilliard phase separation\n";
    std::cout << "\n";
}

/**
 * Print a section separator
 */
inline void print_section_separator(const std::string& title = "") {
    std::cout << "\n";
    std::cout << "========================================";
    if (!title.empty()) {
        std::cout << "\n  " << title;
    }
    std::cout << "\n========================================\n";
}

/**
 * Print a subsection separator
 */
inline void print_subsection_separator(const std::string& title = "") {
    std::cout << "\n----------------------------------------\n";
    if (!title.empty()) {
        std::cout << "  " << title << "\n";
        std::cout << "----------------------------------------\n";
    }
}

/**
 * Print the engine parameters that determine the output shapes
 */
inline void print_configuration_summary(const SimulationConfig& config) {
    std::cout << "\nConfiguration summary:" << std::endl;
    std::cout << "  Seed: " << config.seed << std::endl;
    if (config.runs("ising")) {
        std::cout << "  Ising: L = " << config.ising.lattice_size << ", "
                  << config.ising.equilibration_steps << " equilibration + "
                  << config.ising.measurement_steps << " measurement sweeps, T = "
                  << config.ising.t_min << ".." << config.ising.t_max << " K step "
                  << config.ising.t_step << std::endl;
        std::cout << "    Materials: ";
        for (const auto& material : config.ising.materials) {
            std::cout << material.name << "(Tc=" << material.curie_temperature << ") ";
        }
        std::cout << std::endl;
    }
    if (config.runs("melting")) {
        std::cout << "  Melting: " << config.melting.cells << "^3 particles, "
                  << config.melting.steps_per_temperature << " steps x " << config.melting.t_count
                  << " stages, T = " << config.melting.t_start << ".." << config.melting.t_stop
                  << ", record every " << config.melting.record_interval << std::endl;
    }
    if (config.runs("spinodal")) {
        std::cout << "  Spinodal: " << config.spinodal.nx << "x" << config.spinodal.ny
                  << ", dt = " << config.spinodal.dt << ", cases: ";
        for (const auto& case_config : config.spinodal.cases) {
            std::cout << case_config.label << "(" << case_config.free_energy << ") ";
        }
        std::cout << std::endl;
    }
    std::cout << std::endl;
}

} // namespace IO

#endif // OUTPUT_FORMATTING_H
