/*
 * matsim - Precompute Driver
 *
 * Reads a TOML run file and runs the Ising, Lennard-Jones melting and
 * Cahn-Hilliard engines, writing their arrays under the output directory.
 *
 * Independent jobs (one per Ising material, one per phase-field case) are
 * dealt round-robin over MPI ranks when built with USE_MPI.
 */

#include "../include/ising_phases.h"
#include "../include/md_engine.h"
#include "../include/phase_field_engine.h"
#include "../include/io/configuration_parser.h"
#include "../include/io/output_formatting.h"
#include "../include/io/simulation_output.h"
#include "../include/io/artifact_check.h"
#include "../include/mpi_wrapper.h"
#include "../include/profiling.h"

#include <iostream>
#include <iomanip>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * One temperature sweep per material, materials spread over ranks
 */
void run_ising_engine(const IO::SimulationConfig& config, MPIEnvironment& mpi_env) {
    if (mpi_env.is_master()) {
        IO::print_section_separator("Ising temperature sweeps");
    }

    bool local_success = true;
    const auto& materials = config.ising.materials;

    for (size_t m = 0; m < materials.size(); m++) {
        if (!mpi_env.owns_job(m)) continue;

        IsingMaterial material{materials[m].name, materials[m].curie_temperature};
        try {
            IO::print_subsection_separator("Material " + material.name);
            std::vector<IsingTemperatureResult> results =
                run_temperature_sweep(material, config.ising, config.diagnostics,
                                      get_job_seed(config.seed, m));

            Stopwatch output_watch;
            std::string directory = IO::ising_output_directory(config.output.directory, material.name);
            IO::write_ising_outputs(directory, results);
            std::cout << "  Wrote " << results.size() << " snapshots to " << directory
                      << " (" << std::fixed << std::setprecision(2) << output_watch.elapsed_seconds()
                      << " s)" << std::endl;

            if (config.diagnostics.enable_profiling) {
                std::vector<StageTimings> timings;
                for (const auto& result : results) timings.push_back(result.timings);
                print_profiling_report(timings, "temperature");
            }
        } catch (const std::exception& e) {
            std::cerr << "Rank " << mpi_env.get_rank() << ": Ising sweep for "
                      << material.name << " failed: " << e.what() << std::endl;
            local_success = false;
        }
    }

    if (!mpi_env.all_succeeded(local_success)) {
        throw std::runtime_error("Ising engine failed");
    }
}

/**
 * The melting ramp is a single job and runs on rank 0
 */
void run_melting_engine(const IO::SimulationConfig& config, MPIEnvironment& mpi_env) {
    if (mpi_env.is_master()) {
        IO::print_section_separator("Lennard-Jones melting ramp");
    }

    bool local_success = true;
    if (mpi_env.is_master()) {
        try {
            MeltingTrajectory trajectory = run_melting(config.melting, config.diagnostics, config.seed);

            std::string directory = IO::melting_output_directory(config.output.directory);
            IO::write_melting_outputs(directory, trajectory);
            std::cout << "  Wrote " << trajectory.num_frames() << " frames to " << directory << std::endl;

            if (config.diagnostics.enable_profiling) {
                print_profiling_report(trajectory.stage_timings, "stage");
            }
        } catch (const std::exception& e) {
            std::cerr << "Melting run failed: " << e.what() << std::endl;
            local_success = false;
        }
    }

    if (!mpi_env.all_succeeded(local_success)) {
        throw std::runtime_error("Melting engine failed");
    }
}

/**
 * One Cahn-Hilliard run per case, cases spread over ranks
 *
 * Every case uses the same seed, so all of them start from the same noise
 * (up to their baseline and nucleus). The shared time axis follows from the
 * schedule and is written by rank 0.
 */
void run_spinodal_engine(const IO::SimulationConfig& config, MPIEnvironment& mpi_env) {
    if (mpi_env.is_master()) {
        IO::print_section_separator("Cahn-Hilliard phase separation");
    }

    std::string directory = IO::spinodal_output_directory(config.output.directory);
    bool local_success = true;
    std::vector<StageTimings> case_timings;

    for (size_t c = 0; c < config.spinodal.cases.size(); c++) {
        if (!mpi_env.owns_job(c)) continue;

        const IO::PhaseFieldCaseConfig& case_config = config.spinodal.cases[c];
        try {
            PhaseFieldRun run = run_phase_field_case(case_config, config.spinodal,
                                                     config.diagnostics, config.seed);
            Stopwatch output_watch;
            IO::write_phase_field_case(directory, run);
            run.timings.output_time += output_watch.elapsed_seconds();
            case_timings.push_back(run.timings);
            std::cout << "  Wrote conc_" << run.label << ".npy (" << run.num_frames()
                      << " frames)" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Rank " << mpi_env.get_rank() << ": phase-field case "
                      << case_config.label << " failed: " << e.what() << std::endl;
            local_success = false;
        }
    }

    if (mpi_env.is_master() && local_success) {
        try {
            SnapshotSchedule schedule = schedule_from_config(config.spinodal);
            std::vector<float> times;
            for (long int step : schedule.get_steps()) {
                times.push_back(static_cast<float>(step * config.spinodal.dt));
            }
            PhysicalUnits units = physical_units(config.spinodal.physical);
            IO::write_phase_field_axes(directory, times, units);
            std::cout << "  Time scale " << std::scientific << std::setprecision(3) << units.time_scale
                      << " s, length unit " << units.length_unit << " m" << std::defaultfloat << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Writing phase-field axes failed: " << e.what() << std::endl;
            local_success = false;
        }
    }

    if (config.diagnostics.enable_profiling && !case_timings.empty()) {
        print_profiling_report(case_timings, "case");
    }

    if (!mpi_env.all_succeeded(local_success)) {
        throw std::runtime_error("Phase-field engine failed");
    }
}

/**
 * Re-read every header that was just written (rank 0)
 */
void verify_written_outputs(const IO::SimulationConfig& config) {
    IO::print_subsection_separator("Output check");
    const std::string& base = config.output.directory;

    if (config.runs("ising")) {
        for (const auto& material : config.ising.materials) {
            IO::ArtifactSummary summary =
                IO::verify_ising_artifacts(IO::ising_output_directory(base, material.name));
            std::cout << "  " << summary.directory << ": " << summary.num_frames << " temperatures" << std::endl;
        }
    }
    if (config.runs("melting")) {
        IO::ArtifactSummary summary = IO::verify_melting_artifacts(IO::melting_output_directory(base));
        std::cout << "  " << summary.directory << ": " << summary.num_frames << " frames" << std::endl;
    }
    if (config.runs("spinodal")) {
        std::vector<std::string> labels;
        for (const auto& case_config : config.spinodal.cases) labels.push_back(case_config.label);
        IO::ArtifactSummary summary =
            IO::verify_spinodal_artifacts(IO::spinodal_output_directory(base), labels);
        std::cout << "  " << summary.directory << ": " << summary.num_frames << " frames" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    // Initialize MPI environment
    MPIEnvironment mpi_env(argc, argv);

    // Redirect stdout to /dev/null for non-master ranks
    std::streambuf* cout_backup = nullptr;
    std::ofstream devnull;
    if (!mpi_env.is_master()) {
        devnull.open("/dev/null");
        cout_backup = std::cout.rdbuf();
        std::cout.rdbuf(devnull.rdbuf());
    }

    if (mpi_env.is_master()) {
        IO::print_banner("matsim");
        IO::print_section_separator("Precompute run (" + std::to_string(mpi_env.get_num_ranks()) + " ranks)");
    }

    // Parse command line arguments
    std::string config_file = "simulation.toml";
    if (argc > 1) {
        config_file = argv[1];
    }

    int exit_code = 0;
    try {
        std::cout << "Loading configuration from: " << config_file << std::endl;

        // All ranks load configuration
        IO::SimulationConfig config = IO::ConfigurationParser::load_configuration(config_file);
        IO::print_configuration_summary(config);

        Stopwatch total_watch;
        if (config.runs("ising")) {
            run_ising_engine(config, mpi_env);
        }
        if (config.runs("melting")) {
            run_melting_engine(config, mpi_env);
        }
        if (config.runs("spinodal")) {
            run_spinodal_engine(config, mpi_env);
        }

        double barrier_wait = mpi_env.barrier_with_timing();
        if (mpi_env.is_master()) {
            if (config.diagnostics.enable_profiling && mpi_env.using_mpi()) {
                std::cout << "\nRank 0 waited " << std::fixed << std::setprecision(3) << barrier_wait
                          << " s for the other ranks" << std::endl;
            }
            verify_written_outputs(config);
            std::cout << "\nTotal wall time: " << std::fixed << std::setprecision(2)
                      << total_watch.elapsed_seconds() << " s" << std::endl;
            std::cout << "Results saved under: " << config.output.directory << std::endl;
        }

    } catch (const IO::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const IO::ArtifactError& e) {
        std::cerr << "Output check failed: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    // Restore stdout for non-master ranks
    if (!mpi_env.is_master() && cout_backup) {
        std::cout.rdbuf(cout_backup);
        devnull.close();
    }

    if (exit_code == 0 && mpi_env.is_master()) {
        std::cout << "\nSimulation completed successfully!" << std::endl;
    }
    return exit_code;
}
