/*
 * Configuration Parser for the Simulation Engines
 *
 * TOML Configuration Reference:
 * =============================
 *
 * [simulation]
 *   type = "all"                        # "all", "ising", "melting" or "spinodal" (default: "all")
 *   seed = -12345                       # Random number seed (default: -12345)
 *
 * [output]
 *   directory = "."                     # Engines write to <directory>/ising, /melting, /spinodal
 *
 * [ising]
 *   lattice_size = 64                   # L x L periodic lattice
 *   equilibration_steps = 900           # Discarded sweeps per temperature
 *   measurement_steps = 200             # Averaged sweeps per temperature
 *   t_min = 0.0                         # Temperature scan in K (ascending)
 *   t_max = 1200.0
 *   t_step = 5.0
 *
 *   [[ising.materials]]                 # One sweep per material (default: Fe, Ni, Gd)
 *   name = "Fe"
 *   curie_temperature = 1043.0          # J = Tc / 2.269
 *
 * [melting]
 *   cells = 6                           # N = cells^3 particles on a cubic lattice
 *   lattice_constant = 1.0
 *   mass = 1.0
 *   dt = 0.001
 *   steps_per_temperature = 400
 *   record_interval = 50                # Snapshot every N steps within a stage
 *   t_start = 0.2                       # t_count temperatures from t_start to t_stop
 *   t_stop = 2.0
 *   t_count = 40
 *   epsilon = 1.0
 *   sigma = 1.0
 *   cutoff = 2.5                        # In units of sigma
 *   velocity_clamp = 100.0
 *   rdf_bins = 50
 *
 * [spinodal]
 *   nx = 256
 *   ny = 256
 *   dx = 1.0
 *   dt = 0.01
 *   kappa = 1.0
 *   mobility = 1.0
 *
 *   # Snapshot steps, either explicit:
 *   checkpoints = [0, 100, 500, 2000]
 *   # or generated (default): every early_interval up to early_until,
 *   # then every late_interval up to total_steps
 *   early_interval = 100
 *   early_until = 2000
 *   late_interval = 1000
 *   total_steps = 48000
 *
 *   [[spinodal.cases]]                  # default: unstable, stable, nucleation
 *   label = "unstable"                  # Output file conc_<label>.npy
 *   free_energy = "double_well"         # "double_well" A(c^3-c) or "single_well" A c
 *   A = 1.0
 *   baseline = 0.0
 *   noise_amplitude = 0.01
 *   damping = 0.0                       # Spectral damping exp(-damping k^2 dt)
 *   nucleus_radius = 0.0                # Seeded disc at the centre, 0 = none
 *   nucleus_value = -1.0
 *
 *   [spinodal.physical]                 # Conversion to SI units (phys_params.npy)
 *   free_energy_density = 1.0e9
 *   gradient_coefficient = 1.0e-9
 *   mobility = 1.0e-18
 *
 * [diagnostics]
 *   enable_profiling = false            # Enable timing/performance profiling
 *   estimate_autocorrelation = true     # Lag-1 autocorrelation of |M| per temperature
 *   progress_interval = 10              # Progress line every N temperatures/stages/snapshots
 */

#include "../../include/io/configuration_parser.h"
#include <cmath>
#include <iostream>
#include <limits>
#include <set>

#include <toml.hpp>  // toml11 library for TOML parsing

namespace IO {

// Accept both integer and floating TOML values for real parameters
static double find_number_or(const toml::value& table, const std::string& key, double fallback) {
    if (!table.contains(key)) return fallback;
    const auto& value = toml::find(table, key);
    if (value.is_floating()) return value.as_floating();
    if (value.is_integer()) return static_cast<double>(value.as_integer());
    throw ConfigurationError("'" + key + "' must be a number");
}

static void parse_ising_section(const toml::value& ising, IsingConfig& config) {
    config.lattice_size = toml::find_or<int>(ising, "lattice_size", 64);
    config.equilibration_steps = toml::find_or<int>(ising, "equilibration_steps", 900);
    config.measurement_steps = toml::find_or<int>(ising, "measurement_steps", 200);
    config.t_min = find_number_or(ising, "t_min", 0.0);
    config.t_max = find_number_or(ising, "t_max", 1200.0);
    config.t_step = find_number_or(ising, "t_step", 5.0);

    if (ising.contains("materials")) {
        const auto& materials_value = toml::find(ising, "materials");
        if (!materials_value.is_array()) {
            throw ConfigurationError("ising.materials must be an array of tables");
        }
        config.materials.clear();
        for (const auto& material : materials_value.as_array()) {
            MaterialSpec spec;
            spec.name = toml::find<std::string>(material, "name");
            spec.curie_temperature = find_number_or(material, "curie_temperature", -1.0);
            config.materials.push_back(spec);
        }
    }
}

static void parse_melting_section(const toml::value& melting, MeltingConfig& config) {
    config.cells = toml::find_or<int>(melting, "cells", 6);
    config.lattice_constant = find_number_or(melting, "lattice_constant", 1.0);
    config.mass = find_number_or(melting, "mass", 1.0);
    config.dt = find_number_or(melting, "dt", 0.001);
    config.steps_per_temperature = toml::find_or<int>(melting, "steps_per_temperature", 400);
    config.record_interval = toml::find_or<int>(melting, "record_interval", 50);
    config.t_start = find_number_or(melting, "t_start", 0.2);
    config.t_stop = find_number_or(melting, "t_stop", 2.0);
    config.t_count = toml::find_or<int>(melting, "t_count", 40);
    config.epsilon = find_number_or(melting, "epsilon", 1.0);
    config.sigma = find_number_or(melting, "sigma", 1.0);
    config.cutoff = find_number_or(melting, "cutoff", 2.5);
    config.velocity_clamp = find_number_or(melting, "velocity_clamp", 100.0);
    config.rdf_bins = toml::find_or<int>(melting, "rdf_bins", 50);
}

static PhaseFieldCaseConfig parse_phase_field_case(const toml::value& entry) {
    PhaseFieldCaseConfig case_config;
    case_config.label = toml::find<std::string>(entry, "label");
    case_config.free_energy = toml::find_or<std::string>(entry, "free_energy", "double_well");
    case_config.A = find_number_or(entry, "A", 1.0);
    case_config.baseline = find_number_or(entry, "baseline", 0.0);
    case_config.noise_amplitude = find_number_or(entry, "noise_amplitude", 0.01);
    case_config.damping = find_number_or(entry, "damping", 0.0);
    case_config.nucleus_radius = find_number_or(entry, "nucleus_radius", 0.0);
    case_config.nucleus_value = find_number_or(entry, "nucleus_value", -1.0);
    return case_config;
}

static void parse_spinodal_section(const toml::value& spinodal, SpinodalConfig& config) {
    config.nx = toml::find_or<int>(spinodal, "nx", 256);
    config.ny = toml::find_or<int>(spinodal, "ny", config.nx);
    config.dx = find_number_or(spinodal, "dx", 1.0);
    config.dt = find_number_or(spinodal, "dt", 0.01);
    config.kappa = find_number_or(spinodal, "kappa", 1.0);
    config.mobility = find_number_or(spinodal, "mobility", 1.0);

    if (spinodal.contains("checkpoints")) {
        const auto& checkpoints_value = toml::find(spinodal, "checkpoints");
        if (!checkpoints_value.is_array()) {
            throw ConfigurationError("spinodal.checkpoints must be an array of step indices");
        }
        config.checkpoints.clear();
        for (const auto& step : checkpoints_value.as_array()) {
            if (!step.is_integer()) {
                throw ConfigurationError("spinodal.checkpoints must contain integers only");
            }
            toml::integer value = step.as_integer();
            if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
                throw ConfigurationError("spinodal checkpoint " + std::to_string(value) + " is out of range");
            }
            config.checkpoints.push_back(static_cast<int>(value));
        }
        if (config.checkpoints.empty()) {
            throw ConfigurationError("spinodal.checkpoints is empty");
        }
    }
    config.early_interval = toml::find_or<int>(spinodal, "early_interval", 100);
    config.early_until = toml::find_or<int>(spinodal, "early_until", 2000);
    config.late_interval = toml::find_or<int>(spinodal, "late_interval", 1000);
    config.total_steps = toml::find_or<int>(spinodal, "total_steps", 48000);

    if (spinodal.contains("cases")) {
        const auto& cases_value = toml::find(spinodal, "cases");
        if (!cases_value.is_array()) {
            throw ConfigurationError("spinodal.cases must be an array of tables");
        }
        config.cases.clear();
        for (const auto& entry : cases_value.as_array()) {
            config.cases.push_back(parse_phase_field_case(entry));
        }
    }

    if (spinodal.contains("physical")) {
        const auto& physical = toml::find(spinodal, "physical");
        config.physical.free_energy_density = find_number_or(physical, "free_energy_density", 1.0e9);
        config.physical.gradient_coefficient = find_number_or(physical, "gradient_coefficient", 1.0e-9);
        config.physical.mobility = find_number_or(physical, "mobility", 1.0e-18);
    }
}

SimulationConfig ConfigurationParser::load_configuration(const std::string& toml_file) {
    SimulationConfig config;
    config.ising.materials = default_materials();
    config.spinodal.cases = default_phase_field_cases();

    try {
        parse_toml_file(toml_file, config);
        validate_configuration(config);

        std::cout << "Configuration loaded successfully:" << std::endl;
        std::cout << "  - Simulation type: " << config.simulation_type << std::endl;
        std::cout << "  - Output directory: " << config.output.directory << std::endl;
        if (config.runs("ising")) {
            std::cout << "  - Ising: " << config.ising.materials.size() << " materials, L = "
                      << config.ising.lattice_size << ", " << config.ising.temperatures().size()
                      << " temperatures" << std::endl;
        }
        if (config.runs("melting")) {
            std::cout << "  - Melting: N = " << config.melting.cells * config.melting.cells * config.melting.cells
                      << ", " << config.melting.t_count << " stages" << std::endl;
        }
        if (config.runs("spinodal")) {
            std::cout << "  - Spinodal: " << config.spinodal.nx << "x" << config.spinodal.ny
                      << " grid, " << config.spinodal.cases.size() << " cases" << std::endl;
        }

        return config;

    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError("Failed to load configuration: " + std::string(e.what()));
    }
}

void ConfigurationParser::parse_toml_file(const std::string& toml_file, SimulationConfig& config) {
    try {
        // Parse TOML file using toml11
        const auto data = toml::parse(toml_file);

        if (data.contains("simulation")) {
            const auto sim = toml::find(data, "simulation");
            config.simulation_type = toml::find_or<std::string>(sim, "type", "all");
            config.seed = toml::find_or<long>(sim, "seed", -12345);
        }

        if (data.contains("output")) {
            const auto output = toml::find(data, "output");
            config.output.directory = toml::find_or<std::string>(output, "directory", ".");
        }

        if (data.contains("ising")) {
            parse_ising_section(toml::find(data, "ising"), config.ising);
        }
        if (data.contains("melting")) {
            parse_melting_section(toml::find(data, "melting"), config.melting);
        }
        if (data.contains("spinodal")) {
            parse_spinodal_section(toml::find(data, "spinodal"), config.spinodal);
        }

        // Parse diagnostics section (optional)
        if (data.contains("diagnostics")) {
            const auto diag = toml::find(data, "diagnostics");
            config.diagnostics.enable_profiling = toml::find_or<bool>(diag, "enable_profiling", false);
            config.diagnostics.estimate_autocorrelation = toml::find_or<bool>(diag, "estimate_autocorrelation", true);
            config.diagnostics.progress_interval = toml::find_or<int>(diag, "progress_interval", 10);
        }

    } catch (const ConfigurationError&) {
        throw;
    } catch (const toml::syntax_error& e) {
        throw ConfigurationError("TOML syntax error in " + toml_file + ": " + e.what());
    } catch (const toml::type_error& e) {
        throw ConfigurationError("TOML type error in " + toml_file + ": " + e.what());
    } catch (const std::exception& e) {
        throw ConfigurationError("Error parsing TOML file " + toml_file + ": " + e.what());
    }
}

void ConfigurationParser::validate_configuration(const SimulationConfig& config) {
    const std::string& type = config.simulation_type;
    if (type != "all" && type != "ising" && type != "melting" && type != "spinodal") {
        throw ConfigurationError("Unknown simulation type: " + type +
                                 " (expected 'all', 'ising', 'melting' or 'spinodal')");
    }
    if (config.seed > 4294967295L || config.seed < -4294967295L) {
        throw ConfigurationError("simulation.seed must lie within +/-4294967295");
    }
    if (config.output.directory.empty()) {
        throw ConfigurationError("Output directory must not be empty");
    }
    if (config.diagnostics.progress_interval <= 0) {
        throw ConfigurationError("diagnostics.progress_interval must be positive");
    }

    if (config.runs("ising")) {
        const IsingConfig& ising = config.ising;
        if (ising.lattice_size <= 0) {
            throw ConfigurationError("Lattice size must be positive");
        }
        if (ising.equilibration_steps < 0 || ising.measurement_steps <= 0) {
            throw ConfigurationError("Ising sweep counts must be positive");
        }
        if (ising.t_min < 0.0 || ising.t_max < ising.t_min) {
            throw ConfigurationError("Ising temperatures must satisfy 0 <= t_min <= t_max");
        }
        if (ising.t_step <= 0.0) {
            throw ConfigurationError("Temperature step must be positive");
        }
        // Snapshots are named by whole kelvin
        if (ising.t_min != std::floor(ising.t_min) || ising.t_step != std::floor(ising.t_step)) {
            throw ConfigurationError("Ising t_min and t_step must be whole numbers of kelvin");
        }
        if (ising.materials.empty()) {
            throw ConfigurationError("No Ising materials given");
        }
        std::set<std::string> names;
        for (const auto& material : ising.materials) {
            if (material.name.empty()) {
                throw ConfigurationError("Ising material name must not be empty");
            }
            if (material.curie_temperature <= 0.0) {
                throw ConfigurationError("Material '" + material.name + "' needs a positive curie_temperature");
            }
            if (!names.insert(material.name).second) {
                throw ConfigurationError("Duplicate Ising material: " + material.name);
            }
        }
    }

    if (config.runs("melting")) {
        const MeltingConfig& melting = config.melting;
        if (melting.cells <= 0) {
            throw ConfigurationError("melting.cells must be positive (N = cells^3 particles)");
        }
        if (melting.lattice_constant <= 0.0 || melting.mass <= 0.0 || melting.dt <= 0.0) {
            throw ConfigurationError("melting lattice_constant, mass and dt must be positive");
        }
        if (melting.steps_per_temperature <= 0 || melting.record_interval <= 0) {
            throw ConfigurationError("melting steps_per_temperature and record_interval must be positive");
        }
        if (melting.t_count <= 0) {
            throw ConfigurationError("melting temperature schedule is empty");
        }
        if (melting.t_start < 0.0 || melting.t_stop < melting.t_start) {
            throw ConfigurationError("melting temperatures must satisfy 0 <= t_start <= t_stop");
        }
        if (melting.epsilon <= 0.0 || melting.sigma <= 0.0 || melting.cutoff <= 0.0) {
            throw ConfigurationError("Lennard-Jones epsilon, sigma and cutoff must be positive");
        }
        if (melting.velocity_clamp <= 0.0 || melting.rdf_bins <= 0) {
            throw ConfigurationError("melting velocity_clamp and rdf_bins must be positive");
        }
    }

    if (config.runs("spinodal")) {
        const SpinodalConfig& spinodal = config.spinodal;
        if (spinodal.nx <= 0 || spinodal.ny <= 0) {
            throw ConfigurationError("spinodal grid size must be positive");
        }
        if (spinodal.dx <= 0.0 || spinodal.dt <= 0.0) {
            throw ConfigurationError("spinodal dx and dt must be positive");
        }
        if (spinodal.kappa <= 0.0 || spinodal.mobility <= 0.0) {
            throw ConfigurationError("spinodal kappa and mobility must be positive");
        }
        if (spinodal.checkpoints.empty()) {
            if (spinodal.early_interval <= 0 || spinodal.late_interval <= 0) {
                throw ConfigurationError("spinodal snapshot intervals must be positive");
            }
            if (spinodal.early_until < 0 || spinodal.total_steps < 0) {
                throw ConfigurationError("spinodal early_until and total_steps must be non-negative");
            }
        } else {
            for (int step : spinodal.checkpoints) {
                if (step < 0) {
                    throw ConfigurationError("spinodal checkpoints must be non-negative");
                }
            }
        }
        if (spinodal.cases.empty()) {
            throw ConfigurationError("No spinodal cases given");
        }
        std::set<std::string> labels;
        for (const auto& case_config : spinodal.cases) {
            if (case_config.label.empty()) {
                throw ConfigurationError("spinodal case label must not be empty");
            }
            if (!labels.insert(case_config.label).second) {
                throw ConfigurationError("Duplicate spinodal case: " + case_config.label);
            }
            if (case_config.free_energy != "double_well" && case_config.free_energy != "single_well") {
                throw ConfigurationError("Unknown free_energy '" + case_config.free_energy +
                                         "' in case " + case_config.label);
            }
            if (case_config.noise_amplitude < 0.0 || case_config.damping < 0.0 ||
                case_config.nucleus_radius < 0.0) {
                throw ConfigurationError("noise_amplitude, damping and nucleus_radius must be non-negative in case " +
                                         case_config.label);
            }
        }
        const PhysicalUnitsConfig& physical = spinodal.physical;
        if (physical.free_energy_density <= 0.0 || physical.gradient_coefficient <= 0.0 ||
            physical.mobility <= 0.0) {
            throw ConfigurationError("spinodal.physical constants must be positive");
        }
    }
}

std::vector<MaterialSpec> ConfigurationParser::default_materials() {
    std::vector<MaterialSpec> materials;
    materials.push_back({"Fe", 1043.0});
    materials.push_back({"Ni", 627.0});
    materials.push_back({"Gd", 293.0});
    return materials;
}

std::vector<PhaseFieldCaseConfig> ConfigurationParser::default_phase_field_cases() {
    std::vector<PhaseFieldCaseConfig> cases(3);

    cases[0].label = "unstable";
    cases[0].free_energy = "double_well";

    cases[1].label = "stable";
    cases[1].free_energy = "single_well";

    // Metastable matrix just outside the spinodal (|c| > 1/sqrt(3)) with a seeded nucleus
    cases[2].label = "nucleation";
    cases[2].free_energy = "double_well";
    cases[2].baseline = 0.6;
    cases[2].damping = 0.05;
    cases[2].nucleus_radius = 8.0;
    cases[2].nucleus_value = -1.0;

    return cases;
}

} // namespace IO
