#pragma once
#include <string>
#include <vector>

namespace IO {

/**
 * Material in an Ising temperature sweep
 */
struct MaterialSpec {
    std::string name;            // Used as output sub-directory (e.g. "Fe")
    double curie_temperature;    // Real Curie temperature in K
};

/**
 * Ising sweep parameters
 */
struct IsingConfig {
    int lattice_size = 64;
    int equilibration_steps = 900;     // Discarded sweeps per temperature
    int measurement_steps = 200;       // Averaged sweeps per temperature

    // Ascending temperature scan in K: t_min, t_min + t_step, ..., <= t_max
    double t_min = 0.0;
    double t_max = 1200.0;
    double t_step = 5.0;

    std::vector<MaterialSpec> materials;

    // Expand the scan into the explicit ascending list of temperatures
    std::vector<double> temperatures() const {
        std::vector<double> temps;
        if (t_step <= 0.0) return temps;
        int count = static_cast<int>((t_max - t_min) / t_step + 1e-9) + 1;
        for (int i = 0; i < count; i++) {
            temps.push_back(t_min + i * t_step);
        }
        return temps;
    }
};

/**
 * Lennard-Jones melting run parameters (reduced LJ units)
 */
struct MeltingConfig {
    int cells = 6;                    // Cubic lattice cells per side, N = cells^3
    double lattice_constant = 1.0;
    double mass = 1.0;
    double dt = 0.001;
    int steps_per_temperature = 400;
    int record_interval = 50;

    // Temperature ramp: t_count values from t_start to t_stop inclusive
    double t_start = 0.2;
    double t_stop = 2.0;
    int t_count = 40;

    double epsilon = 1.0;
    double sigma = 1.0;
    double cutoff = 2.5;              // In units of sigma
    double velocity_clamp = 100.0;
    int rdf_bins = 50;

    std::vector<double> temperatures() const {
        std::vector<double> temps;
        if (t_count <= 0) return temps;
        if (t_count == 1) {
            temps.push_back(t_start);
            return temps;
        }
        double step = (t_stop - t_start) / (t_count - 1);
        for (int i = 0; i < t_count; i++) {
            temps.push_back(t_start + i * step);
        }
        return temps;
    }
};

/**
 * A single Cahn-Hilliard run (one output label)
 */
struct PhaseFieldCaseConfig {
    std::string label;                   // conc_<label>.npy
    std::string free_energy = "double_well";  // "double_well" or "single_well"
    double A = 1.0;
    double baseline = 0.0;
    double noise_amplitude = 0.01;       // c = baseline + amplitude * (u - 0.5)
    double damping = 0.0;                // exp(-damping k^2 dt) per step, 0 = off
    double nucleus_radius = 0.0;         // Seeded disc at the grid centre, 0 = none
    double nucleus_value = -1.0;
};

/**
 * Physical constants of the alloy used to convert dimensionless output
 */
struct PhysicalUnitsConfig {
    double free_energy_density = 1.0e9;    // A_phys [J/m^3]
    double gradient_coefficient = 1.0e-9;  // kappa_phys [J/m]
    double mobility = 1.0e-18;             // M_phys [m^5/(J s)]
};

/**
 * Spinodal decomposition / nucleation run parameters
 */
struct SpinodalConfig {
    int nx = 256;
    int ny = 256;
    double dx = 1.0;
    double dt = 0.01;
    double kappa = 1.0;
    double mobility = 1.0;

    // Either an explicit checkpoint list, or the dense/sparse generator below
    std::vector<int> checkpoints;
    int early_interval = 100;
    int early_until = 2000;
    int late_interval = 1000;
    int total_steps = 48000;

    std::vector<PhaseFieldCaseConfig> cases;
    PhysicalUnitsConfig physical;
};

/**
 * Output configuration
 */
struct OutputConfig {
    std::string directory = ".";
};

/**
 * Diagnostic and profiling options
 */
struct DiagnosticConfig {
    bool enable_profiling = false;          // Enable timing/profiling output
    bool estimate_autocorrelation = true;   // Lag-1 autocorrelation of the |M| series
    int progress_interval = 10;             // Print progress every N temperatures/stages
};

/**
 * Complete run configuration
 */
struct SimulationConfig {
    std::string simulation_type = "all";    // "all", "ising", "melting", "spinodal"
    long int seed = -12345;

    OutputConfig output;
    DiagnosticConfig diagnostics;

    IsingConfig ising;
    MeltingConfig melting;
    SpinodalConfig spinodal;

    bool runs(const std::string& engine) const {
        return simulation_type == "all" || simulation_type == engine;
    }
};

} // namespace IO
