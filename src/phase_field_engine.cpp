/*
 * Cahn-Hilliard Phase-Field Engine Implementation
 */

#include "../include/phase_field_engine.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

typedef std::complex<double> Complex;

// ============================================================================
// FREE ENERGY
// ============================================================================

FreeEnergyDerivative FreeEnergyDerivative::double_well(double A) {
    return FreeEnergyDerivative(Kind::DoubleWell, A, Function());
}

FreeEnergyDerivative FreeEnergyDerivative::single_well(double A) {
    return FreeEnergyDerivative(Kind::SingleWell, A, Function());
}

FreeEnergyDerivative FreeEnergyDerivative::custom(Function fn) {
    if (!fn) {
        throw std::invalid_argument("Custom free-energy derivative needs a callable");
    }
    return FreeEnergyDerivative(Kind::Custom, 1.0, fn);
}

FreeEnergyDerivative FreeEnergyDerivative::from_name(const std::string& name, double A) {
    if (name == "double_well") return double_well(A);
    if (name == "single_well") return single_well(A);
    throw std::invalid_argument("Unknown free energy '" + name + "' (expected double_well or single_well)");
}

double FreeEnergyDerivative::operator()(double c) const {
    switch (kind_) {
        case Kind::DoubleWell: return A * (c * c * c - c);
        case Kind::SingleWell: return A * c;
        case Kind::Custom:     return fn(c);
    }
    return 0.0;
}

Eigen::ArrayXXd FreeEnergyDerivative::operator()(const Eigen::ArrayXXd& c) const {
    switch (kind_) {
        case Kind::DoubleWell: return A * (c.cube() - c);
        case Kind::SingleWell: return A * c;
        case Kind::Custom:     return c.unaryExpr(fn);
    }
    return Eigen::ArrayXXd::Zero(c.rows(), c.cols());
}

// ============================================================================
// SNAPSHOT SCHEDULE
// ============================================================================

SnapshotSchedule::SnapshotSchedule(const std::vector<long int>& requested_steps)
    : steps(requested_steps), cursor(0) {

    if (steps.empty()) {
        throw std::invalid_argument("Snapshot schedule is empty");
    }
    std::sort(steps.begin(), steps.end());
    steps.erase(std::unique(steps.begin(), steps.end()), steps.end());
    if (steps.front() < 0) {
        throw std::invalid_argument("Snapshot steps must be non-negative");
    }
}

SnapshotSchedule SnapshotSchedule::from_density(int early_interval, int early_until,
                                                int late_interval, int total_steps) {
    if (early_interval <= 0 || late_interval <= 0) {
        throw std::invalid_argument("Snapshot intervals must be positive");
    }
    if (total_steps < 0 || early_until < 0) {
        throw std::invalid_argument("Snapshot step limits must be non-negative");
    }

    std::vector<long int> steps;
    long int limit = std::min(early_until, total_steps);
    for (long int s = 0; s <= limit; s += early_interval) {
        steps.push_back(s);
    }
    long int first_late = (limit / late_interval + 1) * static_cast<long int>(late_interval);
    for (long int s = first_late; s <= total_steps; s += late_interval) {
        steps.push_back(s);
    }
    return SnapshotSchedule(steps);
}

bool SnapshotSchedule::is_due(long int step) {
    while (cursor < steps.size() && steps[cursor] < step) {
        cursor++;
    }
    if (cursor < steps.size() && steps[cursor] == step) {
        cursor++;
        return true;
    }
    return false;
}

SnapshotSchedule schedule_from_config(const IO::SpinodalConfig& config) {
    if (!config.checkpoints.empty()) {
        std::vector<long int> steps(config.checkpoints.begin(), config.checkpoints.end());
        return SnapshotSchedule(steps);
    }
    return SnapshotSchedule::from_density(config.early_interval, config.early_until,
                                          config.late_interval, config.total_steps);
}

// ============================================================================
// SPECTRAL GRID
// ============================================================================

SpectralGrid2D::SpectralGrid2D(int nx, int ny, double dx)
    : nx(nx), ny(ny) {

    if (nx <= 0 || ny <= 0) {
        throw std::invalid_argument("Phase-field grid must have positive size");
    }
    if (dx <= 0.0) {
        throw std::invalid_argument("Phase-field grid spacing must be positive");
    }

    Eigen::ArrayXd kx = wavenumbers(nx, dx);
    Eigen::ArrayXd ky = wavenumbers(ny, dx);

    k2.resize(nx, ny);
    for (int j = 0; j < ny; j++) {
        for (int i = 0; i < nx; i++) {
            k2(i, j) = kx(i) * kx(i) + ky(j) * ky(j);
        }
    }
    k4 = k2.square();
}

Eigen::ArrayXd SpectralGrid2D::wavenumbers(int n, double dx) {
    Eigen::ArrayXd k(n);
    for (int i = 0; i < n; i++) {
        int index = (i <= (n - 1) / 2) ? i : i - n;
        k(i) = 2.0 * M_PI * index / (n * dx);
    }
    return k;
}

// Row transforms then column transforms; inverse is scaled by 1/n per axis
void SpectralGrid2D::transform(Eigen::ArrayXXcd& data, bool inverse) {
    std::vector<Complex> in(nx), out(nx);
    for (int j = 0; j < ny; j++) {
        for (int i = 0; i < nx; i++) in[i] = data(i, j);
        if (inverse) fft.inv(out, in);
        else fft.fwd(out, in);
        for (int i = 0; i < nx; i++) data(i, j) = out[i];
    }

    in.resize(ny);
    out.resize(ny);
    for (int i = 0; i < nx; i++) {
        for (int j = 0; j < ny; j++) in[j] = data(i, j);
        if (inverse) fft.inv(out, in);
        else fft.fwd(out, in);
        for (int j = 0; j < ny; j++) data(i, j) = out[j];
    }
}

Eigen::ArrayXXcd SpectralGrid2D::forward(const Eigen::ArrayXXd& field) {
    Eigen::ArrayXXcd spectrum = field.cast<Complex>();
    transform(spectrum, false);
    return spectrum;
}

Eigen::ArrayXXd SpectralGrid2D::inverse_real(const Eigen::ArrayXXcd& spectrum) {
    Eigen::ArrayXXcd field = spectrum;
    transform(field, true);
    return field.real();
}

// ============================================================================
// SOLVER
// ============================================================================

void initialize_field(CahnHilliardState& state, SpectralGrid2D& grid,
                      const IO::PhaseFieldCaseConfig& case_config, RandomGenerator& rng) {
    const int nx = grid.get_nx();
    const int ny = grid.get_ny();

    state.c.resize(nx, ny);
    for (int i = 0; i < nx; i++) {
        for (int j = 0; j < ny; j++) {
            state.c(i, j) = case_config.baseline +
                            case_config.noise_amplitude * (rng.uniform() - 0.5);
        }
    }

    if (case_config.nucleus_radius > 0.0) {
        double r2 = case_config.nucleus_radius * case_config.nucleus_radius;
        double cx = nx / 2;
        double cy = ny / 2;
        for (int i = 0; i < nx; i++) {
            for (int j = 0; j < ny; j++) {
                double d2 = (i - cx) * (i - cx) + (j - cy) * (j - cy);
                if (d2 <= r2) state.c(i, j) = case_config.nucleus_value;
            }
        }
    }

    state.c_hat = grid.forward(state.c);
    state.step = 0;
}

void cahn_hilliard_step(CahnHilliardState& state, SpectralGrid2D& grid,
                        const CahnHilliardParameters& params,
                        const FreeEnergyDerivative& free_energy) {
    const Eigen::ArrayXXd& k2 = grid.get_k2();
    const Eigen::ArrayXXd& k4 = grid.get_k4();
    const double dt_m = params.dt * params.mobility;

    // state.c already holds Re ifft(c_hat)
    Eigen::ArrayXXcd k2_c_hat = state.c_hat * k2.cast<Complex>();
    Eigen::ArrayXXd mu = free_energy(state.c) - params.kappa * grid.inverse_real(k2_c_hat);
    Eigen::ArrayXXcd mu_hat = grid.forward(mu);

    // k = 0: k2 = k4 = 0, so the mean mode passes through with denominator 1
    Eigen::ArrayXXd inv_denom = (1.0 + dt_m * params.kappa * k4).inverse();
    state.c_hat = (state.c_hat - (dt_m * k2).cast<Complex>() * mu_hat) * inv_denom.cast<Complex>();

    if (params.damping > 0.0) {
        Eigen::ArrayXXd factor = (-params.damping * params.dt * k2).exp();
        factor(0, 0) = 1.0;
        state.c_hat *= factor.cast<Complex>();
    }

    state.c = grid.inverse_real(state.c_hat);
    state.step++;
}

PhaseFieldRun run_phase_field_case(const IO::PhaseFieldCaseConfig& case_config,
                                   const IO::SpinodalConfig& config,
                                   const IO::DiagnosticConfig& diagnostics,
                                   long int seed) {
    if (config.dt <= 0.0) {
        throw std::invalid_argument("Phase-field dt must be positive");
    }

    SnapshotSchedule schedule = schedule_from_config(config);
    SpectralGrid2D grid(config.nx, config.ny, config.dx);
    FreeEnergyDerivative free_energy = FreeEnergyDerivative::from_name(case_config.free_energy, case_config.A);

    CahnHilliardParameters params;
    params.dt = config.dt;
    params.kappa = config.kappa;
    params.mobility = config.mobility;
    params.damping = case_config.damping;

    RandomGenerator rng(seed);
    CahnHilliardState state;
    initialize_field(state, grid, case_config, rng);

    std::cout << "Phase-field case '" << case_config.label << "': " << config.nx << "x" << config.ny
              << ", " << schedule.size() << " snapshots up to step " << schedule.last_step() << std::endl;

    PhaseFieldRun run;
    run.label = case_config.label;
    run.frames.reserve(schedule.size());
    run.times.reserve(schedule.size());

    Stopwatch total_watch;
    double output_time = 0.0;
    size_t reported = 0;

    for (long int step = 0; step <= schedule.last_step(); step++) {
        if (step > 0) {
            cahn_hilliard_step(state, grid, params, free_energy);
        }
        if (!schedule.is_due(step)) continue;

        Stopwatch copy_watch;
        run.frames.push_back(state.c.cast<float>());
        run.times.push_back(static_cast<float>(step * config.dt));
        output_time += copy_watch.elapsed_seconds();

        reported++;
        bool report = diagnostics.progress_interval <= 1 ||
                      reported % diagnostics.progress_interval == 0 ||
                      reported == schedule.size();
        if (report) {
            std::cout << "  " << case_config.label << ": step " << std::setw(6) << step
                      << "  t = " << std::fixed << std::setprecision(2) << step * config.dt
                      << "  var(c) = " << std::scientific << std::setprecision(4) << state.variance()
                      << std::defaultfloat << std::endl;
        }
    }

    run.timings.total_time = total_watch.elapsed_seconds();
    run.timings.output_time = output_time;
    run.timings.equilibration_time = run.timings.total_time - output_time;
    if (schedule.last_step() > 0) {
        run.timings.step_time_estimate = run.timings.equilibration_time / schedule.last_step();
    }
    return run;
}

PhysicalUnits physical_units(const IO::PhysicalUnitsConfig& physical) {
    if (physical.free_energy_density <= 0.0 || physical.gradient_coefficient <= 0.0 ||
        physical.mobility <= 0.0) {
        throw std::invalid_argument("Physical unit constants must be positive");
    }
    PhysicalUnits units;
    units.time_scale = physical.gradient_coefficient /
                       (physical.mobility * physical.free_energy_density * physical.free_energy_density);
    units.length_unit = std::sqrt(physical.gradient_coefficient / physical.free_energy_density);
    return units;
}
