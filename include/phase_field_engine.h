/*
 * Cahn-Hilliard Phase-Field Engine Header
 *
 * Semi-implicit spectral integration of dc/dt = M lap(f'(c) - kappa lap c)
 * on a periodic Nx x Ny grid. The nonlinear term is explicit, the
 * biharmonic term implicit. 2D transforms are built from Eigen's 1D FFT
 * applied along rows and columns.
 */

#ifndef PHASE_FIELD_ENGINE_H
#define PHASE_FIELD_ENGINE_H

#include "random.h"
#include "profiling.h"
#include "io/config_types.h"
#include <eigen3/Eigen/Dense>
#include <eigen3/unsupported/Eigen/FFT>
#include <complex>
#include <functional>
#include <string>
#include <vector>

/**
 * Local free-energy derivative f'(c)
 * DoubleWell: A (c^3 - c), SingleWell: A c, Custom: injected function
 */
class FreeEnergyDerivative {
public:
    enum class Kind { DoubleWell, SingleWell, Custom };
    typedef std::function<double(double)> Function;

    static FreeEnergyDerivative double_well(double A);
    static FreeEnergyDerivative single_well(double A);
    static FreeEnergyDerivative custom(Function fn);

    // "double_well" or "single_well"
    static FreeEnergyDerivative from_name(const std::string& name, double A);

    double operator()(double c) const;
    Eigen::ArrayXXd operator()(const Eigen::ArrayXXd& c) const;

    Kind kind() const { return kind_; }
    double amplitude() const { return A; }

private:
    FreeEnergyDerivative(Kind kind, double A, Function fn)
        : kind_(kind), A(A), fn(fn) {}

    Kind kind_;
    double A;
    Function fn;
};

/**
 * Sorted, unique step indices at which a snapshot is taken
 * Consulted once per step; the cursor only moves forward.
 */
class SnapshotSchedule {
private:
    std::vector<long int> steps;
    size_t cursor;

public:
    explicit SnapshotSchedule(const std::vector<long int>& requested_steps);

    // 0, e, 2e, ... up to early_until, then multiples of late_interval up to total_steps
    static SnapshotSchedule from_density(int early_interval, int early_until,
                                         int late_interval, int total_steps);

    bool is_due(long int step);

    size_t size() const { return steps.size(); }
    long int last_step() const { return steps.back(); }
    const std::vector<long int>& get_steps() const { return steps; }
};

SnapshotSchedule schedule_from_config(const IO::SpinodalConfig& config);

/**
 * Periodic 2D spectral grid
 * Holds the wavenumber tables k^2 and k^4 (double precision) and the FFT plan.
 */
class SpectralGrid2D {
private:
    int nx;
    int ny;
    Eigen::ArrayXXd k2;
    Eigen::ArrayXXd k4;
    Eigen::FFT<double> fft;

    void transform(Eigen::ArrayXXcd& data, bool inverse);

public:
    SpectralGrid2D(int nx, int ny, double dx);

    // 2 pi * numpy-style fftfreq(n, dx)
    static Eigen::ArrayXd wavenumbers(int n, double dx);

    Eigen::ArrayXXcd forward(const Eigen::ArrayXXd& field);
    Eigen::ArrayXXd inverse_real(const Eigen::ArrayXXcd& spectrum);

    int get_nx() const { return nx; }
    int get_ny() const { return ny; }
    const Eigen::ArrayXXd& get_k2() const { return k2; }
    const Eigen::ArrayXXd& get_k4() const { return k4; }
};

struct CahnHilliardParameters {
    double dt = 0.01;
    double kappa = 1.0;
    double mobility = 1.0;
    double damping = 0.0;   // Spectral damping rate, 0 = off
};

/**
 * Field state of one run: real-space field, its spectrum and the step counter
 * c and c_hat always describe the same field.
 */
struct CahnHilliardState {
    Eigen::ArrayXXd c;
    Eigen::ArrayXXcd c_hat;
    long int step = 0;

    double mean() const { return c.mean(); }
    double variance() const {
        double m = c.mean();
        return (c - m).square().mean();
    }
};

struct PhysicalUnits {
    double time_scale;    // kappa / (M A^2)  [s]
    double length_unit;   // sqrt(kappa / A)  [m]
};

/**
 * Snapshots of one phase-field case
 */
struct PhaseFieldRun {
    std::string label;
    std::vector<Eigen::ArrayXXf> frames;
    std::vector<float> times;
    StageTimings timings;

    int num_frames() const { return static_cast<int>(frames.size()); }
};

// c = baseline + amplitude (u - 0.5), then the optional centred nucleus disc
void initialize_field(CahnHilliardState& state, SpectralGrid2D& grid,
                      const IO::PhaseFieldCaseConfig& case_config, RandomGenerator& rng);

/**
 * One semi-implicit step
 *   mu     = f'(c) - kappa * Re ifft(k^2 c_hat)
 *   c_hat <- (c_hat - dt M k^2 mu_hat) / (1 + dt M kappa k^4)
 * followed by c_hat <- c_hat exp(-damping k^2 dt) on k != 0 when damping > 0.
 * The k = 0 mode is left untouched, so the mean of c is conserved.
 */
void cahn_hilliard_step(CahnHilliardState& state, SpectralGrid2D& grid,
                        const CahnHilliardParameters& params,
                        const FreeEnergyDerivative& free_energy);

PhaseFieldRun run_phase_field_case(const IO::PhaseFieldCaseConfig& case_config,
                                   const IO::SpinodalConfig& config,
                                   const IO::DiagnosticConfig& diagnostics,
                                   long int seed);

PhysicalUnits physical_units(const IO::PhysicalUnitsConfig& physical);

#endif // PHASE_FIELD_ENGINE_H
