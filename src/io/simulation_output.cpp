/*
 * Engine Output Writers Implementation
 */

#include "../../include/io/simulation_output.h"
#include "../../include/io/file_utils.h"
#include "../../include/io/image_writer.h"
#include "../../include/io/npy_io.h"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <set>
#include <stdexcept>

namespace IO {

std::string ising_output_directory(const std::string& base, const std::string& material_name) {
    return join_path(join_path(base, "ising"), material_name);
}

std::string melting_output_directory(const std::string& base) {
    return join_path(base, "melting");
}

std::string spinodal_output_directory(const std::string& base) {
    return join_path(base, "spinodal");
}

void write_ising_outputs(const std::string& directory,
                         const std::vector<IsingTemperatureResult>& results) {
    if (results.empty()) {
        throw std::runtime_error("No Ising results to write to " + directory);
    }
    std::set<std::string> names;
    for (const auto& result : results) {
        if (!names.insert(snapshot_file_name(result.T)).second) {
            throw std::runtime_error("Temperatures in " + directory + " collide on snapshot " +
                                     snapshot_file_name(result.T));
        }
    }
    create_directory(directory);

    for (const auto& result : results) {
        write_spin_png(join_path(directory, snapshot_file_name(result.T)), result.snapshot);
    }

    // Table last: its presence marks a complete material directory
    std::string csv_path = join_path(directory, "magnetization.csv");
    {
        std::ofstream csv(temporary_path(csv_path));
        if (!csv.is_open()) {
            throw std::runtime_error("Cannot open output file: " + temporary_path(csv_path));
        }
        csv << "T_K,M_abs\n";
        for (const auto& result : results) {
            csv << std::setprecision(10) << result.T << "," << result.abs_magnetization << "\n";
        }
        csv.flush();
        if (!csv) {
            throw std::runtime_error("Write failed: " + temporary_path(csv_path));
        }
    }
    commit_temporary(csv_path);
}

void write_melting_outputs(const std::string& directory, const MeltingTrajectory& trajectory) {
    const size_t n_frames = trajectory.frames.size();
    if (n_frames == 0) {
        throw std::runtime_error("No MD frames to write to " + directory);
    }
    if (trajectory.temps.size() != n_frames || trajectory.msd.size() != n_frames ||
        trajectory.rdfs.size() != n_frames) {
        throw std::runtime_error("MD trajectory series have inconsistent lengths");
    }
    create_directory(directory);

    const size_t n_particles = static_cast<size_t>(trajectory.frames.front().rows());
    const size_t n_bins = static_cast<size_t>(trajectory.rdf_r_axis.size());

    // ParticleArray is row-major, so each frame is already in C order
    std::vector<double> frames(n_frames * n_particles * 3);
    for (size_t f = 0; f < n_frames; f++) {
        if (static_cast<size_t>(trajectory.frames[f].rows()) != n_particles) {
            throw std::runtime_error("Particle count changed during the MD run");
        }
        std::memcpy(&frames[f * n_particles * 3], trajectory.frames[f].data(),
                    n_particles * 3 * sizeof(double));
    }

    std::vector<double> rdfs(n_frames * n_bins);
    for (size_t f = 0; f < n_frames; f++) {
        if (static_cast<size_t>(trajectory.rdfs[f].size()) != n_bins) {
            throw std::runtime_error("RDF bin count changed during the MD run");
        }
        for (size_t b = 0; b < n_bins; b++) {
            rdfs[f * n_bins + b] = trajectory.rdfs[f](b);
        }
    }

    NpyWriter::write(join_path(directory, "frames.npy"), frames.data(), {n_frames, n_particles, 3});
    NpyWriter::write(join_path(directory, "temps.npy"), trajectory.temps);
    NpyWriter::write(join_path(directory, "msd.npy"), trajectory.msd);
    NpyWriter::write(join_path(directory, "rdfs.npy"), rdfs.data(), {n_frames, n_bins});
    NpyWriter::write(join_path(directory, "rdf_r_axis.npy"), trajectory.rdf_r_axis.data(), {n_bins});
}

void write_phase_field_case(const std::string& directory, const PhaseFieldRun& run) {
    const size_t n_frames = run.frames.size();
    if (n_frames == 0) {
        throw std::runtime_error("No phase-field frames for case " + run.label);
    }
    create_directory(directory);

    const size_t nx = static_cast<size_t>(run.frames.front().rows());
    const size_t ny = static_cast<size_t>(run.frames.front().cols());

    // Eigen arrays are column-major: transpose into [frame][i][j]
    std::vector<float> data(n_frames * nx * ny);
    size_t index = 0;
    for (const auto& frame : run.frames) {
        for (size_t i = 0; i < nx; i++) {
            for (size_t j = 0; j < ny; j++) {
                data[index++] = frame(i, j);
            }
        }
    }

    NpyWriter::write(join_path(directory, "conc_" + run.label + ".npy"), data.data(), {n_frames, nx, ny});
}

void write_phase_field_axes(const std::string& directory, const std::vector<float>& times,
                            const PhysicalUnits& units) {
    if (times.empty()) {
        throw std::runtime_error("Empty phase-field time axis");
    }
    create_directory(directory);

    std::vector<double> phys_params = {units.time_scale, units.length_unit};
    NpyWriter::write(join_path(directory, "time.npy"), times);
    NpyWriter::write(join_path(directory, "phys_params.npy"), phys_params);
}

} // namespace IO
