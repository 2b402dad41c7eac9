/*
 * Output Artifact Checks
 *
 * Existence and shape consistency of a finished output directory.
 */

#include "../../include/io/artifact_check.h"
#include "../../include/io/file_utils.h"
#include "../../include/io/image_writer.h"
#include <fstream>
#include <set>
#include <sstream>

namespace IO {

static std::string shape_string(const std::vector<size_t>& shape) {
    std::ostringstream out;
    out << "(";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) out << ", ";
        out << shape[i];
    }
    out << ")";
    return out.str();
}

static cnpy::NpyArray require_npy(const std::string& directory, const std::string& name,
                             size_t expected_rank, ArtifactSummary& summary) {
    std::string path = join_path(directory, name);
    if (!file_exists(path)) {
        throw ArtifactError("Missing artifact: " + path);
    }
    cnpy::NpyArray array;
    try {
        array = load_npy(path);
    } catch (const std::runtime_error& e) {
        throw ArtifactError("Unreadable artifact " + path + ": " + e.what());
    }
    if (array.shape.size() != expected_rank) {
        throw ArtifactError(path + " has shape " + shape_string(array.shape) + ", expected " +
                            std::to_string(expected_rank) + " dimensions");
    }
    summary.files.push_back(name);
    return array;
}

static void require_extent(const cnpy::NpyArray& array, size_t axis, size_t expected,
                           const std::string& name, const std::string& what) {
    if (array.shape[axis] != expected) {
        throw ArtifactError(name + " has " + std::to_string(array.shape[axis]) + " " + what +
                            ", expected " + std::to_string(expected));
    }
}

ArtifactSummary verify_ising_artifacts(const std::string& material_directory) {
    ArtifactSummary summary;
    summary.directory = material_directory;

    std::string csv_path = join_path(material_directory, "magnetization.csv");
    std::ifstream csv(csv_path);
    if (!csv.is_open()) {
        throw ArtifactError("Missing artifact: " + csv_path);
    }
    summary.files.push_back("magnetization.csv");

    std::string line;
    if (!std::getline(csv, line) || line != "T_K,M_abs") {
        throw ArtifactError(csv_path + " does not start with the header T_K,M_abs");
    }

    std::set<std::string> snapshots;
    double previous_T = -1.0;
    int line_number = 1;
    while (std::getline(csv, line)) {
        line_number++;
        if (line.empty()) continue;

        std::istringstream row(line);
        double T, m;
        char comma;
        if (!(row >> T >> comma >> m) || comma != ',') {
            throw ArtifactError("Malformed row " + std::to_string(line_number) + " in " + csv_path);
        }
        if (T <= previous_T) {
            throw ArtifactError("Temperatures not ascending at row " + std::to_string(line_number) +
                                " in " + csv_path);
        }
        if (m < 0.0 || m > 1.0) {
            throw ArtifactError("|M| outside [0, 1] at row " + std::to_string(line_number) +
                                " in " + csv_path);
        }
        std::string png = snapshot_file_name(T);
        if (!snapshots.insert(png).second) {
            throw ArtifactError("Rows for T = " + std::to_string(previous_T) + " and T = " +
                                std::to_string(T) + " share snapshot " + png + " in " +
                                material_directory);
        }
        if (!file_exists(join_path(material_directory, png))) {
            throw ArtifactError("Missing snapshot " + png + " for T = " + std::to_string(T) +
                                " in " + material_directory);
        }
        previous_T = T;
        summary.num_frames++;
    }

    if (summary.num_frames == 0) {
        throw ArtifactError(csv_path + " has no data rows");
    }
    return summary;
}

ArtifactSummary verify_melting_artifacts(const std::string& directory) {
    ArtifactSummary summary;
    summary.directory = directory;

    cnpy::NpyArray frames = require_npy(directory, "frames.npy", 3, summary);
    cnpy::NpyArray temps = require_npy(directory, "temps.npy", 1, summary);
    cnpy::NpyArray msd = require_npy(directory, "msd.npy", 1, summary);
    cnpy::NpyArray rdfs = require_npy(directory, "rdfs.npy", 2, summary);
    cnpy::NpyArray r_axis = require_npy(directory, "rdf_r_axis.npy", 1, summary);

    size_t n_frames = frames.shape[0];
    if (n_frames == 0) {
        throw ArtifactError("frames.npy in " + directory + " holds no frames");
    }
    require_extent(frames, 2, 3, "frames.npy", "coordinates per particle");
    require_extent(temps, 0, n_frames, "temps.npy", "entries");
    require_extent(msd, 0, n_frames, "msd.npy", "entries");
    require_extent(rdfs, 0, n_frames, "rdfs.npy", "frames");
    require_extent(rdfs, 1, r_axis.shape[0], "rdfs.npy", "bins");

    summary.num_frames = n_frames;
    return summary;
}

ArtifactSummary verify_spinodal_artifacts(const std::string& directory,
                                          const std::vector<std::string>& labels) {
    ArtifactSummary summary;
    summary.directory = directory;

    cnpy::NpyArray time = require_npy(directory, "time.npy", 1, summary);
    cnpy::NpyArray phys = require_npy(directory, "phys_params.npy", 1, summary);
    require_extent(phys, 0, 2, "phys_params.npy", "entries");

    size_t n_frames = time.shape[0];
    if (n_frames == 0) {
        throw ArtifactError("time.npy in " + directory + " holds no frames");
    }

    std::vector<size_t> grid_shape;
    for (const auto& label : labels) {
        std::string name = "conc_" + label + ".npy";
        cnpy::NpyArray conc = require_npy(directory, name, 3, summary);
        if (conc.word_size != sizeof(float)) {
            throw ArtifactError(name + " in " + directory + " is not float32");
        }
        require_extent(conc, 0, n_frames, name, "frames");
        if (grid_shape.empty()) {
            grid_shape = {conc.shape[1], conc.shape[2]};
        } else {
            require_extent(conc, 1, grid_shape[0], name, "rows");
            require_extent(conc, 2, grid_shape[1], name, "columns");
        }
    }

    summary.num_frames = n_frames;
    return summary;
}

} // namespace IO
