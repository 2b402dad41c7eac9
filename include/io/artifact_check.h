#pragma once
#include "npy_io.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace IO {

/**
 * Exception for missing or inconsistent output artifacts
 * Raised before any array payload is touched.
 */
class ArtifactError : public std::runtime_error {
public:
    ArtifactError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * What a successful check found
 */
struct ArtifactSummary {
    std::string directory;
    size_t num_frames = 0;
    std::vector<std::string> files;
};

/**
 * <dir>/magnetization.csv with header T_K,M_abs, ascending T, and a
 * distinct NNNN.png per row
 */
ArtifactSummary verify_ising_artifacts(const std::string& material_directory);

/**
 * frames, temps, msd, rdfs and rdf_r_axis present with agreeing frame and bin counts
 */
ArtifactSummary verify_melting_artifacts(const std::string& directory);

/**
 * time.npy, phys_params.npy and conc_<label>.npy for each label, with
 * agreeing frame counts and grid shapes
 */
ArtifactSummary verify_spinodal_artifacts(const std::string& directory,
                                          const std::vector<std::string>& labels);

} // namespace IO
