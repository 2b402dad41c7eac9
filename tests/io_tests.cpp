/*
 * Configuration and Output I/O Tests
 *
 * Tests for configuration file parsing, validation and error handling,
 * and for the .npy / .png / .csv artifacts written by the engines.
 */

#include "../include/io/configuration_parser.h"
#include "../include/io/artifact_check.h"
#include "../include/io/file_utils.h"
#include "../include/io/image_writer.h"
#include "../include/io/npy_io.h"
#include "../include/io/simulation_output.h"
#include <iostream>
#include <fstream>
#include <cassert>
#include <functional>
#include <cmath>

using namespace IO;

// Test counter
int tests_passed = 0;
int tests_total = 0;

const std::string OUTPUT_ROOT = "tests/io_test_data/output";

void test_result(bool passed, const std::string& test_name) {
    tests_total++;
    if (passed) {
        tests_passed++;
        std::cout << "✓ " << test_name << std::endl;
    } else {
        std::cout << "✗ " << test_name << " FAILED" << std::endl;
    }
}

bool approx_equal(double a, double b, double tolerance = 1e-10) {
    return std::abs(a - b) < tolerance;
}

/**
 * Expect load_configuration to reject a file with ConfigurationError
 */
bool expect_configuration_error(const std::string& toml_file) {
    try {
        ConfigurationParser::load_configuration(toml_file);
        std::cerr << "ERROR: " << toml_file << " should have been rejected" << std::endl;
        return false;
    } catch (const ConfigurationError& e) {
        std::cout << "  Expected error: " << e.what() << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Wrong exception type: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 1: Every section given explicitly
 */
bool test_full_configuration_loading() {
    std::cout << "\n=== Test 1: Full Configuration Loading ===" << std::endl;

    try {
        SimulationConfig config = ConfigurationParser::load_configuration(
            "tests/io_test_data/full_run/simulation.toml");

        if (config.simulation_type != "all" || config.seed != -4242 ||
            config.output.directory != "tests/io_test_data/output/full_run") {
            std::cerr << "ERROR: [simulation] / [output] not loaded correctly" << std::endl;
            return false;
        }

        // Ising: explicit materials replace the defaults
        if (config.ising.materials.size() != 2 || config.ising.materials[0].name != "Co" ||
            !approx_equal(config.ising.materials[1].curie_temperature, 293.0)) {
            std::cerr << "ERROR: Ising materials not loaded correctly" << std::endl;
            return false;
        }
        if (config.ising.lattice_size != 16 || config.ising.temperatures().size() != 11) {
            std::cerr << "ERROR: Expected L=16 and 11 temperatures, got L=" << config.ising.lattice_size
                      << " and " << config.ising.temperatures().size() << std::endl;
            return false;
        }

        // Melting
        const MeltingConfig& melting = config.melting;
        if (melting.cells != 4 || !approx_equal(melting.lattice_constant, 1.1) ||
            melting.record_interval != 25 || melting.rdf_bins != 40 || !approx_equal(melting.cutoff, 2.0)) {
            std::cerr << "ERROR: Melting section not loaded correctly" << std::endl;
            return false;
        }
        std::vector<double> melt_temps = melting.temperatures();
        if (melt_temps.size() != 8 || !approx_equal(melt_temps.front(), 0.1) || !approx_equal(melt_temps.back(), 1.5)) {
            std::cerr << "ERROR: Melting schedule wrong" << std::endl;
            return false;
        }

        // Spinodal
        const SpinodalConfig& spinodal = config.spinodal;
        if (spinodal.nx != 64 || spinodal.ny != 32 || !approx_equal(spinodal.dx, 0.5) ||
            spinodal.checkpoints.size() != 4 || spinodal.checkpoints[3] != 1000) {
            std::cerr << "ERROR: Spinodal grid or checkpoints not loaded correctly" << std::endl;
            return false;
        }
        if (spinodal.cases.size() != 2 || spinodal.cases[0].label != "quench" ||
            !approx_equal(spinodal.cases[0].A, 2.0) || spinodal.cases[1].free_energy != "single_well" ||
            !approx_equal(spinodal.cases[1].baseline, 0.1)) {
            std::cerr << "ERROR: Spinodal cases not loaded correctly" << std::endl;
            return false;
        }
        if (!approx_equal(spinodal.physical.free_energy_density, 2.0e8, 1.0) ||
            !approx_equal(spinodal.physical.mobility / 5.0e-19, 1.0)) {
            std::cerr << "ERROR: Physical constants not loaded correctly" << std::endl;
            return false;
        }

        // Diagnostics
        if (!config.diagnostics.enable_profiling || config.diagnostics.estimate_autocorrelation ||
            config.diagnostics.progress_interval != 5) {
            std::cerr << "ERROR: Diagnostics not loaded correctly" << std::endl;
            return false;
        }

        std::cout << "  All sections parsed" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 2: Defaults for everything not given
 */
bool test_default_configuration() {
    std::cout << "\n=== Test 2: Default Values ===" << std::endl;

    try {
        SimulationConfig config = ConfigurationParser::load_configuration(
            "tests/io_test_data/defaults/simulation.toml");

        if (config.runs("ising") || config.runs("melting") || !config.runs("spinodal")) {
            std::cerr << "ERROR: Engine selection wrong" << std::endl;
            return false;
        }
        if (config.seed != -12345 || config.output.directory != ".") {
            std::cerr << "ERROR: Default seed or output directory wrong" << std::endl;
            return false;
        }
        if (config.ising.materials.size() != 3 || config.ising.materials[0].name != "Fe" ||
            !approx_equal(config.ising.materials[2].curie_temperature, 293.0)) {
            std::cerr << "ERROR: Default materials wrong" << std::endl;
            return false;
        }

        const SpinodalConfig& spinodal = config.spinodal;
        if (spinodal.nx != 256 || spinodal.ny != 256 || !spinodal.checkpoints.empty()) {
            std::cerr << "ERROR: Default grid wrong" << std::endl;
            return false;
        }
        if (spinodal.cases.size() != 3 || spinodal.cases[0].label != "unstable" ||
            spinodal.cases[1].free_energy != "single_well" || spinodal.cases[2].label != "nucleation" ||
            !(spinodal.cases[2].nucleus_radius > 0.0)) {
            std::cerr << "ERROR: Default phase-field cases wrong" << std::endl;
            return false;
        }

        std::cout << "  Defaults: Fe/Ni/Gd, 256x256, unstable/stable/nucleation" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 3: Integers accepted where reals are expected
 */
bool test_integer_values() {
    std::cout << "\n=== Test 3: Integer Literals for Real Parameters ===" << std::endl;

    try {
        SimulationConfig config = ConfigurationParser::load_configuration(
            "tests/io_test_data/integer_values/simulation.toml");

        std::vector<double> temps = config.ising.temperatures();
        if (temps.size() != 5 || !approx_equal(temps[0], 100.0) || !approx_equal(temps[4], 300.0)) {
            std::cerr << "ERROR: Temperature scan from integer values wrong" << std::endl;
            return false;
        }
        if (config.ising.materials.size() != 1 || !approx_equal(config.ising.materials[0].curie_temperature, 627.0)) {
            std::cerr << "ERROR: Integer curie_temperature not accepted" << std::endl;
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 4: Invalid files are rejected with ConfigurationError
 */
void test_invalid_configurations() {
    std::cout << "\n=== Test 4: Invalid Configurations ===" << std::endl;

    test_result(expect_configuration_error("tests/io_test_data/unknown_type/simulation.toml"),
                "Unknown simulation type");
    test_result(expect_configuration_error("tests/io_test_data/duplicate_material/simulation.toml"),
                "Duplicate Ising material");
    test_result(expect_configuration_error("tests/io_test_data/missing_curie_temperature/simulation.toml"),
                "Material without curie_temperature");
    test_result(expect_configuration_error("tests/io_test_data/bad_free_energy/simulation.toml"),
                "Unknown free energy");
    test_result(expect_configuration_error("tests/io_test_data/empty_checkpoints/simulation.toml"),
                "Empty checkpoint list");
    test_result(expect_configuration_error("tests/io_test_data/negative_cells/simulation.toml"),
                "Negative MD cell count");
    test_result(expect_configuration_error("tests/io_test_data/fractional_step/simulation.toml"),
                "Fractional Ising temperature step");
    test_result(expect_configuration_error("tests/io_test_data/huge_checkpoint/simulation.toml"),
                "Checkpoint beyond int range");
    test_result(expect_configuration_error("tests/io_test_data/syntax_error/simulation.toml"),
                "TOML syntax error");
    test_result(expect_configuration_error("tests/io_test_data/does_not_exist.toml"),
                "Missing configuration file");
}

/**
 * Test 5: Written matrix loads back through cnpy in C order
 */
bool test_npy_write_read() {
    std::cout << "\n=== Test 5: NPY Write and Read ===" << std::endl;

    try {
        std::string directory = join_path(OUTPUT_ROOT, "npy");
        create_directory(directory);

        double matrix[6] = {1.0, -2.5, 3.25, 0.0, 1e-9, 42.0};
        std::string matrix_path = join_path(directory, "matrix.npy");
        NpyWriter::write(matrix_path, matrix, {2, 3});

        cnpy::NpyArray array = cnpy::npy_load(matrix_path);
        if (array.shape != std::vector<size_t>({2, 3}) || array.word_size != 8 || array.fortran_order) {
            std::cerr << "ERROR: matrix.npy loaded with word size " << array.word_size << std::endl;
            return false;
        }
        const double* values = array.data<double>();
        for (int i = 0; i < 6; i++) {
            if (values[i] != matrix[i]) {
                std::cerr << "ERROR: Element " << i << " = " << values[i] << std::endl;
                return false;
            }
        }

        if (file_exists(temporary_path(matrix_path))) {
            std::cerr << "ERROR: Temporary file left behind" << std::endl;
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 6: float32 series widened to double, and rewrites replace the file
 */
bool test_npy_float_series() {
    std::cout << "\n=== Test 6: NPY float32 Series ===" << std::endl;

    try {
        std::string directory = join_path(OUTPUT_ROOT, "npy");
        create_directory(directory);

        std::string series_path = join_path(directory, "series.npy");
        NpyWriter::write(series_path, std::vector<float>{9.0f, 9.0f, 9.0f, 9.0f, 9.0f});
        NpyWriter::write(series_path, std::vector<float>{0.0f, 0.5f, 1.0f});

        cnpy::NpyArray array = load_npy(series_path);
        std::vector<double> values = npy_values(array);
        if (array.word_size != 4 || array.shape != std::vector<size_t>({3}) ||
            values.size() != 3 || values[1] != 0.5) {
            std::cerr << "ERROR: float32 series read back wrong" << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }

    try {
        load_npy(join_path(OUTPUT_ROOT, "npy/absent.npy"));
        std::cerr << "ERROR: Missing file loaded" << std::endl;
        return false;
    } catch (const std::runtime_error& e) {
        std::cout << "  Expected error: " << e.what() << std::endl;
    }
    return true;
}

/**
 * Test 7: Snapshot naming and palette
 */
bool test_snapshot_images() {
    std::cout << "\n=== Test 7: Snapshot Names and Pixels ===" << std::endl;

    if (snapshot_file_name(5.0) != "0005.png" || snapshot_file_name(1043.7) != "1043.png" ||
        snapshot_file_name(0.0) != "0000.png") {
        std::cerr << "ERROR: Snapshot names: " << snapshot_file_name(5.0) << std::endl;
        return false;
    }

    SpinGrid spins(2, 2);
    spins << 1, -1,
            -1, 1;
    std::vector<unsigned char> pixels = spin_grid_pixels(spins);
    if (pixels.size() != 12 || pixels[0] != SPIN_UP_COLOR.r || pixels[3] != SPIN_DOWN_COLOR.r ||
        pixels[5] != SPIN_DOWN_COLOR.b || pixels[11] != SPIN_UP_COLOR.b) {
        std::cerr << "ERROR: Pixel colours wrong" << std::endl;
        return false;
    }
    return true;
}

/**
 * Test 8: Ising material directory written and verified
 */
bool test_ising_artifacts() {
    std::cout << "\n=== Test 8: Ising Artifacts ===" << std::endl;

    try {
        std::vector<IsingTemperatureResult> results;
        for (int t = 0; t < 3; t++) {
            IsingTemperatureResult result;
            result.T = 10.0 * t;
            result.abs_magnetization = 1.0 - 0.2 * t;
            result.acceptance_rate = 0.0;
            result.autocorrelation = 0.0;
            result.snapshot = SpinGrid::Ones(8, 8);
            result.snapshot(t, t) = -1;
            results.push_back(result);
        }

        std::string directory = ising_output_directory(OUTPUT_ROOT, "Test");
        write_ising_outputs(directory, results);

        ArtifactSummary summary = verify_ising_artifacts(directory);
        if (summary.num_frames != 3 || !file_exists(join_path(directory, "0020.png"))) {
            std::cerr << "ERROR: Expected 3 temperatures, got " << summary.num_frames << std::endl;
            return false;
        }

        std::ifstream csv(join_path(directory, "magnetization.csv"));
        std::string header_line, first_row;
        std::getline(csv, header_line);
        std::getline(csv, first_row);
        if (header_line != "T_K,M_abs" || first_row != "0,1") {
            std::cerr << "ERROR: CSV starts with '" << header_line << "' / '" << first_row << "'" << std::endl;
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 9: Melting arrays written and verified
 */
bool test_melting_artifacts() {
    std::cout << "\n=== Test 9: Melting Artifacts ===" << std::endl;

    try {
        MeltingTrajectory trajectory;
        trajectory.rdf_r_axis = Eigen::VectorXd::LinSpaced(10, 0.05, 0.95);
        for (int f = 0; f < 4; f++) {
            trajectory.frames.push_back(ParticleArray::Constant(8, 3, 0.1 * f));
            trajectory.temps.push_back(0.2 + 0.1 * f);
            trajectory.msd.push_back(0.01 * f);
            trajectory.rdfs.push_back(Eigen::VectorXd::Ones(10));
        }

        std::string directory = melting_output_directory(OUTPUT_ROOT);
        write_melting_outputs(directory, trajectory);

        ArtifactSummary summary = verify_melting_artifacts(directory);
        cnpy::NpyArray frames = load_npy(join_path(directory, "frames.npy"));
        if (summary.num_frames != 4 || frames.shape != std::vector<size_t>({4, 8, 3})) {
            std::cerr << "ERROR: frames.npy shape or frame count wrong" << std::endl;
            return false;
        }

        std::vector<double> temps = npy_values(load_npy(join_path(directory, "temps.npy")));
        if (temps.size() != 4 || !approx_equal(temps[3], 0.5)) {
            std::cerr << "ERROR: temps.npy values wrong" << std::endl;
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 10: Phase-field arrays in C order, verified against the time axis
 */
bool test_spinodal_artifacts() {
    std::cout << "\n=== Test 10: Spinodal Artifacts ===" << std::endl;

    try {
        std::string directory = spinodal_output_directory(OUTPUT_ROOT);

        PhaseFieldRun run;
        run.label = "quench";
        for (int f = 0; f < 2; f++) {
            Eigen::ArrayXXf frame(3, 5);
            for (int i = 0; i < 3; i++) {
                for (int j = 0; j < 5; j++) {
                    frame(i, j) = static_cast<float>(100 * f + 10 * i + j);
                }
            }
            run.frames.push_back(frame);
            run.times.push_back(0.5f * f);
        }
        write_phase_field_case(directory, run);
        write_phase_field_axes(directory, run.times, PhysicalUnits{1.0e-9, 1.0e-9});

        ArtifactSummary summary = verify_spinodal_artifacts(directory, {"quench"});
        if (summary.num_frames != 2) {
            std::cerr << "ERROR: Expected 2 frames, got " << summary.num_frames << std::endl;
            return false;
        }

        cnpy::NpyArray conc = load_npy(join_path(directory, "conc_quench.npy"));
        std::vector<double> values = npy_values(conc);
        // Element [1][2][3] sits at (1*3 + 2)*5 + 3 in C order
        if (conc.shape != std::vector<size_t>({2, 3, 5}) || conc.word_size != 4 ||
            values[(1 * 3 + 2) * 5 + 3] != 123.0) {
            std::cerr << "ERROR: conc_quench.npy not in [frame][i][j] order" << std::endl;
            return false;
        }

        std::vector<double> phys = npy_values(load_npy(join_path(directory, "phys_params.npy")));
        if (phys.size() != 2 || !approx_equal(phys[0], 1.0e-9, 1e-20)) {
            std::cerr << "ERROR: phys_params.npy wrong" << std::endl;
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Test 11: Missing or inconsistent artifacts are reported
 */
void test_artifact_errors() {
    std::cout << "\n=== Test 11: Artifact Errors ===" << std::endl;

    auto expect_artifact_error = [](const std::function<void()>& check) {
        try {
            check();
            return false;
        } catch (const ArtifactError& e) {
            std::cout << "  Expected error: " << e.what() << std::endl;
            return true;
        } catch (const std::exception& e) {
            std::cerr << "ERROR: Wrong exception type: " << e.what() << std::endl;
            return false;
        }
    };

    test_result(expect_artifact_error([] {
                    verify_ising_artifacts(join_path(OUTPUT_ROOT, "ising/Nowhere"));
                }),
                "Missing Ising directory");

    test_result(expect_artifact_error([] {
                    verify_spinodal_artifacts(spinodal_output_directory(OUTPUT_ROOT), {"quench", "relax"});
                }),
                "Missing phase-field case");

    // Three frames in a directory whose time axis has two
    test_result(expect_artifact_error([] {
                    std::string directory = join_path(OUTPUT_ROOT, "spinodal_mismatch");
                    PhaseFieldRun run;
                    run.label = "long";
                    run.frames.assign(3, Eigen::ArrayXXf::Zero(4, 4));
                    write_phase_field_case(directory, run);
                    write_phase_field_axes(directory, {0.0f, 1.0f}, PhysicalUnits{1.0, 1.0});
                    verify_spinodal_artifacts(directory, {"long"});
                }),
                "Frame count disagrees with time axis");

    // |M| above 1 in the table
    test_result(expect_artifact_error([] {
                    std::string directory = ising_output_directory(OUTPUT_ROOT, "Corrupt");
                    IsingTemperatureResult result;
                    result.T = 0.0;
                    result.abs_magnetization = 1.5;
                    result.snapshot = SpinGrid::Ones(4, 4);
                    write_ising_outputs(directory, {result});
                    verify_ising_artifacts(directory);
                }),
                "Magnetization outside [0, 1]");
}

/**
 * Test 12: Temperatures sharing a snapshot name are refused
 */
bool test_snapshot_collisions() {
    std::cout << "\n=== Test 12: Snapshot Name Collisions ===" << std::endl;

    // 0.0, 0.5, ..., 3.0 K: pairs share a whole-kelvin file name
    std::vector<IsingTemperatureResult> results;
    for (int t = 0; t < 7; t++) {
        IsingTemperatureResult result;
        result.T = 0.5 * t;
        result.abs_magnetization = 1.0;
        result.snapshot = SpinGrid::Ones(4, 4);
        results.push_back(result);
    }

    std::string directory = ising_output_directory(OUTPUT_ROOT, "HalfKelvin");
    try {
        write_ising_outputs(directory, results);
        std::cerr << "ERROR: Colliding temperatures were written" << std::endl;
        return false;
    } catch (const std::runtime_error& e) {
        std::cout << "  Expected error: " << e.what() << std::endl;
    }
    if (file_exists(join_path(directory, "magnetization.csv"))) {
        std::cerr << "ERROR: Table written despite the collision" << std::endl;
        return false;
    }

    // A table whose rows 0 K and 0.5 K both point at 0000.png
    try {
        std::string tampered = ising_output_directory(OUTPUT_ROOT, "Tampered");
        IsingTemperatureResult result;
        result.T = 0.0;
        result.abs_magnetization = 1.0;
        result.snapshot = SpinGrid::Ones(4, 4);
        write_ising_outputs(tampered, {result});

        std::ofstream csv(join_path(tampered, "magnetization.csv"));
        csv << "T_K,M_abs\n0,1\n0.5,0.9\n";
        csv.close();

        verify_ising_artifacts(tampered);
        std::cerr << "ERROR: Shared snapshot passed verification" << std::endl;
        return false;
    } catch (const ArtifactError& e) {
        std::cout << "  Expected error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "   CONFIGURATION AND OUTPUT I/O TESTS  " << std::endl;
    std::cout << "========================================" << std::endl;

    test_result(test_full_configuration_loading(), "Full configuration loading");
    test_result(test_default_configuration(), "Default values");
    test_result(test_integer_values(), "Integer literals for real parameters");
    test_invalid_configurations();
    test_result(test_npy_write_read(), "NPY write and read");
    test_result(test_npy_float_series(), "NPY float32 series");
    test_result(test_snapshot_images(), "Snapshot names and pixels");
    test_result(test_ising_artifacts(), "Ising artifacts");
    test_result(test_melting_artifacts(), "Melting artifacts");
    test_result(test_spinodal_artifacts(), "Spinodal artifacts");
    test_artifact_errors();
    test_result(test_snapshot_collisions(), "Snapshot name collisions");

    std::cout << "\n========================================" << std::endl;
    std::cout << "RESULTS: " << tests_passed << "/" << tests_total << " tests passed" << std::endl;

    if (tests_passed == tests_total) {
        std::cout << "✓ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ " << (tests_total - tests_passed) << " tests failed" << std::endl;
        return 1;
    }
}
