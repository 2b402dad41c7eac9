/*
 * Output verification tool
 *
 * Checks that a finished run left a complete, self-consistent set of
 * artifacts for every engine selected in the run file. Only file
 * existence and array headers are inspected.
 *
 * Usage: verify_outputs [run.toml]
 */

#include "../include/io/artifact_check.h"
#include "../include/io/configuration_parser.h"
#include "../include/io/output_formatting.h"
#include "../include/io/simulation_output.h"
#include <iostream>
#include <string>
#include <vector>

static void report(const IO::ArtifactSummary& summary, const std::string& unit) {
    std::cout << "  OK  " << summary.directory << "  (" << summary.num_frames << " " << unit
              << ", " << summary.files.size() << " files)" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_file = "simulation.toml";
    if (argc > 1) {
        config_file = argv[1];
    }

    try {
        IO::SimulationConfig config = IO::ConfigurationParser::load_configuration(config_file);
        const std::string& base = config.output.directory;

        IO::print_section_separator("Artifact check: " + base);

        if (config.runs("ising")) {
            for (const auto& material : config.ising.materials) {
                report(IO::verify_ising_artifacts(IO::ising_output_directory(base, material.name)),
                       "temperatures");
            }
        }
        if (config.runs("melting")) {
            report(IO::verify_melting_artifacts(IO::melting_output_directory(base)), "frames");
        }
        if (config.runs("spinodal")) {
            std::vector<std::string> labels;
            for (const auto& case_config : config.spinodal.cases) {
                labels.push_back(case_config.label);
            }
            report(IO::verify_spinodal_artifacts(IO::spinodal_output_directory(base), labels), "frames");
        }

    } catch (const IO::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const IO::ArtifactError& e) {
        std::cerr << "Precondition not met: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nAll artifacts present and consistent." << std::endl;
    return 0;
}
