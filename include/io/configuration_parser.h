#pragma once
#include "config_types.h"
#include <string>
#include <vector>
#include <stdexcept>

namespace IO {

/**
 * Exception for configuration parsing errors
 */
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Main configuration parser class
 *
 * Loads a complete run description from one TOML file. Sections that are
 * absent keep the defaults of IO::SimulationConfig.
 */
class ConfigurationParser {
public:
    /**
     * Load complete simulation configuration from TOML file
     *
     * @param toml_file Path to main TOML configuration file
     * @return Complete configuration structure
     * @throws ConfigurationError if any parsing or validation fails
     */
    static SimulationConfig load_configuration(const std::string& toml_file);

    /**
     * Check parameter ranges of every engine selected by simulation_type
     * @throws ConfigurationError on the first violation
     */
    static void validate_configuration(const SimulationConfig& config);

    // Fe, Ni, Gd
    static std::vector<MaterialSpec> default_materials();

    // unstable, stable, nucleation
    static std::vector<PhaseFieldCaseConfig> default_phase_field_cases();

private:
    /**
     * Parse the main TOML configuration file
     */
    static void parse_toml_file(const std::string& toml_file, SimulationConfig& config);
};

} // namespace IO
