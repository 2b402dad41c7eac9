/*
 * Engine Output Writers
 *
 * Persist the result of a completed engine run. Every file is written
 * under a scratch name and renamed into place, and every array of one
 * run is written from the same in-memory frame sequence, so frame
 * counts agree across files by construction.
 */

#ifndef SIMULATION_OUTPUT_H
#define SIMULATION_OUTPUT_H

#include "../ising_phases.h"
#include "../md_engine.h"
#include "../phase_field_engine.h"
#include <string>
#include <vector>

namespace IO {

// <out>/ising/<name>, <out>/melting, <out>/spinodal
std::string ising_output_directory(const std::string& base, const std::string& material_name);
std::string melting_output_directory(const std::string& base);
std::string spinodal_output_directory(const std::string& base);

/**
 * magnetization.csv (header T_K,M_abs) plus one NNNN.png per temperature
 */
void write_ising_outputs(const std::string& directory,
                         const std::vector<IsingTemperatureResult>& results);

/**
 * frames.npy [F,N,3], temps.npy [F], msd.npy [F], rdfs.npy [F,B], rdf_r_axis.npy [B]
 */
void write_melting_outputs(const std::string& directory, const MeltingTrajectory& trajectory);

/**
 * conc_<label>.npy [F,Nx,Ny] float32
 */
void write_phase_field_case(const std::string& directory, const PhaseFieldRun& run);

/**
 * time.npy [F] float32 and phys_params.npy [time_scale, length_unit]
 */
void write_phase_field_axes(const std::string& directory, const std::vector<float>& times,
                            const PhysicalUnits& units);

} // namespace IO

#endif // SIMULATION_OUTPUT_H
