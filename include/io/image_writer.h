#pragma once
#include "../ising_engine.h"
#include <string>
#include <vector>

namespace IO {

struct RGBColor {
    unsigned char r, g, b;
};

// Two-level palette of the spin snapshots
const RGBColor SPIN_DOWN_COLOR = {0x4E, 0x79, 0xA7};   // #4E79A7
const RGBColor SPIN_UP_COLOR = {0xF2, 0x8E, 0x2B};     // #F28E2B

/**
 * Interleaved RGB pixels of a spin grid, one pixel per site
 * Row i of the grid is image row i.
 */
std::vector<unsigned char> spin_grid_pixels(const SpinGrid& spins);

/**
 * Write a spin grid as an L x L PNG (written to <path>.tmp, then renamed)
 * @throws std::runtime_error if the image cannot be written
 */
void write_spin_png(const std::string& path, const SpinGrid& spins);

// "0005.png" for T = 5.0 K: integer part of T, zero padded to 4 digits
std::string snapshot_file_name(double T);

} // namespace IO
