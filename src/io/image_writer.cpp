/*
 * Spin Snapshot Image Writer
 */

#include "../../include/io/image_writer.h"
#include "../../include/io/file_utils.h"
#include <cstdio>
#include <stdexcept>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace IO {

std::vector<unsigned char> spin_grid_pixels(const SpinGrid& spins) {
    const int rows = static_cast<int>(spins.rows());
    const int cols = static_cast<int>(spins.cols());
    std::vector<unsigned char> pixels(static_cast<size_t>(rows) * cols * 3);

    size_t index = 0;
    for (int i = 0; i < rows; i++) {
        for (int j = 0; j < cols; j++) {
            const RGBColor& color = (spins(i, j) > 0) ? SPIN_UP_COLOR : SPIN_DOWN_COLOR;
            pixels[index++] = color.r;
            pixels[index++] = color.g;
            pixels[index++] = color.b;
        }
    }
    return pixels;
}

void write_spin_png(const std::string& path, const SpinGrid& spins) {
    const int height = static_cast<int>(spins.rows());
    const int width = static_cast<int>(spins.cols());
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("Cannot write an empty spin grid to " + path);
    }

    std::vector<unsigned char> pixels = spin_grid_pixels(spins);
    std::string scratch = temporary_path(path);
    if (stbi_write_png(scratch.c_str(), width, height, 3, pixels.data(), width * 3) == 0) {
        throw std::runtime_error("Failed to write PNG: " + scratch);
    }
    commit_temporary(path);
}

std::string snapshot_file_name(double T) {
    char name[32];
    std::snprintf(name, sizeof(name), "%04d.png", static_cast<int>(T));
    return name;
}

} // namespace IO
