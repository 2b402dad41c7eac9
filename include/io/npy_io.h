#pragma once
#include <cnpy.h>
#include <cstddef>
#include <string>
#include <vector>

namespace IO {

/**
 * Writer for NumPy .npy files
 *
 * Arrays are saved with cnpy in C order. Data goes to <path>.tmp first
 * and is renamed into place once complete.
 */
class NpyWriter {
public:
    template <typename T>
    static void write(const std::string& path, const T* data, const std::vector<size_t>& shape);

    template <typename T>
    static void write(const std::string& path, const std::vector<T>& values) {
        write(path, values.data(), {values.size()});
    }
};

/**
 * Load a .npy file
 * @throws std::runtime_error naming the path if the file is missing or unreadable
 */
cnpy::NpyArray load_npy(const std::string& path);

/**
 * Elements of a float32 or float64 array widened to double
 * @throws std::runtime_error on other element sizes or Fortran order
 */
std::vector<double> npy_values(const cnpy::NpyArray& array);

} // namespace IO
