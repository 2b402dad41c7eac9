/*
 * NumPy .npy I/O Implementation
 */

#include "../../include/io/npy_io.h"
#include "../../include/io/file_utils.h"
#include <fstream>
#include <stdexcept>

namespace IO {

template <typename T>
void NpyWriter::write(const std::string& path, const T* data, const std::vector<size_t>& shape) {
    size_t count = 1;
    for (size_t extent : shape) count *= extent;

    // cnpy does not report an unopenable file, so check the scratch path first
    std::string scratch = temporary_path(path);
    {
        std::ofstream file(scratch, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + scratch);
        }
    }

    cnpy::npy_save(scratch, data, shape, "w");

    std::ifstream written(scratch, std::ios::binary | std::ios::ate);
    if (!written.is_open() || static_cast<size_t>(written.tellg()) < count * sizeof(T)) {
        throw std::runtime_error("Write failed: " + scratch);
    }
    written.close();
    commit_temporary(path);
}

template void NpyWriter::write<double>(const std::string&, const double*, const std::vector<size_t>&);
template void NpyWriter::write<float>(const std::string&, const float*, const std::vector<size_t>&);

cnpy::NpyArray load_npy(const std::string& path) {
    if (!file_exists(path)) {
        throw std::runtime_error("Cannot open npy file: " + path);
    }
    try {
        return cnpy::npy_load(path);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Cannot read npy file " + path + ": " + e.what());
    }
}

std::vector<double> npy_values(const cnpy::NpyArray& array) {
    if (array.fortran_order) {
        throw std::runtime_error("Fortran-ordered npy arrays are not supported");
    }
    if (array.word_size == sizeof(double)) {
        return array.as_vec<double>();
    }
    if (array.word_size == sizeof(float)) {
        std::vector<float> narrow = array.as_vec<float>();
        return std::vector<double>(narrow.begin(), narrow.end());
    }
    throw std::runtime_error("Unsupported npy element size: " + std::to_string(array.word_size));
}

} // namespace IO
