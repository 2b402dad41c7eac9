/*
 * File Utilities Implementation
 */

#include "../../include/io/file_utils.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace IO {

static void make_single_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            throw std::runtime_error("Not a directory: " + path);
        }
        return;
    }
    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        throw std::runtime_error("Cannot create directory " + path + ": " + std::strerror(errno));
    }
}

void create_directory(const std::string& path) {
    if (path.empty()) return;
    // Create every prefix ending at a '/'
    for (size_t pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        make_single_directory(path.substr(0, pos));
    }
    make_single_directory(path);
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string join_path(const std::string& directory, const std::string& name) {
    if (directory.empty()) return name;
    if (directory.back() == '/') return directory + name;
    return directory + "/" + name;
}

void commit_temporary(const std::string& path) {
    std::string scratch = temporary_path(path);
    if (std::rename(scratch.c_str(), path.c_str()) != 0) {
        throw std::runtime_error("Cannot move " + scratch + " to " + path + ": " + std::strerror(errno));
    }
}

} // namespace IO
