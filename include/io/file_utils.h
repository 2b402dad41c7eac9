#pragma once
#include <string>

namespace IO {

/**
 * Create directory and any missing parents
 *
 * @param path Path to directory
 * @throws std::runtime_error if a component cannot be created
 */
void create_directory(const std::string& path);

bool file_exists(const std::string& path);

// Join two path components with a single '/'
std::string join_path(const std::string& directory, const std::string& name);

// Scratch name a file is written under before it is committed
inline std::string temporary_path(const std::string& path) {
    return path + ".tmp";
}

/**
 * Move <path>.tmp over <path>
 * A reader never sees a partially written file under its final name.
 */
void commit_temporary(const std::string& path);

} // namespace IO
