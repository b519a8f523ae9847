#pragma once

#include <string>

namespace gatewatch {

// Reads an entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are retried
// against the source tree (GATEWATCH_SOURCE_DIR) so tests and the CLI can be
// launched from a build directory.
std::string read_text_file(const std::string& path);

// Writes a file through a sibling temp file + rename, creating parent
// directories as needed. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace gatewatch
