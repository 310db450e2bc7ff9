#pragma once
#include <string>
#include <vector>

namespace forge {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(std::string s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates missing parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace forge
