#pragma once

#include <filesystem>
#include <string>

namespace caproute {

// Whole-file read. Throws std::runtime_error when the file cannot be opened.
std::string slurp(const std::string& path);

// Write to "<dst>.tmp" then rename over dst. Returns "" on success, else an error string.
std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body);

} // namespace caproute
