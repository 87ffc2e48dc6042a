#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace diffmap::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
double elapsed_ms(std::chrono::steady_clock::time_point since);

// File utilities
std::string read_text(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);

} // namespace diffmap::core
