#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Creates a unique temporary file path with the given prefix.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
