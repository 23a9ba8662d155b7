#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to temp_dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expand a leading "~" or "~/" against the local home directory.
std::filesystem::path expand_user(const std::string& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
