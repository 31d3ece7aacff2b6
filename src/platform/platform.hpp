#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the per-user configuration root
// ($XDG_CONFIG_HOME or ~/.config on Unix, %APPDATA% on Windows).
std::filesystem::path config_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
