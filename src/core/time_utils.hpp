#pragma once

#include <string>
#include <chrono>

// Format an elapsed duration for report tables.
// Returns "850ms", "2.4s", "1m05s" or "2h15m" depending on magnitude.
std::string format_elapsed(std::chrono::milliseconds elapsed);
