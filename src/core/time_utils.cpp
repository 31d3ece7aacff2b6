#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    long long ms = elapsed.count();
    if (ms < 0) ms = 0;

    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }

    long long seconds = ms / 1000;
    int hours = static_cast<int>(seconds / 3600);
    int mins = static_cast<int>((seconds % 3600) / 60);
    int secs = static_cast<int>(seconds % 60);

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{:02}s", mins, secs);
    } else {
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    }
}
