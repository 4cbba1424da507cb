#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_duration(std::chrono::milliseconds elapsed) {
    long long ms = elapsed.count();
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }

    long long seconds = ms / 1000;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
