#pragma once

#include <string>
#include <chrono>

// Format an elapsed duration for log lines.
// Returns "2h35m", "14m22s", "8s", or "850ms" below one second.
std::string format_duration(std::chrono::milliseconds elapsed);
