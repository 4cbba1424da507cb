#pragma once

#include <string>
#include <vector>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Join argv-style parts with single spaces for display.
std::string join_command(const std::vector<std::string>& parts);
