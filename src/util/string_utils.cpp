#include "string_utils.hpp"
#include <sstream>

namespace StringUtils {

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(str);
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field; keep it ("a:" -> {"a", ""})
    if (!str.empty() && str.back() == delimiter) {
        parts.push_back("");
    }
    return parts;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace StringUtils
