#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace StringUtils {

std::vector<std::string> split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> parts;
    if (str.empty()) return parts;
    if (delimiter.empty()) {
        parts.push_back(str);
        return parts;
    }

    size_t start = 0;
    size_t pos;
    while ((pos = str.find(delimiter, start)) != std::string::npos) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    parts.push_back(str.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += delimiter;
        out += p;
    }
    return out;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool contains_whitespace(const std::string& str) {
    return std::any_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace StringUtils
