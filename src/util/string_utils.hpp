#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, const std::string& delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string trim(const std::string& str);
bool contains_whitespace(const std::string& str);
}
