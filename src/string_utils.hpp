#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace instman {

std::string to_lower(std::string_view s);
std::string trim(std::string_view s);

// Splits on runs of whitespace; double quotes group words containing spaces
std::vector<std::string> split_args(std::string_view line);
std::string join_args(const std::vector<std::string>& args);

} // namespace instman
