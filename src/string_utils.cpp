#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace instman {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(std::string_view s) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::vector<std::string> split_args(std::string_view line) {
    std::vector<std::string> args;
    std::string current;
    bool in_quotes = false;
    bool has_token = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_token = true;
        } else if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
            if (has_token) {
                args.push_back(std::move(current));
                current.clear();
                has_token = false;
            }
        } else {
            current.push_back(c);
            has_token = true;
        }
    }

    if (has_token) {
        args.push_back(std::move(current));
    }
    return args;
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += ' ';
        if (arg.find(' ') != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

} // namespace instman
