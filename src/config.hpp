#pragma once

#include "recommendation.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace instman {

struct AppConfig {
    std::filesystem::path data_dir;             // instances.json, instances/, accounts/, logs/
    std::string executable = "antigravity";
    std::string process_name;                   // defaults to the executable file name
    std::string default_user_data_dir;          // empty: detect at startup

    std::chrono::milliseconds list_poll_interval{2000};
    std::chrono::milliseconds overview_poll_interval{5000};
    size_t poll_workers = 4;
    std::chrono::milliseconds stop_timeout{5000};

    std::vector<std::string> switch_hook;       // argv, empty: restart the instance

    std::string log_level = "info";
    std::filesystem::path log_file;

    std::vector<CategoryRule> categories;

    // File the values came from, empty when defaults were used
    std::filesystem::path source;

    [[nodiscard]] std::filesystem::path accounts_dir() const { return data_dir / "accounts"; }
};

// $XDG_CONFIG_HOME/instman/config.json, or ~/.config/instman/config.json
std::filesystem::path default_config_path();

// Loads explicit_path, else $INSTMAN_CONFIG, else default_config_path().
// A missing file gives defaults; a malformed one throws ValidationError.
// INSTMAN_DATA_DIR and INSTMAN_LOG_LEVEL override the file.
AppConfig load_config(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

// Parses config text on top of the defaults. Throws ValidationError.
AppConfig parse_config(const std::string& text);

// Expands a leading "~/" to $HOME
std::filesystem::path expand_user_path(const std::string& path);

} // namespace instman
