#include "config.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "string_utils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace fs = std::filesystem;

namespace instman {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

fs::path home_dir() {
    std::string home = env_or_empty("HOME");
    return home.empty() ? fs::path("/tmp") : fs::path(home);
}

std::chrono::milliseconds read_interval(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    const auto ms = it->get<int64_t>();
    if (ms <= 0) {
        throw ValidationError(fmt::format("Config key '{}' must be positive", key));
    }
    return std::chrono::milliseconds(ms);
}

void apply_json(AppConfig& config, const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(fmt::format("Malformed config: {}", e.what()));
    }
    if (!j.is_object()) {
        throw ValidationError("Malformed config: top level must be an object");
    }

    try {
        if (j.contains("data_dir")) config.data_dir = expand_user_path(j["data_dir"].get<std::string>());
        if (j.contains("executable")) config.executable = j["executable"].get<std::string>();
        if (j.contains("process_name")) config.process_name = j["process_name"].get<std::string>();
        if (j.contains("default_user_data_dir")) {
            config.default_user_data_dir = expand_user_path(j["default_user_data_dir"].get<std::string>()).string();
        }

        config.list_poll_interval = read_interval(j, "list_poll_interval_ms", config.list_poll_interval);
        config.overview_poll_interval = read_interval(j, "overview_poll_interval_ms", config.overview_poll_interval);
        config.stop_timeout = read_interval(j, "stop_timeout_ms", config.stop_timeout);

        if (j.contains("poll_workers")) {
            const auto workers = j["poll_workers"].get<int>();
            if (workers < 1) {
                throw ValidationError("Config key 'poll_workers' must be at least 1");
            }
            config.poll_workers = static_cast<size_t>(workers);
        }

        if (j.contains("switch_hook")) config.switch_hook = j["switch_hook"].get<std::vector<std::string>>();
        if (j.contains("log_level")) config.log_level = j["log_level"].get<std::string>();
        if (j.contains("log_file")) config.log_file = expand_user_path(j["log_file"].get<std::string>());
        if (j.contains("categories")) config.categories = j["categories"].get<std::vector<CategoryRule>>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(fmt::format("Invalid config value: {}", e.what()));
    }
}

void finalize(AppConfig& config) {
    if (config.data_dir.empty()) {
        config.data_dir = home_dir() / ".instman";
    }
    if (config.process_name.empty()) {
        config.process_name = fs::path(config.executable).filename().string();
    }
    if (config.log_file.empty()) {
        config.log_file = config.data_dir / "logs" / "instman.log";
    }
    if (config.categories.empty()) {
        config.categories = default_categories();
    }
    config.log_level = to_lower(config.log_level);
    // from_str maps every unknown name to off
    if (config.log_level != "off" && spdlog::level::from_str(config.log_level) == spdlog::level::off) {
        throw ValidationError(fmt::format("Unknown log level '{}'", config.log_level));
    }
}

} // namespace

fs::path expand_user_path(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) {
        return home_dir() / path.substr(2);
    }
    return fs::path(path);
}

fs::path default_config_path() {
    const std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    const fs::path base = xdg.empty() ? home_dir() / ".config" : fs::path(xdg);
    return base / "instman" / "config.json";
}

AppConfig parse_config(const std::string& text) {
    AppConfig config;
    apply_json(config, text);
    finalize(config);
    return config;
}

AppConfig load_config(const std::optional<fs::path>& explicit_path) {
    fs::path path;
    if (explicit_path) {
        path = *explicit_path;
    } else if (std::string env_path = env_or_empty("INSTMAN_CONFIG"); !env_path.empty()) {
        path = expand_user_path(env_path);
    } else {
        path = default_config_path();
    }

    AppConfig config;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream file(path);
        if (!file) {
            throw ValidationError(fmt::format("Cannot read config file {}", path.string()));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        apply_json(config, ss.str());
        config.source = path;
    } else if (explicit_path) {
        throw ValidationError(fmt::format("Config file {} does not exist", path.string()));
    }

    if (std::string data_dir = env_or_empty("INSTMAN_DATA_DIR"); !data_dir.empty()) {
        config.data_dir = expand_user_path(data_dir);
    }
    if (std::string level = env_or_empty("INSTMAN_LOG_LEVEL"); !level.empty()) {
        config.log_level = level;
    }

    finalize(config);
    return config;
}

} // namespace instman
