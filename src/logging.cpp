#include "logging.hpp"
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace instman {

namespace {

constexpr size_t kMaxLogSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

} // namespace

void init_logging(const AppConfig& config, LogOutput output) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;

    try {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file.string(), kMaxLogSize, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
    }

    if (output == LogOutput::FileAndStderr || sinks.empty()) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        // The CLI prints results on stdout; keep stderr quiet unless asked
        if (output == LogOutput::FileAndStderr) {
            console->set_level(spdlog::level::warn);
        }
        sinks.push_back(console);
    }

    auto logger = std::make_shared<spdlog::logger>("instman", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("Cannot open log file {}: {}", config.log_file.string(), file_error);
    }
}

} // namespace instman
