#pragma once

#include "config.hpp"

namespace instman {

enum class LogOutput {
    FileOnly,         // curses and GUI front-ends own the terminal
    FileAndStderr
};

// Installs the default spdlog logger: a rotating file at config.log_file,
// plus stderr when requested. Falls back to stderr alone when the log file
// cannot be opened.
void init_logging(const AppConfig& config, LogOutput output);

} // namespace instman
