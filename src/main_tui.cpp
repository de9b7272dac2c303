#include "config.hpp"
#include "core.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "tui/tui_app.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Usage: instman-tui [--config <file>]" << std::endl;
            return 2;
        }
    }

    try {
        auto config = instman::load_config(config_path);

        // The terminal belongs to curses, so log to the file only
        instman::init_logging(config, instman::LogOutput::FileOnly);

        instman::Core core(config);
        core.registry().ensure_default();

        instman::TuiApp app(core);
        app.run();
        return 0;
    } catch (const instman::Error& e) {
        // Make sure we restore terminal state before printing error
        if (!isendwin()) endwin();
        spdlog::error("instman-tui failed: {}", e.what());
        std::cerr << instman::to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        if (!isendwin()) endwin();
        spdlog::error("instman-tui failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
