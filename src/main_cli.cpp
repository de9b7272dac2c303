#include "command_dispatcher.hpp"
#include "config.hpp"
#include "core.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCommandError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
    out << "Usage: instmanctl [--config <file>] <command> ['<json args>']\n"
        << "       instmanctl [--config <file>] commands\n"
        << "\n"
        << "Runs one instance manager command and prints its JSON result.\n"
        << "Example: instmanctl start_instance '{\"instanceId\":\"...\"}'\n";
}

void print_error(const std::string& kind, const std::string& message) {
    nlohmann::json error = {{"error", {{"kind", kind}, {"message", message}}}};
    std::cout << error.dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;
    std::string command;
    std::string raw_args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return kExitOk;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file argument\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
            config_path = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else if (raw_args.empty()) {
            raw_args = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
    }

    if (command.empty()) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    try {
        instman::AppConfig config = instman::load_config(config_path);
        instman::init_logging(config, instman::LogOutput::FileAndStderr);

        instman::Core core(config);
        instman::CommandDispatcher dispatcher(core.registry(), core.bindings(), core.controller(),
                                              core.accounts(), config.categories);

        if (command == "commands") {
            std::cout << nlohmann::json(dispatcher.command_names()).dump(2) << std::endl;
            return kExitOk;
        }

        nlohmann::json args = nlohmann::json::object();
        if (!raw_args.empty()) {
            try {
                args = nlohmann::json::parse(raw_args);
            } catch (const nlohmann::json::parse_error& e) {
                throw instman::ValidationError(std::string("Invalid JSON arguments: ") + e.what());
            }
        }

        nlohmann::json result = dispatcher.dispatch(command, args);
        std::cout << result.dump(2) << std::endl;
        return kExitOk;
    } catch (const instman::Error& e) {
        spdlog::error("{} failed: {}", command, e.what());
        print_error(instman::to_string(e.kind()), e.what());
        return kExitCommandError;
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", command, e.what());
        print_error("Error", e.what());
        return kExitCommandError;
    }
}
