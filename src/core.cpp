#include "core.hpp"
#include "json_account_source.hpp"
#include "json_instance_store.hpp"
#include "platform_factory.hpp"
#include "process_match.hpp"
#include <cctype>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace instman {

Core::Core(AppConfig config)
    : config_(std::move(config))
{
    store_ = std::make_unique<JsonInstanceStore>(config_.data_dir);
    accounts_ = std::make_unique<JsonAccountSource>(config_.accounts_dir());
    query_ = make_process_query();
    launcher_ = make_process_launcher();
    killer_ = make_process_killer();

    registry_ = std::make_unique<InstanceRegistry>(*store_, config_.default_user_data_dir);
    if (config_.default_user_data_dir.empty() && !registry_->find_default()) {
        registry_->set_default_user_data_dir(resolve_default_user_data_dir());
    }

    ControllerOptions options;
    options.executable = config_.executable;
    options.process_name = config_.process_name;
    options.stop_timeout = config_.stop_timeout;
    controller_ = std::make_unique<ProcessController>(*registry_, *query_, *launcher_, *killer_, options);

    switcher_ = make_account_switcher(*controller_, config_.switch_hook);
    bindings_ = std::make_unique<BindingManager>(*registry_, *controller_, *accounts_, *switcher_);

    spdlog::info("instman core ready (data dir {}, executable {})",
                 config_.data_dir.string(), config_.executable);
}

Core::~Core() = default;

std::string Core::resolve_default_user_data_dir() {
    try {
        auto dir = detect_running_user_data_dir(query_->get_all_processes(), config_.process_name,
                                                static_cast<int>(getpid()));
        // A dir another instance owns is that instance running, not the default
        if (dir && !registry_->owns_user_data_dir(*dir)) {
            spdlog::info("Using user data dir {} of the running application for the default instance", *dir);
            return *dir;
        }
    } catch (const TransientQueryError& e) {
        spdlog::warn("Cannot inspect running processes for the default user data dir: {}", e.what());
    }

    // Electron keeps its profile in ~/.config/<ProductName>
    std::string product = config_.process_name;
    if (!product.empty()) {
        product[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(product[0])));
    }
    return (expand_user_path("~/.config") / product).string();
}

std::unique_ptr<StatusPoller> Core::make_poller(std::chrono::milliseconds interval) {
    return std::make_unique<StatusPoller>(
        [this] { return registry_->list(); },
        [this](const Instance& instance) { return controller_->check_running(instance); },
        interval,
        config_.poll_workers);
}

} // namespace instman
