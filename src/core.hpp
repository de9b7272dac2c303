#pragma once

#include "binding_manager.hpp"
#include "config.hpp"
#include "instance_registry.hpp"
#include "interfaces/i_account_source.hpp"
#include "interfaces/i_account_switcher.hpp"
#include "interfaces/i_instance_store.hpp"
#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_process_launcher.hpp"
#include "interfaces/i_process_query.hpp"
#include "process_controller.hpp"
#include "status_poller.hpp"
#include <memory>

namespace instman {

// Builds the storage, platform collaborators and core services from the
// configuration. Shared by the CLI, curses and GUI front-ends.
class Core {
public:
    explicit Core(AppConfig config);
    ~Core();

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    [[nodiscard]] const AppConfig& config() const { return config_; }
    [[nodiscard]] InstanceRegistry& registry() { return *registry_; }
    [[nodiscard]] ProcessController& controller() { return *controller_; }
    [[nodiscard]] BindingManager& bindings() { return *bindings_; }
    [[nodiscard]] IAccountSource& accounts() { return *accounts_; }

    // Poller over all registry instances probing through the controller
    [[nodiscard]] std::unique_ptr<StatusPoller> make_poller(std::chrono::milliseconds interval);

private:
    std::string resolve_default_user_data_dir();

    AppConfig config_;
    std::unique_ptr<IInstanceStore> store_;
    std::unique_ptr<IAccountSource> accounts_;
    std::unique_ptr<IProcessQuery> query_;
    std::unique_ptr<IProcessLauncher> launcher_;
    std::unique_ptr<IProcessKiller> killer_;
    std::unique_ptr<InstanceRegistry> registry_;
    std::unique_ptr<ProcessController> controller_;
    std::unique_ptr<IAccountSwitcher> switcher_;
    std::unique_ptr<BindingManager> bindings_;
};

} // namespace instman
