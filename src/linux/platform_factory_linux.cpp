#include "../platform_factory.hpp"

#include "hook_account_switcher.hpp"
#include "linux_process_killer.hpp"
#include "linux_process_launcher.hpp"
#include "linux_process_query.hpp"

namespace instman {

std::unique_ptr<IProcessQuery> make_process_query() {
    return std::make_unique<LinuxProcessQuery>();
}

std::unique_ptr<IProcessLauncher> make_process_launcher() {
    return std::make_unique<LinuxProcessLauncher>();
}

std::unique_ptr<IProcessKiller> make_process_killer() {
    return std::make_unique<LinuxProcessKiller>();
}

std::unique_ptr<IAccountSwitcher> make_account_switcher(ProcessController& controller,
                                                        std::vector<std::string> switch_hook) {
    return std::make_unique<HookAccountSwitcher>(controller, std::move(switch_hook));
}

} // namespace instman
