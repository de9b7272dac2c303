#pragma once

#include "../interfaces/i_account_switcher.hpp"
#include "../process_controller.hpp"
#include <string>
#include <vector>

namespace instman {

// With a hook configured, runs `hook... <user_data_dir> <account_id>` with
// INSTMAN_INSTANCE_ID and INSTMAN_ACCOUNT_ID set, and waits for it; a zero
// exit status is success.
//
// Without a hook the instance is only restarted with its recorded arguments.
// The account id is not passed to the application, so the switch takes effect
// only if the application reads its selected account from the user data dir
// on startup. Configure switch_hook when it does not.
class HookAccountSwitcher : public IAccountSwitcher {
public:
    HookAccountSwitcher(ProcessController& controller, std::vector<std::string> hook);
    ~HookAccountSwitcher() override = default;

    SwitchResult switch_account(Instance& instance, const std::string& account_id) override;

private:
    SwitchResult run_hook(const Instance& instance, const std::string& account_id);
    SwitchResult restart(Instance& instance);

    ProcessController& controller_;
    std::vector<std::string> hook_;
};

} // namespace instman
