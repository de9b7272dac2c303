#pragma once

#include "../instance.hpp"
#include <string>

namespace instman {

struct SwitchResult {
    bool success = false;
    std::string error_message;
};

// Makes a running instance use another account. The instance passed in is the
// caller's working copy; a switcher that relaunches the application records
// the new launch arguments on it.
class IAccountSwitcher {
public:
    virtual ~IAccountSwitcher() = default;

    virtual SwitchResult switch_account(Instance& instance, const std::string& account_id) = 0;
};

} // namespace instman
