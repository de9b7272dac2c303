#pragma once

#include "interfaces/i_account_switcher.hpp"
#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_process_launcher.hpp"
#include "interfaces/i_process_query.hpp"
#include <memory>
#include <string>
#include <vector>

namespace instman {

class ProcessController;

// Factory functions to create platform-specific collaborators.
// Implemented per-platform; current build provides Linux implementations.
std::unique_ptr<IProcessQuery> make_process_query();
std::unique_ptr<IProcessLauncher> make_process_launcher();
std::unique_ptr<IProcessKiller> make_process_killer();
std::unique_ptr<IAccountSwitcher> make_account_switcher(ProcessController& controller,
                                                        std::vector<std::string> switch_hook);

} // namespace instman
