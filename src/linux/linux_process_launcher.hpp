#pragma once

#include "../interfaces/i_process_launcher.hpp"

namespace instman {

// Double forks so the launched application is reparented to init and never
// becomes a zombie of the manager. Exec failures are reported back through a
// close-on-exec pipe.
class LinuxProcessLauncher : public IProcessLauncher {
public:
    LinuxProcessLauncher() = default;
    ~LinuxProcessLauncher() override = default;

    LaunchResult launch(const std::string& executable, const std::vector<std::string>& args) override;
};

} // namespace instman
