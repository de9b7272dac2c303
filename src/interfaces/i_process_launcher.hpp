#pragma once

#include <string>
#include <vector>

namespace instman {

struct LaunchResult {
    bool success = false;
    int pid = 0;
    std::string error_message;
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Starts executable detached from the caller. args excludes argv[0].
    virtual LaunchResult launch(const std::string& executable, const std::vector<std::string>& args) = 0;
};

} // namespace instman
