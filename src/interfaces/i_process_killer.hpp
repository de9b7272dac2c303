#pragma once

#include <string>

namespace instman {

struct KillResult {
    bool success = false;
    bool process_still_running = false;
    std::string error_message;
};

class IProcessKiller {
public:
    virtual ~IProcessKiller() = default;

    // SIGTERM, or SIGKILL when force is set
    virtual KillResult kill_process(int pid, bool force) = 0;
    // Same signal to pid and all of its descendants, leaves first
    virtual KillResult kill_process_tree(int pid, bool force) = 0;
    [[nodiscard]] virtual bool is_alive(int pid) = 0;
};

} // namespace instman
