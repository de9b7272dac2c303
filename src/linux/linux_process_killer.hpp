#pragma once

#include "../interfaces/i_process_killer.hpp"
#include <vector>

namespace instman {

class LinuxProcessKiller : public IProcessKiller {
public:
    LinuxProcessKiller() = default;
    ~LinuxProcessKiller() override = default;

    KillResult kill_process(int pid, bool force) override;
    KillResult kill_process_tree(int pid, bool force) override;
    bool is_alive(int pid) override;

private:
    static std::string get_kill_error_message(int err);
    static void collect_descendants_from_proc(int root_pid, std::vector<int>& result);
    static int get_ppid(int pid);
    static char get_state(int pid);
};

} // namespace instman
