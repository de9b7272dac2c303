#include "linux_process_killer.hpp"
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace instman {

namespace {

// Fields after "pid (comm) ": state ppid ...
// comm can contain spaces/parens, so find last ')'
bool read_stat_fields(int pid, char& state, int& ppid) {
    std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
    if (!file) return false;

    std::string content;
    std::getline(file, content);

    size_t comm_end = content.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= content.size()) return false;

    std::istringstream iss(content.substr(comm_end + 2));
    std::string state_field;
    iss >> state_field >> ppid;
    if (iss.fail() || state_field.empty()) return false;
    state = state_field[0];
    return true;
}

} // namespace

int LinuxProcessKiller::get_ppid(int pid) {
    char state = '?';
    int ppid = -1;
    return read_stat_fields(pid, state, ppid) ? ppid : -1;
}

char LinuxProcessKiller::get_state(int pid) {
    char state = '?';
    int ppid = -1;
    return read_stat_fields(pid, state, ppid) ? state : '?';
}

void LinuxProcessKiller::collect_descendants_from_proc(const int root_pid, std::vector<int>& result) {
    // Build parent -> children map by scanning /proc
    std::map<int, std::vector<int>> children_map;

    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const auto& name = it->path().filename().string();
        int pid = 0;
        auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (parse_ec != std::errc{} || ptr != name.data() + name.size()) continue;

        // Exited since readdir when the ppid cannot be read
        if (int ppid = get_ppid(pid); ppid > 0) {
            children_map[ppid].push_back(pid);
        }
    }

    // DFS to collect all descendants of root_pid
    std::vector<int> stack;
    stack.push_back(root_pid);
    std::set<int> visited;

    while (!stack.empty()) {
        int pid = stack.back();
        stack.pop_back();
        if (!visited.insert(pid).second) continue;

        result.push_back(pid);

        if (auto it = children_map.find(pid); it != children_map.end()) {
            for (int child : it->second) {
                stack.push_back(child);
            }
        }
    }
}

std::string LinuxProcessKiller::get_kill_error_message(int err) {
    switch (err) {
        case EPERM:
            return "Permission denied. The instance may belong to another user.";
        case ESRCH:
            return "Process not found. It may have already terminated.";
        case EINVAL:
            return "Invalid signal.";
        default:
            return fmt::format("Failed to send signal: {} (errno {})", strerror(err), err);
    }
}

bool LinuxProcessKiller::is_alive(int pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == -1 && errno == ESRCH) {
        return false;
    }
    // Zombies accept signals but are gone
    return get_state(pid) != 'Z';
}

KillResult LinuxProcessKiller::kill_process(int pid, bool force) {
    KillResult result;

    if (pid <= 0) {
        result.error_message = "Invalid PID";
        return result;
    }

    const int signal = force ? SIGKILL : SIGTERM;
    if (kill(pid, signal) == -1) {
        const int err = errno;
        result.error_message = get_kill_error_message(err);
        // Already gone counts as stopped
        result.success = err == ESRCH;
        result.process_still_running = err != ESRCH;
        return result;
    }

    result.success = true;
    result.process_still_running = is_alive(pid);
    return result;
}

KillResult LinuxProcessKiller::kill_process_tree(int pid, bool force) {
    KillResult result;

    if (pid <= 0) {
        result.error_message = "Invalid PID";
        return result;
    }

    std::vector<int> descendants;
    collect_descendants_from_proc(pid, descendants);
    std::set<int> descendant_set(descendants.begin(), descendants.end());

    // Children map restricted to the tree
    std::map<int, std::vector<int>> children_map;
    for (int p : descendants) {
        if (int ppid = get_ppid(p); ppid > 0 && p != pid && descendant_set.contains(ppid)) {
            children_map[ppid].push_back(p);
        }
    }

    // Post-order traversal to get kill order (children before parents)
    std::vector<int> kill_order;
    std::set<int> visited;

    std::function<void(int)> postorder = [&](int p) {
        if (!visited.insert(p).second) return;

        if (const auto it = children_map.find(p); it != children_map.end()) {
            for (const int child : it->second) {
                postorder(child);
            }
        }
        kill_order.push_back(p);
    };

    postorder(pid);

    const int signal = force ? SIGKILL : SIGTERM;
    int first_error = 0;
    for (const int p : kill_order) {
        if (kill(p, signal) == -1 && errno != ESRCH && first_error == 0) {
            first_error = errno;
        }
    }

    result.process_still_running = is_alive(pid);
    if (first_error != 0) {
        result.success = false;
        result.error_message = get_kill_error_message(first_error);
        return result;
    }

    result.success = true;
    return result;
}

} // namespace instman
