#include "process_match.hpp"
#include "string_utils.hpp"
#include <map>
#include <set>

namespace instman {

namespace {

bool same_name(const std::string& a, const std::string& b) {
    return to_lower(a) == to_lower(b);
}

} // namespace

std::optional<std::string> find_user_data_dir_arg(const std::vector<std::string>& args) {
    const std::string flag = kUserDataDirFlag;
    const std::string prefix = flag + "=";

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].rfind(prefix, 0) == 0) {
            return args[i].substr(prefix.size());
        }
        if (args[i] == flag && i + 1 < args.size()) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

bool process_belongs_to(const ProcessInfo& process, const Instance& instance, const std::string& process_name) {
    const auto dir = find_user_data_dir_arg(process.args);

    if (dir) {
        return normalize_dir(*dir) == normalize_dir(instance.user_data_dir);
    }
    return instance.is_default && same_name(process.name, process_name);
}

std::vector<const ProcessInfo*> find_instance_processes(const std::vector<ProcessInfo>& processes,
                                                        const Instance& instance,
                                                        const std::string& process_name,
                                                        int self_pid) {
    std::vector<const ProcessInfo*> result;
    for (const auto& process : processes) {
        if (process.pid == self_pid) continue;
        if (process_belongs_to(process, instance, process_name)) {
            result.push_back(&process);
        }
    }
    return result;
}

std::vector<const ProcessInfo*> find_root_processes(const std::vector<ProcessInfo>& processes,
                                                    const Instance& instance,
                                                    const std::string& process_name,
                                                    int self_pid) {
    std::map<int, const ProcessInfo*> by_pid;
    for (const auto& process : processes) {
        by_pid[process.pid] = &process;
    }

    std::vector<const ProcessInfo*> roots;
    std::set<int> seen;

    for (const auto* process : find_instance_processes(processes, instance, process_name, self_pid)) {
        const ProcessInfo* root = process;
        std::set<int> visited{root->pid};

        while (true) {
            auto it = by_pid.find(root->parent_pid);
            if (it == by_pid.end() || it->second->pid == self_pid) break;
            if (!same_name(it->second->name, root->name)) break;
            if (!visited.insert(it->second->pid).second) break;
            root = it->second;
        }

        if (seen.insert(root->pid).second) {
            roots.push_back(root);
        }
    }
    return roots;
}

std::optional<std::string> detect_running_user_data_dir(const std::vector<ProcessInfo>& processes,
                                                        const std::string& process_name,
                                                        int self_pid) {
    for (const auto& process : processes) {
        if (process.pid == self_pid || !same_name(process.name, process_name)) continue;
        if (has_helper_marker(process.args)) continue;
        if (auto dir = find_user_data_dir_arg(process.args)) {
            return normalize_dir(*dir);
        }
    }
    return std::nullopt;
}

} // namespace instman
