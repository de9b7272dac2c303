#pragma once

#include "instance.hpp"
#include "process_info.hpp"
#include <optional>
#include <string>
#include <vector>

namespace instman {

// Value of --user-data-dir in either "--user-data-dir=<dir>" or
// "--user-data-dir <dir>" form
std::optional<std::string> find_user_data_dir_arg(const std::vector<std::string>& args);

// A non-default instance owns every process launched with its user data dir.
// The default instance owns application processes launched without one.
bool process_belongs_to(const ProcessInfo& process, const Instance& instance, const std::string& process_name);

// Every process of the instance, excluding self_pid
std::vector<const ProcessInfo*> find_instance_processes(const std::vector<ProcessInfo>& processes,
                                                        const Instance& instance,
                                                        const std::string& process_name,
                                                        int self_pid);

// Topmost process of each same-name parent chain owning the instance
std::vector<const ProcessInfo*> find_root_processes(const std::vector<ProcessInfo>& processes,
                                                    const Instance& instance,
                                                    const std::string& process_name,
                                                    int self_pid);

// User data dir of the first running application root process launched with
// one, used to place a default instance the manager did not create
std::optional<std::string> detect_running_user_data_dir(const std::vector<ProcessInfo>& processes,
                                                        const std::string& process_name,
                                                        int self_pid);

} // namespace instman
