#pragma once

#include "errors.hpp"
#include "instance.hpp"
#include "instance_registry.hpp"
#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_process_launcher.hpp"
#include "interfaces/i_process_query.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace instman {

struct ControllerOptions {
    std::string executable = "antigravity";
    std::string process_name = "antigravity";
    std::chrono::milliseconds stop_timeout{5000};
    std::chrono::milliseconds kill_timeout{2000};
    std::chrono::milliseconds poll_step{100};
};

// Starts and stops instances. Running state is observed from the process
// table on every call and never cached.
class ProcessController {
public:
    ProcessController(InstanceRegistry& registry,
                      IProcessQuery& query,
                      IProcessLauncher& launcher,
                      IProcessKiller& killer,
                      ControllerOptions options);

    // Returns false without launching when the instance is already running
    bool start(const std::string& id);
    // No-op when the instance is stopped
    void stop(const std::string& id);
    void restart(const std::string& id);

    // Query failures are logged, recorded and reported as not running
    [[nodiscard]] bool status(const std::string& id);

    // One process table scan for all instances
    [[nodiscard]] std::vector<Instance> running_instances();

    // The following work on a record copy, for callers already inside
    // InstanceRegistry::mutate.

    // Throws TransientQueryError
    [[nodiscard]] bool check_running(const Instance& instance);
    [[nodiscard]] bool is_running(const Instance& instance);
    // Records the arguments used into instance.last_launch_args
    void launch(Instance& instance);
    // Returns false when nothing was running
    bool terminate(Instance& instance);

    [[nodiscard]] const ControllerOptions& options() const { return options_; }

    std::vector<QueryError> get_recent_errors();

private:
    [[nodiscard]] bool wait_until_gone(const std::vector<int>& pids, std::chrono::milliseconds timeout);
    void add_error(const std::string& message);

    InstanceRegistry& registry_;
    IProcessQuery& query_;
    IProcessLauncher& launcher_;
    IProcessKiller& killer_;
    ControllerOptions options_;
    int self_pid_;

    std::mutex errors_mutex_;
    std::vector<QueryError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace instman
