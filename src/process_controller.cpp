#include "process_controller.hpp"
#include "process_match.hpp"
#include <thread>
#include <unistd.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace instman {

ProcessController::ProcessController(InstanceRegistry& registry,
                                     IProcessQuery& query,
                                     IProcessLauncher& launcher,
                                     IProcessKiller& killer,
                                     ControllerOptions options)
    : registry_(registry)
    , query_(query)
    , launcher_(launcher)
    , killer_(killer)
    , options_(std::move(options))
    , self_pid_(static_cast<int>(getpid()))
{
}

void ProcessController::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<QueryError> ProcessController::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<QueryError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

bool ProcessController::check_running(const Instance& instance) {
    const auto processes = query_.get_all_processes();
    return !find_instance_processes(processes, instance, options_.process_name, self_pid_).empty();
}

bool ProcessController::is_running(const Instance& instance) {
    try {
        return check_running(instance);
    } catch (const TransientQueryError& e) {
        spdlog::warn("Status query for instance {} failed: {}", instance.name, e.what());
        add_error(fmt::format("{}: {}", instance.name, e.what()));
        return false;
    }
}

bool ProcessController::status(const std::string& id) {
    return is_running(registry_.get(id));
}

std::vector<Instance> ProcessController::running_instances() {
    std::vector<ProcessInfo> processes;
    try {
        processes = query_.get_all_processes();
    } catch (const TransientQueryError& e) {
        spdlog::warn("Process table scan failed: {}", e.what());
        add_error(e.what());
        return {};
    }

    std::vector<Instance> running;
    for (auto& instance : registry_.list()) {
        if (!find_instance_processes(processes, instance, options_.process_name, self_pid_).empty()) {
            running.push_back(std::move(instance));
        }
    }
    return running;
}

void ProcessController::launch(Instance& instance) {
    std::vector<std::string> args = instance.last_launch_args ? *instance.last_launch_args
                                                              : instance.launch_args();
    const std::string executable = instance.executable.value_or(options_.executable);

    LaunchResult result = launcher_.launch(executable, args);
    if (!result.success) {
        spdlog::error("Failed to start instance {} ({}): {}", instance.name, instance.id, result.error_message);
        throw ExternalProcessError(fmt::format("Failed to start instance {}: {}", instance.name, result.error_message));
    }

    spdlog::info("Started instance {} ({}) as pid {}", instance.name, instance.id, result.pid);
    instance.last_launch_args = std::move(args);
}

bool ProcessController::wait_until_gone(const std::vector<int>& pids, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        bool any_alive = false;
        for (int pid : pids) {
            if (killer_.is_alive(pid)) {
                any_alive = true;
                break;
            }
        }
        if (!any_alive) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(options_.poll_step);
    }
}

bool ProcessController::terminate(Instance& instance) {
    std::vector<ProcessInfo> processes;
    try {
        processes = query_.get_all_processes();
    } catch (const TransientQueryError& e) {
        add_error(e.what());
        throw ExternalProcessError(fmt::format("Cannot stop instance {}: {}", instance.name, e.what()));
    }

    const auto roots = find_root_processes(processes, instance, options_.process_name, self_pid_);
    if (roots.empty()) {
        spdlog::info("Instance {} is not running", instance.name);
        return false;
    }

    // Keep the arguments the user actually launched with for the next start
    for (const auto* root : roots) {
        std::vector<std::string> args;
        if (root->args.size() > 1) {
            args.assign(root->args.begin() + 1, root->args.end());
        }
        if (!has_helper_marker(args)) {
            instance.last_launch_args = std::move(args);
            break;
        }
    }

    std::vector<int> pids;
    for (const auto* root : roots) {
        KillResult result = killer_.kill_process(root->pid, false);
        if (!result.success && result.process_still_running) {
            spdlog::error("Failed to signal pid {} of instance {}: {}", root->pid, instance.name, result.error_message);
            throw ExternalProcessError(fmt::format("Failed to stop instance {}: {}", instance.name, result.error_message));
        }
        pids.push_back(root->pid);
    }

    if (!wait_until_gone(pids, options_.stop_timeout)) {
        for (int pid : pids) {
            if (!killer_.is_alive(pid)) continue;
            spdlog::warn("Instance {} pid {} ignored SIGTERM, sending SIGKILL", instance.name, pid);
            KillResult result = killer_.kill_process_tree(pid, true);
            if (!result.success) {
                spdlog::error("SIGKILL of pid {} failed: {}", pid, result.error_message);
            }
        }

        if (!wait_until_gone(pids, options_.kill_timeout)) {
            throw ExternalProcessError(fmt::format("Instance {} is still running after SIGKILL", instance.name));
        }
    }

    spdlog::info("Stopped instance {} ({})", instance.name, instance.id);
    return true;
}

bool ProcessController::start(const std::string& id) {
    bool launched = false;
    registry_.mutate(id, [&](Instance& instance) {
        if (is_running(instance)) {
            spdlog::info("Instance {} is already running", instance.name);
            return;
        }
        launch(instance);
        launched = true;
    });
    return launched;
}

void ProcessController::stop(const std::string& id) {
    registry_.mutate(id, [&](Instance& instance) {
        terminate(instance);
    });
}

void ProcessController::restart(const std::string& id) {
    registry_.mutate(id, [&](Instance& instance) {
        terminate(instance);
        launch(instance);
    });
}

} // namespace instman
