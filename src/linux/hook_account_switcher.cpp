#include "hook_account_switcher.hpp"
#include <cerrno>
#include <cstring>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace instman {

namespace {

// The current environment with the hook variables replaced. Built before
// fork() because the child of a threaded process may only call
// async-signal-safe functions.
std::vector<std::string> hook_environment(const std::string& instance_id, const std::string& account_id) {
    static constexpr std::string_view kInstanceVar = "INSTMAN_INSTANCE_ID=";
    static constexpr std::string_view kAccountVar = "INSTMAN_ACCOUNT_ID=";

    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view item(*entry);
        if (item.starts_with(kInstanceVar) || item.starts_with(kAccountVar)) continue;
        env.emplace_back(item);
    }
    env.push_back(std::string(kInstanceVar) + instance_id);
    env.push_back(std::string(kAccountVar) + account_id);
    return env;
}

} // namespace

HookAccountSwitcher::HookAccountSwitcher(ProcessController& controller, std::vector<std::string> hook)
    : controller_(controller)
    , hook_(std::move(hook))
{
}

SwitchResult HookAccountSwitcher::switch_account(Instance& instance, const std::string& account_id) {
    if (hook_.empty()) {
        return restart(instance);
    }
    return run_hook(instance, account_id);
}

SwitchResult HookAccountSwitcher::restart(Instance& instance) {
    SwitchResult result;
    try {
        controller_.terminate(instance);
        controller_.launch(instance);
        result.success = true;
    } catch (const ExternalProcessError& e) {
        result.error_message = e.what();
    }
    return result;
}

SwitchResult HookAccountSwitcher::run_hook(const Instance& instance, const std::string& account_id) {
    SwitchResult result;

    std::vector<std::string> local_argv = hook_;
    local_argv.push_back(instance.user_data_dir);
    local_argv.push_back(account_id);

    std::vector<char*> cargv;
    cargv.reserve(local_argv.size() + 1);
    for (auto& s : local_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env = hook_environment(instance.id, account_id);
    std::vector<char*> cenv;
    cenv.reserve(env.size() + 1);
    for (auto& s : env) cenv.push_back(s.data());
    cenv.push_back(nullptr);

    spdlog::debug("Running switch hook {} for instance {}", hook_.front(), instance.id);

    pid_t pid = fork();
    if (pid == -1) {
        result.error_message = fmt::format("fork failed: {}", strerror(errno));
        return result;
    }
    if (pid == 0) {
        execvpe(cargv[0], cargv.data(), cenv.data());
        _exit(127);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        result.error_message = fmt::format("waitpid failed: {}", strerror(errno));
        return result;
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.success = true;
    } else if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        result.error_message = fmt::format("Switch hook {} could not be executed", hook_.front());
    } else if (WIFEXITED(status)) {
        result.error_message = fmt::format("Switch hook exited with status {}", WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        result.error_message = fmt::format("Switch hook killed by signal {}", WTERMSIG(status));
    } else {
        result.error_message = "Switch hook ended abnormally";
    }
    return result;
}

} // namespace instman
