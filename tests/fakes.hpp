#pragma once

#include "binding_manager.hpp"
#include "errors.hpp"
#include "instance_registry.hpp"
#include "interfaces/i_account_source.hpp"
#include "interfaces/i_account_switcher.hpp"
#include "interfaces/i_instance_store.hpp"
#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_process_launcher.hpp"
#include "interfaces/i_process_query.hpp"
#include "process_controller.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>

namespace instman::test {

inline constexpr const char* kAppName = "app";

// Scratch directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / fmt::format("instman-test-{:016x}",
            (static_cast<uint64_t>(rd()) << 32) | rd());
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::string sub(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

class MemoryInstanceStore : public IInstanceStore {
public:
    std::vector<Instance> load_all() override {
        std::lock_guard lock(mutex);
        std::vector<Instance> result;
        for (const auto& [id, instance] : records) {
            result.push_back(instance);
        }
        return result;
    }

    void save(const Instance& instance) override {
        std::lock_guard lock(mutex);
        if (fail_saves) {
            throw StorageError("disk full");
        }
        records[instance.id] = instance;
        ++save_count;
    }

    void remove(const std::string& id) override {
        if (on_remove) {
            on_remove();
        }
        std::lock_guard lock(mutex);
        if (fail_saves) {
            throw StorageError("disk full");
        }
        records.erase(id);
    }

    std::mutex mutex;
    std::map<std::string, Instance> records;
    bool fail_saves = false;
    int save_count = 0;
    // Runs at the start of remove(), outside the store lock
    std::function<void()> on_remove;
};

class FakeAccountSource : public IAccountSource {
public:
    AccountListing read_accounts() override { return {accounts, skipped}; }

    void add(const std::string& id, const std::string& email = {}) {
        Account account;
        account.id = id;
        account.email = email.empty() ? id + "@example.com" : email;
        accounts.push_back(account);
    }

    std::vector<Account> accounts;
    std::vector<std::string> skipped;
};

// Mutable process table shared by the launcher and killer fakes
class FakeProcessQuery : public IProcessQuery {
public:
    std::vector<ProcessInfo> get_all_processes() override {
        std::lock_guard lock(mutex_);
        if (fail) {
            throw TransientQueryError("process table unavailable");
        }
        return processes_;
    }

    std::vector<QueryError> get_recent_errors() override { return {}; }
    void clear_errors() override {}

    void add(ProcessInfo process) {
        std::lock_guard lock(mutex_);
        processes_.push_back(std::move(process));
    }

    // Adds an application process; args exclude argv[0]
    void add_app(int pid, int parent_pid, std::vector<std::string> args) {
        ProcessInfo process;
        process.pid = pid;
        process.parent_pid = parent_pid;
        process.name = kAppName;
        process.executable_path = std::string("/usr/bin/") + kAppName;
        process.args.push_back(kAppName);
        process.args.insert(process.args.end(), args.begin(), args.end());
        add(std::move(process));
    }

    [[nodiscard]] bool has(int pid) {
        std::lock_guard lock(mutex_);
        return std::any_of(processes_.begin(), processes_.end(),
                           [pid](const ProcessInfo& p) { return p.pid == pid; });
    }

    // Removes pid and every descendant
    void remove_tree(int pid) {
        std::lock_guard lock(mutex_);
        std::set<int> doomed{pid};
        bool grew = true;
        while (grew) {
            grew = false;
            for (const auto& p : processes_) {
                if (doomed.contains(p.parent_pid) && doomed.insert(p.pid).second) {
                    grew = true;
                }
            }
        }
        std::erase_if(processes_, [&](const ProcessInfo& p) { return doomed.contains(p.pid); });
    }

    bool fail = false;

private:
    std::mutex mutex_;
    std::vector<ProcessInfo> processes_;
};

class FakeLauncher : public IProcessLauncher {
public:
    explicit FakeLauncher(FakeProcessQuery& query) : query_(query) {}

    LaunchResult launch(const std::string& executable, const std::vector<std::string>& args) override {
        calls.emplace_back(executable, args);
        if (fail) {
            return {false, 0, "exec failed"};
        }

        const int pid = next_pid++;
        ProcessInfo process;
        process.pid = pid;
        process.parent_pid = 1;
        process.name = std::filesystem::path(executable).filename().string();
        process.args.push_back(executable);
        process.args.insert(process.args.end(), args.begin(), args.end());
        query_.add(std::move(process));
        return {true, pid, {}};
    }

    std::vector<std::pair<std::string, std::vector<std::string>>> calls;
    bool fail = false;
    int next_pid = 1000;

private:
    FakeProcessQuery& query_;
};

// Signals remove processes from the fake table. Stubborn pids survive SIGTERM.
class FakeKiller : public IProcessKiller {
public:
    explicit FakeKiller(FakeProcessQuery& query) : query_(query) {}

    KillResult kill_process(int pid, bool force) override {
        return deliver(pid, force);
    }

    KillResult kill_process_tree(int pid, bool force) override {
        tree_kills.push_back(pid);
        return deliver(pid, force);
    }

    bool is_alive(int pid) override { return query_.has(pid); }

    std::set<int> stubborn;
    std::vector<std::pair<int, bool>> signals;   // pid, force
    std::vector<int> tree_kills;

private:
    KillResult deliver(int pid, bool force) {
        signals.emplace_back(pid, force);
        if (!query_.has(pid)) {
            return {false, false, "No such process"};
        }
        if (force || !stubborn.contains(pid)) {
            query_.remove_tree(pid);
        }
        return {true, false, {}};
    }

    FakeProcessQuery& query_;
};

class FakeSwitcher : public IAccountSwitcher {
public:
    SwitchResult switch_account(Instance& instance, const std::string& account_id) override {
        calls.emplace_back(instance.id, account_id);
        if (fail) {
            return {false, "hook exited with status 1"};
        }
        return {true, {}};
    }

    std::vector<std::pair<std::string, std::string>> calls;   // instance id, account id
    bool fail = false;
};

inline ControllerOptions test_controller_options() {
    ControllerOptions options;
    options.executable = kAppName;
    options.process_name = kAppName;
    options.stop_timeout = std::chrono::milliseconds(50);
    options.kill_timeout = std::chrono::milliseconds(200);
    options.poll_step = std::chrono::milliseconds(5);
    return options;
}

// Core services wired to fakes, rooted in a scratch directory
struct TestWorld {
    TempDir temp;
    MemoryInstanceStore store;
    FakeProcessQuery query;
    FakeLauncher launcher{query};
    FakeKiller killer{query};
    FakeAccountSource accounts;
    FakeSwitcher switcher;
    InstanceRegistry registry{store, temp.sub("default")};
    ProcessController controller{registry, query, launcher, killer, test_controller_options()};
    BindingManager bindings{registry, controller, accounts, switcher};

    Instance create(const std::string& name) {
        return registry.create(name, temp.sub(name));
    }

    // Marks a non-default instance as running under pid
    void run(const Instance& instance, int pid) {
        query.add_app(pid, 1, {std::string(kUserDataDirFlag) + "=" + instance.user_data_dir});
    }
};

} // namespace instman::test
