#include "instance_actions.hpp"
#include "string_utils.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace instman {

InstanceActions::InstanceActions(Core& core)
    : core_(core)
{
}

template <typename Fn>
ActionResult InstanceActions::run(const char* what, Fn&& fn) {
    ActionResult result;
    try {
        result.message = fn();
        result.success = true;
    } catch (const Error& e) {
        spdlog::warn("{} failed: {}", what, e.what());
        result.message = e.what();
        result.error_kind = e.kind();
    }
    return result;
}

ActionResult InstanceActions::toggle_running(const std::string& instance_id) {
    return run("Start/stop", [&] {
        auto& controller = core_.controller();
        const auto instance = core_.registry().get(instance_id);
        if (controller.status(instance_id)) {
            controller.stop(instance_id);
            return fmt::format("Stopped {}", instance.name);
        }
        if (!controller.start(instance_id)) {
            return fmt::format("{} is already running", instance.name);
        }
        return fmt::format("Started {}", instance.name);
    });
}

ActionResult InstanceActions::restart(const std::string& instance_id) {
    return run("Restart", [&] {
        core_.controller().restart(instance_id);
        return fmt::format("Restarted {}", core_.registry().get(instance_id).name);
    });
}

ActionResult InstanceActions::create(const std::string& name, const std::string& user_data_dir,
                                     const std::string& extra_args) {
    return run("Create", [&] {
        const auto instance = core_.registry().create(name, user_data_dir, split_args(extra_args));
        return fmt::format("Created {}", instance.name);
    });
}

ActionResult InstanceActions::rename(const std::string& instance_id, const std::string& name) {
    return run("Rename", [&] {
        auto instance = core_.registry().get(instance_id);
        instance.name = name;
        core_.registry().update(instance);
        return fmt::format("Renamed to {}", trim(name));
    });
}

ActionResult InstanceActions::remove(const std::string& instance_id) {
    return run("Delete", [&] {
        const auto instance = core_.registry().get(instance_id);
        core_.bindings().remove_instance(instance_id);
        return fmt::format("Deleted {}", instance.name);
    });
}

ActionResult InstanceActions::bind(const std::string& instance_id, const std::string& account_id) {
    return run("Bind", [&] {
        core_.bindings().bind(account_id, instance_id);
        return fmt::format("Bound {}", account_id);
    });
}

ActionResult InstanceActions::unbind(const std::string& instance_id, const std::string& account_id) {
    return run("Unbind", [&] {
        core_.bindings().unbind(account_id, instance_id);
        return fmt::format("Unbound {}", account_id);
    });
}

ActionResult InstanceActions::switch_account(const std::string& instance_id, const std::string& account_id) {
    return run("Switch", [&] {
        core_.bindings().switch_account(instance_id, account_id);
        return fmt::format("Switched to {}", account_id);
    });
}

ActionResult InstanceActions::migrate() {
    return run("Migrate", [&] {
        const size_t count = core_.bindings().migrate_legacy_accounts();
        return fmt::format("Bound {} account(s) to the default instance", count);
    });
}

ActionResult InstanceActions::prune() {
    return run("Prune", [&] {
        const size_t count = core_.bindings().prune_missing_accounts();
        return fmt::format("Removed {} stale binding(s)", count);
    });
}

std::vector<Account> InstanceActions::load_accounts() {
    try {
        return core_.accounts().list_accounts();
    } catch (const Error& e) {
        spdlog::warn("Cannot load accounts: {}", e.what());
        return {};
    }
}

std::vector<QueryError> InstanceActions::recent_errors() {
    return core_.controller().get_recent_errors();
}

} // namespace instman
