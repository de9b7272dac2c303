#include "binding_manager.hpp"
#include "errors.hpp"
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace instman {

BindingManager::BindingManager(InstanceRegistry& registry,
                               ProcessController& controller,
                               IAccountSource& accounts,
                               IAccountSwitcher& switcher)
    : registry_(registry)
    , controller_(controller)
    , accounts_(accounts)
    , switcher_(switcher)
{
}

void BindingManager::require_account_id(const std::string& account_id) {
    if (account_id.empty()) {
        throw ValidationError("Account id must not be empty");
    }
}

void BindingManager::bind(const std::string& account_id, const std::string& instance_id) {
    require_account_id(account_id);
    bool added = false;
    registry_.mutate(instance_id, [&](Instance& instance) {
        added = instance.bind_account(account_id);
    });
    if (added) {
        spdlog::info("Bound account {} to instance {}", account_id, instance_id);
    }
}

void BindingManager::unbind(const std::string& account_id, const std::string& instance_id) {
    require_account_id(account_id);
    bool removed = false;
    registry_.mutate(instance_id, [&](Instance& instance) {
        removed = instance.unbind_account(account_id);
    });
    if (removed) {
        spdlog::info("Unbound account {} from instance {}", account_id, instance_id);
    }
}

void BindingManager::apply_current(Instance& instance, const std::string& account_id) {
    if (!instance.has_account(account_id)) {
        throw ValidationError(fmt::format("Account {} is not bound to instance {}", account_id, instance.name));
    }
    if (instance.current_account_id == account_id) {
        return;
    }

    if (controller_.is_running(instance)) {
        spdlog::info("Instance {} is running, switching it to account {}", instance.name, account_id);
        SwitchResult result = switcher_.switch_account(instance, account_id);
        if (!result.success) {
            spdlog::error("Account switch of instance {} to {} failed: {}",
                          instance.name, account_id, result.error_message);
            throw ExternalProcessError(fmt::format("Failed to switch instance {} to account {}: {}",
                                                   instance.name, account_id, result.error_message));
        }
    }

    instance.current_account_id = account_id;
}

void BindingManager::set_current_account(const std::string& instance_id, const std::string& account_id) {
    require_account_id(account_id);
    registry_.mutate(instance_id, [&](Instance& instance) {
        apply_current(instance, account_id);
    });
    spdlog::info("Set current account {} for instance {}", account_id, instance_id);
}

void BindingManager::switch_account(const std::string& instance_id, const std::string& account_id) {
    require_account_id(account_id);
    registry_.mutate(instance_id, [&](Instance& instance) {
        if (instance.bind_account(account_id)) {
            spdlog::info("Binding account {} to instance {} for switch", account_id, instance.name);
        }
        apply_current(instance, account_id);
    });
    spdlog::info("Switched instance {} to account {}", instance_id, account_id);
}

size_t BindingManager::migrate_legacy_accounts() {
    const auto accounts = accounts_.list_accounts();
    const Instance default_instance = registry_.ensure_default();

    std::set<std::string> bound;
    for (const auto& instance : registry_.list()) {
        bound.insert(instance.account_ids.begin(), instance.account_ids.end());
    }

    std::vector<std::string> unbound;
    for (const auto& account : accounts) {
        if (!account.id.empty() && !bound.contains(account.id)) {
            unbound.push_back(account.id);
        }
    }
    if (unbound.empty()) {
        return 0;
    }

    size_t count = 0;
    registry_.mutate(default_instance.id, [&](Instance& instance) {
        count = 0;
        for (const auto& account_id : unbound) {
            if (instance.bind_account(account_id)) {
                ++count;
            }
        }
    });

    spdlog::info("Migrated {} accounts to default instance {}", count, default_instance.id);
    return count;
}

std::vector<std::string> BindingManager::accounts_for_instance(const std::string& instance_id) const {
    return registry_.get(instance_id).account_ids;
}

std::vector<Instance> BindingManager::instances_for_account(const std::string& account_id) const {
    std::vector<Instance> result;
    for (auto& instance : registry_.list()) {
        if (instance.has_account(account_id)) {
            result.push_back(std::move(instance));
        }
    }
    return result;
}

void BindingManager::remove_instance(const std::string& instance_id) {
    registry_.remove(instance_id);
}

size_t BindingManager::forget_account(const std::string& account_id) {
    require_account_id(account_id);
    size_t count = 0;
    for (const auto& instance : instances_for_account(account_id)) {
        try {
            bool removed = false;
            registry_.mutate(instance.id, [&](Instance& next) {
                removed = next.unbind_account(account_id);
            });
            if (removed) {
                ++count;
                spdlog::info("Unbound account {} from instance {}", account_id, instance.id);
            }
        } catch (const NotFoundError&) {
            // Deleted concurrently, its bindings went with it
            continue;
        }
    }
    return count;
}

size_t BindingManager::prune_missing_accounts() {
    const AccountListing listing = accounts_.read_accounts();
    if (!listing.complete()) {
        spdlog::warn("Not pruning: {} account entries could not be read", listing.skipped.size());
        throw StorageError(fmt::format("Cannot prune while {} account entries are unreadable (first: {})",
                                       listing.skipped.size(), listing.skipped.front()));
    }

    std::set<std::string> known;
    for (const auto& account : listing.accounts) {
        known.insert(account.id);
    }

    size_t count = 0;
    for (const auto& instance : registry_.list()) {
        bool stale = false;
        for (const auto& account_id : instance.account_ids) {
            if (!known.contains(account_id)) {
                stale = true;
                break;
            }
        }
        if (!stale) continue;

        try {
            size_t removed = 0;
            registry_.mutate(instance.id, [&](Instance& next) {
                removed = 0;
                const auto ids = next.account_ids;
                for (const auto& account_id : ids) {
                    if (!known.contains(account_id) && next.unbind_account(account_id)) {
                        ++removed;
                    }
                }
            });
            count += removed;
            spdlog::info("Pruned {} missing accounts from instance {}", removed, instance.id);
        } catch (const NotFoundError&) {
            continue;
        }
    }
    return count;
}

} // namespace instman
