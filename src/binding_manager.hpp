#pragma once

#include "instance.hpp"
#include "instance_registry.hpp"
#include "interfaces/i_account_source.hpp"
#include "interfaces/i_account_switcher.hpp"
#include "process_controller.hpp"
#include <string>
#include <vector>

namespace instman {

// Maintains the account to instance binding relation, which is stored on the
// instance records themselves, and the current account of each instance.
class BindingManager {
public:
    BindingManager(InstanceRegistry& registry,
                   ProcessController& controller,
                   IAccountSource& accounts,
                   IAccountSwitcher& switcher);

    void bind(const std::string& account_id, const std::string& instance_id);
    void unbind(const std::string& account_id, const std::string& instance_id);

    // The account must already be bound. A running instance is switched live
    // first and the new current account is committed only when that succeeds.
    void set_current_account(const std::string& instance_id, const std::string& account_id);

    // bind + set_current_account as one step; nothing changes on failure
    void switch_account(const std::string& instance_id, const std::string& account_id);

    // Binds every known account that no instance holds to the default instance
    size_t migrate_legacy_accounts();

    [[nodiscard]] std::vector<std::string> accounts_for_instance(const std::string& instance_id) const;
    [[nodiscard]] std::vector<Instance> instances_for_account(const std::string& account_id) const;

    void remove_instance(const std::string& instance_id);

    // Returns the number of instances the account was unbound from
    size_t forget_account(const std::string& account_id);
    // Drops bindings to accounts the account source no longer lists. Throws
    // StorageError, changing nothing, when the listing is incomplete.
    size_t prune_missing_accounts();

private:
    void apply_current(Instance& instance, const std::string& account_id);
    static void require_account_id(const std::string& account_id);

    InstanceRegistry& registry_;
    ProcessController& controller_;
    IAccountSource& accounts_;
    IAccountSwitcher& switcher_;
};

} // namespace instman
