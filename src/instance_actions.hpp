#pragma once

#include "account.hpp"
#include "core.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

namespace instman {

// Outcome of a user action in a front-end
struct ActionResult {
    bool success = false;
    std::string message;   // what happened, or the error text
    ErrorKind error_kind = ErrorKind::Validation;
};

// The operations the interactive front-ends offer, reported as results
// instead of exceptions so a failed action only ends up in the status line.
class InstanceActions {
public:
    explicit InstanceActions(Core& core);

    ActionResult toggle_running(const std::string& instance_id);
    ActionResult restart(const std::string& instance_id);

    ActionResult create(const std::string& name, const std::string& user_data_dir, const std::string& extra_args);
    ActionResult rename(const std::string& instance_id, const std::string& name);
    ActionResult remove(const std::string& instance_id);

    ActionResult bind(const std::string& instance_id, const std::string& account_id);
    ActionResult unbind(const std::string& instance_id, const std::string& account_id);
    ActionResult switch_account(const std::string& instance_id, const std::string& account_id);

    ActionResult migrate();
    ActionResult prune();

    // Accounts for display; failures are logged and give an empty list
    [[nodiscard]] std::vector<Account> load_accounts();

    // Recent errors from the controller for the status bar
    [[nodiscard]] std::vector<QueryError> recent_errors();

private:
    template <typename Fn>
    ActionResult run(const char* what, Fn&& fn);

    Core& core_;
};

} // namespace instman
