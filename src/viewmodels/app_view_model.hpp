#pragma once

#include "instance_list_view_model.hpp"
#include "details_panel_view_model.hpp"
#include "confirm_dialog_view_model.hpp"
#include "form_dialog_view_model.hpp"
#include "overview_view_model.hpp"
#include "../status_poller.hpp"
#include <memory>

namespace instman {

// Root ViewModel containing all child ViewModels
struct AppViewModel {
    InstanceListViewModel instance_list;
    DetailsPanelViewModel details_panel;
    ConfirmDialogViewModel confirm_dialog;
    FormDialogViewModel form_dialog;
    OverviewViewModel overview;

    // Status line message from the last action
    std::string status_message;
    bool status_is_error = false;

    // Update list from the list poller snapshot
    void update_from_snapshot(const std::shared_ptr<const StatusSnapshot>& snapshot) {
        if (!snapshot) return;

        instance_list.data = snapshot;
        instance_list.fix_selection();
    }

    // Update overview from the overview poller snapshot
    void update_overview(const std::shared_ptr<const StatusSnapshot>& snapshot,
                         const std::vector<Account>& accounts,
                         const std::vector<CategoryRule>& categories) {
        if (!snapshot) return;

        overview.instance_count = snapshot->instances.size();
        overview.running_count = snapshot->running_count();
        overview.generation = snapshot->generation;
        overview.updated = snapshot->timestamp;

        overview.account_emails.clear();
        for (const auto& account : accounts) {
            overview.account_emails[account.id] = account.email;
        }
        overview.recommendations = recommend(accounts, categories);
    }

    void set_status(std::string message, bool is_error) {
        status_message = std::move(message);
        status_is_error = is_error;
    }
};

} // namespace instman
