#pragma once

#include <string>

namespace instman {

enum class ConfirmAction {
    DeleteInstance,
    MigrateAccounts,
    PruneAccounts
};

struct ConfirmDialogViewModel {
    // Visibility
    bool is_visible = false;

    ConfirmAction action = ConfirmAction::DeleteInstance;

    // Target instance (DeleteInstance only)
    std::string target_id;
    std::string target_name;

    // Error state
    std::string error_message;
};

} // namespace instman
