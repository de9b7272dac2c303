#pragma once

#include "../account.hpp"
#include "../instance.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace instman {

// One known account as seen from the selected instance
struct AccountRow {
    Account account;
    bool is_bound = false;
    bool is_current = false;
};

struct DetailsPanelViewModel {
    // Which instance the rows were built for
    std::string instance_id;

    // Bound accounts first, in bind order, then the rest by email
    std::vector<AccountRow> rows;

    int selected_row = 0;

    // Bound ids the account source does not list
    std::vector<std::string> missing_account_ids;

    void rebuild(const Instance& instance, const std::vector<Account>& accounts) {
        std::string keep_id;
        if (selected_row >= 0 && selected_row < static_cast<int>(rows.size()) && instance_id == instance.id) {
            keep_id = rows[selected_row].account.id;
        }

        instance_id = instance.id;
        rows.clear();
        missing_account_ids.clear();

        for (const auto& account_id : instance.account_ids) {
            bool found = false;
            for (const auto& account : accounts) {
                if (account.id == account_id) {
                    rows.push_back({account, true, instance.current_account_id == account_id});
                    found = true;
                    break;
                }
            }
            if (!found) {
                missing_account_ids.push_back(account_id);
            }
        }

        std::vector<AccountRow> unbound;
        for (const auto& account : accounts) {
            if (!instance.has_account(account.id)) {
                unbound.push_back({account, false, false});
            }
        }
        std::stable_sort(unbound.begin(), unbound.end(), [](const AccountRow& a, const AccountRow& b) {
            return a.account.email < b.account.email;
        });
        rows.insert(rows.end(), unbound.begin(), unbound.end());

        selected_row = 0;
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i].account.id == keep_id) {
                selected_row = static_cast<int>(i);
                break;
            }
        }
    }

    void clear() {
        instance_id.clear();
        rows.clear();
        missing_account_ids.clear();
        selected_row = 0;
    }

    [[nodiscard]] const AccountRow* selected() const {
        if (selected_row < 0 || selected_row >= static_cast<int>(rows.size())) return nullptr;
        return &rows[selected_row];
    }
};

} // namespace instman
