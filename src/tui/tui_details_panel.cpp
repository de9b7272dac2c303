#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../string_utils.hpp"
#include <fmt/format.h>

namespace instman {

void TuiApp::render_details_panel() {
    if (!details_win_) return;

    int max_y, max_x;
    getmaxyx(details_win_, max_y, max_x);

    const Instance* instance = view_model_.instance_list.selected();
    const auto& details = view_model_.details_panel;

    std::string title = instance ? "Accounts - " + instance->name : "Accounts";
    if (current_focus_ == PanelFocus::DetailsPanel) {
        title = "[" + title + "]";
    }
    draw_box_title(details_win_, title);

    if (!instance) {
        wattron(details_win_, A_DIM);
        mvwprintw(details_win_, 2, 2, "Select an instance to see its accounts");
        wattroff(details_win_, A_DIM);
        return;
    }

    // Instance line
    std::string launch = instance->extra_args.empty() ? "" : "  Args: " + join_args(instance->extra_args);
    if (instance->executable) {
        launch = "  Exec: " + *instance->executable + launch;
    }
    mvwprintw(details_win_, 1, 2, "%s", truncate(instance->user_data_dir + launch, max_x - 4).c_str());

    if (!details.missing_account_ids.empty()) {
        std::string missing = fmt::format(" {} bound account(s) unknown, p prunes ", details.missing_account_ids.size());
        int missing_x = max_x - static_cast<int>(missing.length()) - 2;
        if (missing_x > 2) {
            wattron(details_win_, COLOR_PAIR(COLOR_PAIR_WARNING));
            mvwprintw(details_win_, 0, missing_x, "%s", missing.c_str());
            wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_WARNING));
        }
    }

    wattron(details_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(details_win_, 2, 2, "  %-32s %-10s  %s", "Account", "Tier", "Quota");
    wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    if (details.rows.empty()) {
        wattron(details_win_, A_DIM);
        mvwprintw(details_win_, 3, 4, "No accounts in %s", core_.config().accounts_dir().string().c_str());
        wattroff(details_win_, A_DIM);
        return;
    }

    const bool focused = current_focus_ == PanelFocus::DetailsPanel;
    int row = 3;
    for (size_t i = details_scroll_offset_; i < details.rows.size() && row < max_y - 1; ++i) {
        const auto& entry = details.rows[i];
        const bool is_selected = focused && static_cast<int>(i) == details.selected_row;

        if (is_selected) {
            wattron(details_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(details_win_, row, 1, ' ', max_x - 2);
        }

        // '>' current, '+' bound
        char marker = entry.is_current ? '>' : (entry.is_bound ? '+' : ' ');
        int name_color = entry.is_current ? COLOR_PAIR_CURRENT_ACCOUNT
                       : (entry.is_bound ? COLOR_PAIR_BOUND_ACCOUNT : COLOR_PAIR_DEFAULT);
        int name_attr = entry.is_bound ? A_BOLD : A_DIM;

        if (!is_selected) wattron(details_win_, COLOR_PAIR(name_color) | name_attr);
        std::string label = entry.account.email.empty() ? entry.account.id : entry.account.email;
        mvwprintw(details_win_, row, 2, "%c %-32s", marker, truncate(label, 32).c_str());
        if (!is_selected) wattroff(details_win_, COLOR_PAIR(name_color) | name_attr);

        std::string tier = entry.account.quota ? entry.account.quota->subscription_tier : "";
        mvwprintw(details_win_, row, 37, "%-10s  ", truncate(tier, 10).c_str());

        int x = 49;
        if (!entry.account.quota || entry.account.quota->models.empty()) {
            mvwprintw(details_win_, row, x, "no quota data");
        } else {
            for (const auto& model : entry.account.quota->models) {
                std::string text = fmt::format("{} {}%", model.name, model.percentage);
                if (x + static_cast<int>(text.length()) >= max_x - 2) break;
                if (!is_selected) wattron(details_win_, COLOR_PAIR(get_quota_color(model.percentage)));
                mvwprintw(details_win_, row, x, "%s", text.c_str());
                if (!is_selected) wattroff(details_win_, COLOR_PAIR(get_quota_color(model.percentage)));
                x += static_cast<int>(text.length()) + 2;
            }
        }

        if (is_selected) {
            wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
        row++;
    }

    // Scroll indicators
    if (details_scroll_offset_ > 0) {
        wattron(details_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(details_win_, 2, max_x - 4, "^^^");
        wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (details_scroll_offset_ + visible_details_rows_ < static_cast<int>(details.rows.size())) {
        wattron(details_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(details_win_, max_y - 2, max_x - 4, "vvv");
        wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

} // namespace instman
