#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace instman {

void TuiApp::render_confirm_dialog() {
    const auto& cd = view_model_.confirm_dialog;
    if (!cd.is_visible) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Dialog dimensions
    int dialog_width = std::min(60, max_x - 2);
    int dialog_height = cd.error_message.empty() ? 8 : 10;
    int dialog_x = (max_x - dialog_width) / 2;
    int dialog_y = (max_y - dialog_height) / 2;

    WINDOW* dialog_win = newwin(dialog_height, dialog_width, dialog_y, dialog_x);
    if (!dialog_win) return;

    wbkgd(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(dialog_win, 0, 0);

    std::string title;
    std::string question;
    std::string detail;
    switch (cd.action) {
        case ConfirmAction::DeleteInstance:
            title = " Delete Instance ";
            question = "Delete this instance and release its accounts?";
            detail = cd.target_name;
            break;
        case ConfirmAction::MigrateAccounts:
            title = " Migrate Accounts ";
            question = "Bind every unbound account to the default instance?";
            break;
        case ConfirmAction::PruneAccounts:
            title = " Prune Accounts ";
            question = "Remove bindings to accounts that no longer exist?";
            break;
    }

    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 0, (dialog_width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    wattroff(dialog_win, A_BOLD);

    mvwprintw(dialog_win, 2, 2, "%s", truncate(question, dialog_width - 4).c_str());
    if (!detail.empty()) {
        wattron(dialog_win, A_BOLD);
        mvwprintw(dialog_win, 3, 4, "%s", truncate(detail, dialog_width - 6).c_str());
        wattroff(dialog_win, A_BOLD);
    }

    int row = 5;

    if (!cd.error_message.empty()) {
        wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(dialog_win, row++, 2, "%s", truncate(cd.error_message, dialog_width - 4).c_str());
        wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        row++;
    }

    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(dialog_win, row, 6, " [Y] Yes ");
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    mvwprintw(dialog_win, row, 20, " [N] Cancel ");

    wrefresh(dialog_win);
    delwin(dialog_win);
}

void TuiApp::render_form_dialog() {
    const auto& fd = view_model_.form_dialog;
    if (!fd.is_visible) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int field_count = fd.field_count();
    int dialog_width = std::min(70, max_x - 2);
    int dialog_height = 6 + field_count * 2 + (fd.error_message.empty() ? 0 : 2);
    int dialog_x = (max_x - dialog_width) / 2;
    int dialog_y = (max_y - dialog_height) / 2;

    WINDOW* dialog_win = newwin(dialog_height, dialog_width, dialog_y, dialog_x);
    if (!dialog_win) return;

    wbkgd(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(dialog_win, 0, 0);

    std::string title = fd.kind == FormKind::CreateInstance ? " New Instance " : " Rename Instance ";
    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 0, (dialog_width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    wattroff(dialog_win, A_BOLD);

    static constexpr const char* kLabels[] = {"Name", "User data dir", "Extra args"};
    const int label_width = 14;
    const int field_width = dialog_width - label_width - 5;

    int cursor_y = 0;
    int cursor_x = 0;
    int row = 2;
    for (int i = 0; i < field_count; ++i) {
        const auto which = static_cast<FormField>(i);
        const auto& value = fd.field(which);
        const bool active = which == fd.active_field;

        mvwprintw(dialog_win, row, 2, "%-*s", label_width, kLabels[i]);

        // Show the tail of long values so the cursor stays visible
        std::string shown = value;
        if (static_cast<int>(shown.length()) >= field_width) {
            shown = shown.substr(shown.length() - field_width + 1);
        }

        wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_FIELD));
        mvwhline(dialog_win, row, label_width + 3, ' ', field_width);
        mvwprintw(dialog_win, row, label_width + 3, "%s", shown.c_str());
        wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_FIELD));

        if (active) {
            cursor_y = row;
            cursor_x = label_width + 3 + static_cast<int>(shown.length());
        }
        row += 2;
    }

    if (!fd.error_message.empty()) {
        wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(dialog_win, row++, 2, "%s", truncate(fd.error_message, dialog_width - 4).c_str());
        wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        row++;
    }

    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(dialog_win, row, 4, " [Enter] Save ");
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(dialog_win, row, 20, " [Esc] Cancel ");
    if (field_count > 1) {
        mvwprintw(dialog_win, row, 36, " [Tab] Next field ");
    }

    wmove(dialog_win, cursor_y, cursor_x);
    wrefresh(dialog_win);
    delwin(dialog_win);
}

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int help_width = std::min(60, max_x - 2);
    int help_height = std::min(30, max_y - 2);
    int help_x = (max_x - help_width) / 2;
    int help_y = (max_y - help_height) / 2;

    WINDOW* help_win = newwin(help_height, help_width, help_y, help_x);
    if (!help_win) return;

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "  PgUp, PgDn      Page up/down",
        "  Home/g, End/G   Jump to first/last",
        "  Tab             Switch panel focus",
        "",
        "Instances:",
        "  s               Start / stop",
        "  R               Restart",
        "  n               New instance",
        "  e               Rename",
        "  d               Delete",
        "",
        "Accounts (details panel):",
        "  b               Bind to instance",
        "  u               Unbind from instance",
        "  Enter           Switch instance to account",
        "",
        "Maintenance:",
        "  m               Migrate accounts to default",
        "  p               Prune missing accounts",
        "  o               Toggle overview",
        "  r/F5            Force refresh",
        "  q               Quit",
        "  ?/F1            This help"
    };

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            std::string key(line, 2, 16);
            std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", desc.c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, help_height - 2, (help_width - 24) / 2, " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    int max_x = getmaxx(status_win_);

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    werase(status_win_);

    // Recent query failures win over the last action message
    auto errors = list_poller_->get_recent_errors();
    auto controller_errors = actions_.recent_errors();
    errors.insert(errors.end(), controller_errors.begin(), controller_errors.end());
    std::sort(errors.begin(), errors.end(), [](const QueryError& a, const QueryError& b) {
        return a.timestamp < b.timestamp;
    });

    std::string message;
    bool is_error = false;
    if (!errors.empty()) {
        message = "[!] " + errors.back().message;
        is_error = true;
    } else if (!view_model_.status_message.empty()) {
        message = view_model_.status_message;
        is_error = view_model_.status_is_error;
    }

    const char* hints = "q:Quit  s:Start/Stop  n:New  d:Delete  Tab:Panel  Enter:Switch  ?:Help";
    if (message.empty()) {
        mvwprintw(status_win_, 0, 1, "%s", truncate(hints, max_x - 2).c_str());
        return;
    }

    if (is_error) wattron(status_win_, A_BOLD);
    mvwprintw(status_win_, 0, 1, "%s", truncate(message, max_x - 12).c_str());
    if (is_error) wattroff(status_win_, A_BOLD);

    mvwprintw(status_win_, 0, max_x - 8, "?:Help");
}

} // namespace instman
