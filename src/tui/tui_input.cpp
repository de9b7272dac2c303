#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace instman {

void TuiApp::handle_input(int ch) {
    // Debounce: ignore input for a few frames after showing dialogs
    if (dialog_debounce_ > 0) {
        dialog_debounce_--;
        return;
    }

    // Help overlay takes priority
    if (show_help_) {
        handle_help_input(ch);
        return;
    }

    if (view_model_.form_dialog.is_visible) {
        handle_form_dialog_input(ch);
        return;
    }

    if (view_model_.confirm_dialog.is_visible) {
        handle_confirm_dialog_input(ch);
        return;
    }

    // Global keys
    switch (ch) {
        case 'q':
        case 'Q':
            running_ = false;
            return;

        case '?':
        case KEY_F(1):
            show_help_ = true;
            flushinp();  // Clear any pending input
            dialog_debounce_ = 5;  // Ignore input for 5 frames
            return;

        case 'o':  // Toggle overview panel
            view_model_.overview.is_visible = !view_model_.overview.is_visible;
            resize_windows();
            return;

        case '\t':  // Tab - switch panel focus
        case KEY_BTAB:
            current_focus_ = current_focus_ == PanelFocus::InstanceList
                ? PanelFocus::DetailsPanel
                : PanelFocus::InstanceList;
            return;

        case 'r':
        case KEY_F(5):
            refresh_all();
            view_model_.set_status("Refreshing...", false);
            return;

        case 's':
            if (const Instance* selected = view_model_.instance_list.selected()) {
                view_model_.set_status("Working...", false);
                render_status_bar();
                wrefresh(status_win_);
                report(actions_.toggle_running(selected->id));
            }
            return;

        case 'R':
            if (const Instance* selected = view_model_.instance_list.selected()) {
                view_model_.set_status("Restarting...", false);
                render_status_bar();
                wrefresh(status_win_);
                report(actions_.restart(selected->id));
            }
            return;

        case 'n':
            open_form(FormKind::CreateInstance);
            return;

        case 'e':
            open_form(FormKind::RenameInstance);
            return;

        case 'd':
        case KEY_DC:
            request_delete();
            return;

        case 'm':
            request_confirm(ConfirmAction::MigrateAccounts);
            return;

        case 'p':
            request_confirm(ConfirmAction::PruneAccounts);
            return;

        case 27:  // Escape - clear status message
            view_model_.set_status("", false);
            return;
    }

    // Panel-specific input
    if (current_focus_ == PanelFocus::InstanceList) {
        handle_instance_list_input(ch);
    } else {
        handle_details_panel_input(ch);
    }
}

void TuiApp::handle_instance_list_input(int ch) {
    const auto& data = view_model_.instance_list.data;
    const int count = data ? static_cast<int>(data->instances.size()) : 0;

    switch (ch) {
        case KEY_UP:
        case 'k':
            move_selection(-1);
            break;

        case KEY_DOWN:
        case 'j':
            move_selection(1);
            break;

        case KEY_PPAGE:
            move_selection(-visible_list_rows_);
            break;

        case KEY_NPAGE:
            move_selection(visible_list_rows_);
            break;

        case KEY_HOME:
        case 'g':
            move_selection(-count);
            break;

        case KEY_END:
        case 'G':
            move_selection(count);
            break;

        case KEY_RIGHT:
        case '\n':
        case '\r':
            // Enter moves into the account list of the instance
            current_focus_ = PanelFocus::DetailsPanel;
            break;

        // Account shortcuts act on the selected account row
        case 'b':
        case 'u':
            account_action(static_cast<char>(ch));
            break;
    }
}

void TuiApp::handle_details_panel_input(int ch) {
    switch (ch) {
        case KEY_UP:
        case 'k':
            move_account_selection(-1);
            break;

        case KEY_DOWN:
        case 'j':
            move_account_selection(1);
            break;

        case KEY_PPAGE:
            move_account_selection(-visible_details_rows_);
            break;

        case KEY_NPAGE:
            move_account_selection(visible_details_rows_);
            break;

        case KEY_HOME:
        case 'g':
            move_account_selection(-static_cast<int>(view_model_.details_panel.rows.size()));
            break;

        case KEY_END:
        case 'G':
            move_account_selection(static_cast<int>(view_model_.details_panel.rows.size()));
            break;

        case KEY_LEFT:
            current_focus_ = PanelFocus::InstanceList;
            break;

        case 'b':
        case 'u':
            account_action(static_cast<char>(ch));
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            view_model_.set_status("Switching account...", false);
            render_status_bar();
            wrefresh(status_win_);
            account_action('\n');
            break;
    }
}

void TuiApp::handle_confirm_dialog_input(int ch) {
    auto& cd = view_model_.confirm_dialog;

    switch (ch) {
        case 'y':
        case 'Y':
            execute_confirm();
            break;

        case 'n':
        case 'N':
        case 27:  // Escape
            cd.is_visible = false;
            break;
        // Ignore other keys
        default:
            break;
    }
}

void TuiApp::handle_form_dialog_input(int ch) {
    auto& fd = view_model_.form_dialog;
    std::string& value = fd.field(fd.active_field);

    switch (ch) {
        case 27:  // Escape
            fd.is_visible = false;
            curs_set(0);
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            submit_form();
            break;

        case '\t':
        case KEY_DOWN:
            fd.active_field = static_cast<FormField>((static_cast<int>(fd.active_field) + 1) % fd.field_count());
            break;

        case KEY_BTAB:
        case KEY_UP:
            fd.active_field = static_cast<FormField>(
                (static_cast<int>(fd.active_field) + fd.field_count() - 1) % fd.field_count());
            break;

        case KEY_BACKSPACE:
        case 127:
        case '\b':
            if (!value.empty()) {
                value.pop_back();
            }
            break;

        default:
            // Add printable characters to the active field
            if (ch >= 32 && ch < 127) {
                value += static_cast<char>(ch);
            }
            break;
    }
}

void TuiApp::handle_help_input(int ch) {
    switch (ch) {
        case 27:        // Escape
        case 'q':
        case 'Q':
        case '\n':
        case '\r':
        case ' ':
        case '?':
        case KEY_F(1):
            show_help_ = false;
            break;
        // Ignore other keys (escape sequence bytes, etc.)
        default:
            break;
    }
}

} // namespace instman
