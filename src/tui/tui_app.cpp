#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <csignal>
#include <algorithm>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

namespace instman {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(Core& core)
    : core_(core)
    , actions_(core)
{
    list_poller_ = core_.make_poller(core_.config().list_poll_interval);
    overview_poller_ = core_.make_poller(core_.config().overview_poll_interval);
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input
    set_escdelay(25);

    init_colors();

    printf("\033]0;instman\007");
    fflush(stdout);

    signal(SIGWINCH, handle_resize);

    create_windows();

    // Start status polling
    list_poller_->start();
    overview_poller_->start();
    spdlog::info("Curses front-end started");

    running_ = true;
    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
        }

        poll_snapshots();
        render();

        // Small sleep to reduce CPU usage
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    // Cleanup
    list_poller_->stop();
    overview_poller_->stop();
    cleanup_windows();

    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
    spdlog::info("Curses front-end stopped");
}

void TuiApp::poll_snapshots() {
    auto snapshot = list_poller_->get_snapshot();
    if (snapshot && snapshot->generation != list_generation_) {
        list_generation_ = snapshot->generation;
        view_model_.update_from_snapshot(snapshot);
        refresh_details(true);
        scroll_to_selection();
    }

    auto overview = overview_poller_->get_snapshot();
    if (overview && overview->generation != overview_generation_) {
        overview_generation_ = overview->generation;
        view_model_.update_overview(overview, actions_.load_accounts(), core_.config().categories);
    }
}

void TuiApp::refresh_details(bool reload_accounts) {
    if (reload_accounts) {
        accounts_ = actions_.load_accounts();
    }

    auto& details = view_model_.details_panel;
    const auto& selected_id = view_model_.instance_list.selected_id;
    if (selected_id.empty()) {
        details.clear();
        return;
    }

    // The registry is newer than the last snapshot after an action
    try {
        details.rebuild(core_.registry().get(selected_id), accounts_);
    } catch (const NotFoundError&) {
        details.clear();
    }
}

void TuiApp::refresh_all() {
    list_poller_->refresh_now();
    overview_poller_->refresh_now();
    refresh_details(true);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Calculate panel heights
    int overview_height = view_model_.overview.is_visible ? kOverviewPanelHeight : 0;
    int status_height = kStatusBarHeight;
    int remaining = max_y - overview_height - status_height;
    int list_height = std::max(5, static_cast<int>(remaining * kListPanelRatio));
    int details_height = std::max(kMinDetailsHeight, remaining - list_height);

    int y = 0;

    if (view_model_.overview.is_visible) {
        overview_win_ = newwin(overview_height, max_x, y, 0);
        y += overview_height;
    }

    list_win_ = newwin(list_height, max_x, y, 0);
    y += list_height;
    visible_list_rows_ = list_height - 3;  // Border and header

    details_win_ = newwin(details_height, max_x, y, 0);
    y += details_height;
    visible_details_rows_ = details_height - 4;  // Border, instance line and header

    status_win_ = newwin(status_height, max_x, y, 0);

    if (overview_win_) keypad(overview_win_, TRUE);
    keypad(list_win_, TRUE);
    keypad(details_win_, TRUE);
    keypad(status_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (overview_win_) {
        delwin(overview_win_);
        overview_win_ = nullptr;
    }
    if (list_win_) {
        delwin(list_win_);
        list_win_ = nullptr;
    }
    if (details_win_) {
        delwin(details_win_);
        details_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    if (overview_win_) werase(overview_win_);
    werase(list_win_);
    werase(details_win_);
    werase(status_win_);

    if (view_model_.overview.is_visible && overview_win_) {
        render_overview();
    }
    render_instance_list();
    render_details_panel();
    render_status_bar();

    if (overview_win_) wnoutrefresh(overview_win_);
    wnoutrefresh(list_win_);
    wnoutrefresh(details_win_);
    wnoutrefresh(status_win_);
    doupdate();

    // Overlays draw straight to the screen on top of the panels
    if (view_model_.confirm_dialog.is_visible) {
        render_confirm_dialog();
    }
    if (view_model_.form_dialog.is_visible) {
        render_form_dialog();
    }
    if (show_help_) {
        render_help_overlay();
    }
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    box(win, 0, 0);
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

std::string TuiApp::truncate(const std::string& text, int width) {
    if (width <= 0) return {};
    if (static_cast<int>(text.length()) <= width) return text;
    if (width <= 3) return text.substr(0, width);
    return text.substr(0, width - 3) + "...";
}

void TuiApp::move_selection(int delta) {
    const auto& data = view_model_.instance_list.data;
    if (!data || data->instances.empty()) return;

    int current_pos = std::max(0, view_model_.instance_list.selected_index());
    int new_pos = std::clamp(current_pos + delta, 0, static_cast<int>(data->instances.size()) - 1);
    if (data->instances[new_pos].id == view_model_.instance_list.selected_id) return;

    view_model_.instance_list.selected_id = data->instances[new_pos].id;
    details_scroll_offset_ = 0;
    view_model_.details_panel.selected_row = 0;
    refresh_details(false);
    scroll_to_selection();
}

void TuiApp::move_account_selection(int delta) {
    auto& details = view_model_.details_panel;
    if (details.rows.empty()) return;

    details.selected_row = std::clamp(details.selected_row + delta, 0, static_cast<int>(details.rows.size()) - 1);

    if (details.selected_row < details_scroll_offset_) {
        details_scroll_offset_ = details.selected_row;
    } else if (details.selected_row >= details_scroll_offset_ + visible_details_rows_) {
        details_scroll_offset_ = details.selected_row - visible_details_rows_ + 1;
    }
}

void TuiApp::scroll_to_selection() {
    int selected_idx = std::max(0, view_model_.instance_list.selected_index());

    if (selected_idx < list_scroll_offset_) {
        list_scroll_offset_ = selected_idx;
    } else if (selected_idx >= list_scroll_offset_ + visible_list_rows_) {
        list_scroll_offset_ = selected_idx - visible_list_rows_ + 1;
    }
}

void TuiApp::report(const ActionResult& result) {
    view_model_.set_status(result.message, !result.success);
    refresh_all();
}

void TuiApp::request_delete() {
    const Instance* selected = view_model_.instance_list.selected();
    if (!selected) return;

    auto& cd = view_model_.confirm_dialog;
    cd.action = ConfirmAction::DeleteInstance;
    cd.target_id = selected->id;
    cd.target_name = selected->name;
    cd.error_message.clear();
    cd.is_visible = true;
}

void TuiApp::request_confirm(ConfirmAction action) {
    auto& cd = view_model_.confirm_dialog;
    cd.action = action;
    cd.target_id.clear();
    cd.target_name.clear();
    cd.error_message.clear();
    cd.is_visible = true;
}

void TuiApp::execute_confirm() {
    auto& cd = view_model_.confirm_dialog;

    ActionResult result;
    switch (cd.action) {
        case ConfirmAction::DeleteInstance:
            result = actions_.remove(cd.target_id);
            break;
        case ConfirmAction::MigrateAccounts:
            result = actions_.migrate();
            break;
        case ConfirmAction::PruneAccounts:
            result = actions_.prune();
            break;
    }

    if (result.success) {
        cd.is_visible = false;
        report(result);
    } else {
        // Keep the dialog open with the reason, e.g. deleting the default
        cd.error_message = result.message;
    }
}

void TuiApp::open_form(FormKind kind) {
    auto& fd = view_model_.form_dialog;
    fd.kind = kind;
    fd.error_message.clear();
    fd.active_field = FormField::Name;
    fd.name.clear();
    fd.user_data_dir.clear();
    fd.extra_args.clear();
    fd.target_id.clear();

    if (kind == FormKind::RenameInstance) {
        const Instance* selected = view_model_.instance_list.selected();
        if (!selected) return;
        fd.target_id = selected->id;
        fd.name = selected->name;
    }

    fd.is_visible = true;
    curs_set(1);
}

void TuiApp::submit_form() {
    auto& fd = view_model_.form_dialog;

    ActionResult result = fd.kind == FormKind::CreateInstance
        ? actions_.create(fd.name, fd.user_data_dir, fd.extra_args)
        : actions_.rename(fd.target_id, fd.name);

    if (!result.success) {
        fd.error_message = result.message;
        return;
    }

    fd.is_visible = false;
    curs_set(0);
    report(result);
}

void TuiApp::account_action(char key) {
    const Instance* instance = view_model_.instance_list.selected();
    const AccountRow* row = view_model_.details_panel.selected();
    if (!instance || !row) return;

    switch (key) {
        case 'b':
            report(actions_.bind(instance->id, row->account.id));
            break;
        case 'u':
            report(actions_.unbind(instance->id, row->account.id));
            break;
        case '\n':
            report(actions_.switch_account(instance->id, row->account.id));
            break;
        default:
            break;
    }
}

} // namespace instman
