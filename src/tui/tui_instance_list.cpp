#include "tui_app.hpp"
#include "tui_colors.hpp"

namespace instman {

void TuiApp::render_instance_list() {
    if (!list_win_) return;

    int max_y, max_x;
    getmaxyx(list_win_, max_y, max_x);

    const auto& list = view_model_.instance_list;
    const size_t count = list.data ? list.data->instances.size() : 0;

    std::string title = current_focus_ == PanelFocus::InstanceList ? "[Instances]" : "Instances";
    draw_box_title(list_win_, title);

    // Column headers - fixed columns end at position 70, dir takes rest
    wattron(list_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(list_win_, 1, 2, "  %-22s %-8s %5s  %-24s  %s", "Name", "State", "Accts", "Current", "User data dir");
    wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    const int fixed_cols_end = 70;
    int available_rows = max_y - 3;
    visible_list_rows_ = available_rows;

    if (count == 0) {
        wattron(list_win_, A_DIM);
        mvwprintw(list_win_, 2, 4, "%s", list.data && list.data->generation > 0
            ? "No instances. Press n to create one."
            : "Loading...");
        wattroff(list_win_, A_DIM);
        return;
    }

    int row = 2;
    for (size_t i = list_scroll_offset_; i < count && row < max_y - 1; ++i) {
        const auto& instance = list.data->instances[i];
        const bool is_selected = instance.id == list.selected_id;
        const bool is_running = list.data->is_running(instance.id);

        std::string current = "-";
        if (instance.current_account_id) {
            current = view_model_.overview.label_for(*instance.current_account_id);
        }

        if (is_selected) {
            wattron(list_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(list_win_, row, 1, ' ', max_x - 2);
        }

        if (instance.is_default) {
            if (!is_selected) wattron(list_win_, COLOR_PAIR(COLOR_PAIR_DEFAULT_MARK) | A_BOLD);
            mvwprintw(list_win_, row, 2, "*");
            if (!is_selected) wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_DEFAULT_MARK) | A_BOLD);
        }

        mvwprintw(list_win_, row, 4, "%-22s ", truncate(instance.name, 22).c_str());

        if (!is_selected) wattron(list_win_, COLOR_PAIR(get_running_color(is_running)) | (is_running ? A_BOLD : A_DIM));
        mvwprintw(list_win_, row, 27, "%-8s", is_running ? "running" : "stopped");
        if (!is_selected) wattroff(list_win_, COLOR_PAIR(get_running_color(is_running)) | (is_running ? A_BOLD : A_DIM));

        mvwprintw(list_win_, row, 36, " %5zu  %-24s  ", instance.account_ids.size(), truncate(current, 24).c_str());

        int dir_max = max_x - fixed_cols_end - 2;
        if (dir_max > 3) {
            mvwprintw(list_win_, row, fixed_cols_end, "%s", truncate(instance.user_data_dir, dir_max).c_str());
        }

        if (is_selected) {
            wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
        row++;
    }

    // Scroll indicators
    if (list_scroll_offset_ > 0) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(list_win_, 1, max_x - 4, "^^^");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (list_scroll_offset_ + available_rows < static_cast<int>(count)) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(list_win_, max_y - 2, max_x - 4, "vvv");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

} // namespace instman
