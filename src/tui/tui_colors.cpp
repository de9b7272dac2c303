#include "tui_colors.hpp"

namespace instman {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Basic colors
    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_BORDER, COLOR_BLUE, -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);
    init_pair(COLOR_PAIR_WARNING, COLOR_YELLOW, -1);

    // Instance states
    init_pair(COLOR_PAIR_RUNNING, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_STOPPED, -1, -1);
    init_pair(COLOR_PAIR_DEFAULT_MARK, COLOR_MAGENTA, -1);

    // Accounts
    init_pair(COLOR_PAIR_CURRENT_ACCOUNT, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_BOUND_ACCOUNT, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_QUOTA_HIGH, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_QUOTA_MEDIUM, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_QUOTA_LOW, COLOR_RED, -1);
    init_pair(COLOR_PAIR_RECOMMENDATION, COLOR_BLACK, COLOR_GREEN);

    // Dialog
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE);
    init_pair(COLOR_PAIR_DIALOG_FIELD, COLOR_BLACK, COLOR_CYAN);

    // Help
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1);
}

int get_running_color(bool running) {
    return running ? COLOR_PAIR_RUNNING : COLOR_PAIR_STOPPED;
}

int get_quota_color(int percentage) {
    if (percentage >= 50) return COLOR_PAIR_QUOTA_HIGH;
    if (percentage >= 20) return COLOR_PAIR_QUOTA_MEDIUM;
    return COLOR_PAIR_QUOTA_LOW;
}

} // namespace instman
