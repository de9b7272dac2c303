#pragma once

#include <ncurses.h>

namespace instman {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_RUNNING,
    COLOR_PAIR_STOPPED,
    COLOR_PAIR_DEFAULT_MARK,
    COLOR_PAIR_CURRENT_ACCOUNT,
    COLOR_PAIR_BOUND_ACCOUNT,
    COLOR_PAIR_QUOTA_HIGH,
    COLOR_PAIR_QUOTA_MEDIUM,
    COLOR_PAIR_QUOTA_LOW,
    COLOR_PAIR_RECOMMENDATION,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_DIALOG_FIELD,
    COLOR_PAIR_HELP_KEY,
};

// Initialize ncurses color pairs
void init_colors();

// Color pair for an instance running state
int get_running_color(bool running);

// Color pair for a remaining quota percentage
int get_quota_color(int percentage);

} // namespace instman
