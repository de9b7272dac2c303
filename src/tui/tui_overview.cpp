#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <fmt/format.h>

namespace instman {

void TuiApp::render_overview() {
    if (!overview_win_) return;

    const auto& ov = view_model_.overview;
    int max_x = getmaxx(overview_win_);

    // Row 0: title and running count
    wattron(overview_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    mvwprintw(overview_win_, 0, 1, "instman");
    wattroff(overview_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);

    std::string running = fmt::format("running {}/{}", ov.running_count, ov.instance_count);
    wattron(overview_win_, COLOR_PAIR(ov.running_count > 0 ? COLOR_PAIR_RUNNING : COLOR_PAIR_DEFAULT) | A_BOLD);
    mvwprintw(overview_win_, 0, 10, "%s", running.c_str());
    wattroff(overview_win_, COLOR_PAIR(ov.running_count > 0 ? COLOR_PAIR_RUNNING : COLOR_PAIR_DEFAULT) | A_BOLD);

    std::string where = truncate(core_.config().data_dir.string(), max_x - 30 - static_cast<int>(running.length()));
    wattron(overview_win_, A_DIM);
    mvwprintw(overview_win_, 0, max_x - static_cast<int>(where.length()) - 1, "%s", where.c_str());
    wattroff(overview_win_, A_DIM);

    // Row 1: best account per category
    mvwprintw(overview_win_, 1, 1, "Best:");
    if (ov.generation == 0) {
        wattron(overview_win_, A_DIM);
        mvwprintw(overview_win_, 1, 7, "...");
        wattroff(overview_win_, A_DIM);
    } else if (ov.recommendations.empty()) {
        wattron(overview_win_, A_DIM);
        mvwprintw(overview_win_, 1, 7, "no account with remaining quota");
        wattroff(overview_win_, A_DIM);
    } else {
        int x = 7;
        for (const auto& rec : ov.recommendations) {
            std::string text = fmt::format(" {}: {} ({}) ", rec.category, ov.label_for(rec.account_id), rec.score);
            if (x + static_cast<int>(text.length()) >= max_x - 1) break;
            wattron(overview_win_, COLOR_PAIR(COLOR_PAIR_RECOMMENDATION));
            mvwprintw(overview_win_, 1, x, "%s", text.c_str());
            wattroff(overview_win_, COLOR_PAIR(COLOR_PAIR_RECOMMENDATION));
            x += static_cast<int>(text.length()) + 1;
        }
    }

    // Row 2: legend
    wattron(overview_win_, A_DIM);
    mvwprintw(overview_win_, 2, 1, "%s", truncate("* default instance   > current account   + bound account", max_x - 2).c_str());
    wattroff(overview_win_, A_DIM);

    wattron(overview_win_, COLOR_PAIR(COLOR_PAIR_BORDER));
    mvwhline(overview_win_, 3, 0, ACS_HLINE, max_x);
    wattroff(overview_win_, COLOR_PAIR(COLOR_PAIR_BORDER));
}

} // namespace instman
