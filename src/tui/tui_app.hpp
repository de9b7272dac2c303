#pragma once

#include "../core.hpp"
#include "../instance_actions.hpp"
#include "../status_poller.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <memory>
#include <atomic>
#include <string>
#include <vector>
#include <ncurses.h>

namespace instman {

// Focus states for keyboard navigation between panels
enum class PanelFocus {
    InstanceList,
    DetailsPanel
};

class TuiApp {
public:
    // Non-owning: core must outlive the TuiApp instance
    explicit TuiApp(Core& core);
    ~TuiApp();

    void run();

private:
    // Rendering
    void render();
    void render_overview();
    void render_instance_list();
    void render_details_panel();
    void render_status_bar();
    void render_confirm_dialog();
    void render_form_dialog();
    void render_help_overlay();

    // Input handling
    void handle_input(int ch);
    void handle_instance_list_input(int ch);
    void handle_details_panel_input(int ch);
    void handle_confirm_dialog_input(int ch);
    void handle_form_dialog_input(int ch);
    void handle_help_input(int ch);

    // Navigation helpers
    void move_selection(int delta);
    void move_account_selection(int delta);
    void scroll_to_selection();

    // Data
    void poll_snapshots();
    void refresh_details(bool reload_accounts);
    void refresh_all();

    // Actions
    void request_delete();
    void request_confirm(ConfirmAction action);
    void execute_confirm();
    void open_form(FormKind kind);
    void submit_form();
    void account_action(char key);
    void report(const ActionResult& result);

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    // Utility
    void draw_box_title(WINDOW* win, const std::string& title);
    static std::string truncate(const std::string& text, int width);

    Core& core_;
    InstanceActions actions_;

    std::unique_ptr<StatusPoller> list_poller_;
    std::unique_ptr<StatusPoller> overview_poller_;

    // Latest snapshots seen
    uint64_t list_generation_ = 0;
    uint64_t overview_generation_ = 0;

    // Account cache for the details panel, reloaded on each list tick
    std::vector<Account> accounts_;

    // ViewModel (holds all UI state)
    AppViewModel view_model_;

    // ncurses windows
    WINDOW* overview_win_ = nullptr;
    WINDOW* list_win_ = nullptr;
    WINDOW* details_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // UI state
    PanelFocus current_focus_ = PanelFocus::InstanceList;
    bool show_help_ = false;
    std::atomic<bool> running_{false};
    int dialog_debounce_ = 0;

    // Scroll positions
    int list_scroll_offset_ = 0;
    int details_scroll_offset_ = 0;
    int visible_list_rows_ = 0;
    int visible_details_rows_ = 0;

    // Layout constants
    static constexpr int kOverviewPanelHeight = 4;
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kMinDetailsHeight = 8;
    static constexpr double kListPanelRatio = 0.45;  // Percentage of remaining space
};

} // namespace instman
