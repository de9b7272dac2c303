#pragma once

#include "../core.hpp"
#include "../instance_actions.hpp"
#include "../status_poller.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <memory>
#include <atomic>
#include <mutex>
#include <chrono>

struct GLFWwindow;

namespace instman {

class ImGuiApp {
public:
    // Non-owning: core must outlive the ImGuiApp instance
    explicit ImGuiApp(Core& core);
    ~ImGuiApp();

    void run();

private:
    void render();
    void render_menu_bar();
    void render_toolbar();
    void render_overview() const;
    void render_instance_list();
    void render_details_panel();
    void render_status_bar();
    void render_confirm_dialog();
    void render_form_dialog();

    void poll_snapshots();
    void refresh_details(bool reload_accounts);
    void refresh_all();

    void handle_keyboard_navigation();
    void select_instance(const std::string& id);

    // Actions
    void request_delete(const Instance& instance);
    void request_confirm(ConfirmAction action);
    void execute_confirm();
    void open_form(FormKind kind);
    void submit_form();
    void report(const ActionResult& result);

    static std::string format_age(std::chrono::steady_clock::time_point tp);

    Core& core_;
    InstanceActions actions_;

    std::unique_ptr<StatusPoller> list_poller_;
    std::unique_ptr<StatusPoller> overview_poller_;
    uint64_t list_generation_ = 0;
    uint64_t overview_generation_ = 0;

    std::vector<Account> accounts_;

    // ViewModel (holds all UI state - single source of truth)
    AppViewModel view_model_;

    GLFWwindow* window_ = nullptr;

    // Event debouncing
    void post_empty_event_debounced();
    std::mutex event_debounce_mutex_;
    std::chrono::steady_clock::time_point last_event_post_time_;
    static constexpr auto kEventDebounceInterval = std::chrono::milliseconds(16);
};

} // namespace instman
