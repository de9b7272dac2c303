#include "imgui_app.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace instman {

ImGuiApp::ImGuiApp(Core& core)
    : core_(core)
    , actions_(core)
{
    list_poller_ = core_.make_poller(core_.config().list_poll_interval);
    overview_poller_ = core_.make_poller(core_.config().overview_poll_interval);

    // Wake up the UI when new data is available
    list_poller_->set_on_updated([this]() {
        post_empty_event_debounced();
    });
    overview_poller_->set_on_updated([this]() {
        post_empty_event_debounced();
    });
}

ImGuiApp::~ImGuiApp() = default;

void ImGuiApp::run() {
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    // Set Wayland app_id for desktop integration
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, "instman");

    window_ = glfwCreateWindow(1200, 800, "instman - Instance Manager", nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::GetIO().FontGlobalScale = 1.5f;
    ImGui::GetStyle().ScaleAllSizes(1.5f);

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.ScrollbarRounding = 2.0f;

    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    list_poller_->start();
    overview_poller_->start();
    spdlog::info("GUI front-end started");

    while (!glfwWindowShouldClose(window_)) {
        glfwWaitEventsTimeout(0.5);

        poll_snapshots();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);
    }

    // Stop background threads before the window goes away
    list_poller_->stop();
    overview_poller_->stop();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    spdlog::info("GUI front-end stopped");
}

void ImGuiApp::post_empty_event_debounced() {
    if (!window_) return;

    std::lock_guard lock(event_debounce_mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (now - last_event_post_time_ >= kEventDebounceInterval) {
        last_event_post_time_ = now;
        glfwPostEmptyEvent();
    }
}

void ImGuiApp::poll_snapshots() {
    if (auto snapshot = list_poller_->get_snapshot(); snapshot && snapshot->generation != list_generation_) {
        list_generation_ = snapshot->generation;
        view_model_.update_from_snapshot(snapshot);
        refresh_details(true);
    }

    if (auto overview = overview_poller_->get_snapshot(); overview && overview->generation != overview_generation_) {
        overview_generation_ = overview->generation;
        view_model_.update_overview(overview, actions_.load_accounts(), core_.config().categories);
    }
}

void ImGuiApp::refresh_details(const bool reload_accounts) {
    if (reload_accounts) {
        accounts_ = actions_.load_accounts();
    }

    auto& details = view_model_.details_panel;
    const auto& selected_id = view_model_.instance_list.selected_id;
    if (selected_id.empty()) {
        details.clear();
        return;
    }

    try {
        details.rebuild(core_.registry().get(selected_id), accounts_);
    } catch (const NotFoundError&) {
        details.clear();
    }
}

void ImGuiApp::refresh_all() {
    list_poller_->refresh_now();
    overview_poller_->refresh_now();
    refresh_details(true);
}

void ImGuiApp::select_instance(const std::string& id) {
    if (view_model_.instance_list.selected_id == id) return;
    view_model_.instance_list.selected_id = id;
    view_model_.details_panel.selected_row = 0;
    refresh_details(false);
}

void ImGuiApp::report(const ActionResult& result) {
    view_model_.set_status(result.message, !result.success);
    refresh_all();
}

std::string ImGuiApp::format_age(const std::chrono::steady_clock::time_point tp) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - tp).count();
    if (seconds < 1) return "just now";
    if (seconds < 60) return fmt::format("{}s ago", seconds);
    return fmt::format("{}m ago", seconds / 60);
}

void ImGuiApp::render() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);

    constexpr ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                              ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                              ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar;

    ImGui::Begin("instman", nullptr, window_flags);

    render_menu_bar();
    render_toolbar();
    if (view_model_.overview.is_visible) {
        render_overview();
    }

    const float available_height = ImGui::GetContentRegionAvail().y - 25;
    const float upper_height = available_height * 0.5f;
    const float lower_height = available_height * 0.5f;

    ImGui::BeginChild("InstancePane", ImVec2(0, upper_height), true);
    handle_keyboard_navigation();
    render_instance_list();
    ImGui::EndChild();

    ImGui::BeginChild("DetailsPane", ImVec2(0, lower_height), true);
    render_details_panel();
    ImGui::EndChild();

    render_status_bar();

    ImGui::End();

    render_confirm_dialog();
    render_form_dialog();
}

void ImGuiApp::render_menu_bar() {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Exit", "Alt+F4")) {
                glfwSetWindowShouldClose(glfwGetCurrentContext(), GLFW_TRUE);
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            if (ImGui::MenuItem("Overview", nullptr, view_model_.overview.is_visible)) {
                view_model_.overview.is_visible = !view_model_.overview.is_visible;
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Refresh Now", "F5")) {
                refresh_all();
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Instance")) {
            const Instance* selected = view_model_.instance_list.selected();
            const bool running = selected && view_model_.instance_list.data->is_running(selected->id);

            if (ImGui::MenuItem("New...", "Ctrl+N")) {
                open_form(FormKind::CreateInstance);
            }
            if (ImGui::MenuItem(running ? "Stop" : "Start", nullptr, false, selected != nullptr)) {
                report(actions_.toggle_running(selected->id));
            }
            if (ImGui::MenuItem("Restart", nullptr, false, selected != nullptr)) {
                report(actions_.restart(selected->id));
            }
            if (ImGui::MenuItem("Rename...", "F2", false, selected != nullptr)) {
                open_form(FormKind::RenameInstance);
            }
            if (ImGui::MenuItem("Delete...", "Delete", false, selected != nullptr && !selected->is_default)) {
                request_delete(*selected);
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Accounts")) {
            if (ImGui::MenuItem("Migrate to Default Instance...")) {
                request_confirm(ConfirmAction::MigrateAccounts);
            }
            if (ImGui::MenuItem("Prune Missing Accounts...")) {
                request_confirm(ConfirmAction::PruneAccounts);
            }
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

void ImGuiApp::render_toolbar() {
    if (ImGui::Button("New Instance")) {
        open_form(FormKind::CreateInstance);
    }
    ImGui::SameLine();

    if (ImGui::Button("Refresh")) {
        refresh_all();
    }
    ImGui::SameLine();

    const Instance* selected = view_model_.instance_list.selected();
    ImGui::BeginDisabled(selected == nullptr);
    const bool running = selected && view_model_.instance_list.data->is_running(selected->id);
    if (ImGui::Button(running ? "Stop" : "Start") && selected) {
        report(actions_.toggle_running(selected->id));
    }
    ImGui::SameLine();
    if (ImGui::Button("Restart") && selected) {
        report(actions_.restart(selected->id));
    }
    ImGui::SameLine();
    if (ImGui::Button("Rename") && selected) {
        open_form(FormKind::RenameInstance);
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(selected && selected->is_default);
    if (ImGui::Button("Delete") && selected) {
        request_delete(*selected);
    }
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled) && selected && selected->is_default) {
        ImGui::SetTooltip("The default instance cannot be deleted");
    }
    ImGui::EndDisabled();
    ImGui::EndDisabled();
}

void ImGuiApp::render_overview() const {
    const auto& ov = view_model_.overview;

    ImGui::Separator();
    ImGui::TextColored(ov.running_count > 0 ? ImVec4(0.2f, 0.9f, 0.2f, 1.0f) : ImVec4(0.7f, 0.7f, 0.7f, 1.0f),
                       "Running %zu/%zu", ov.running_count, ov.instance_count);
    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::Text("Best accounts:");

    if (ov.generation == 0) {
        ImGui::SameLine();
        ImGui::TextDisabled("...");
    } else if (ov.recommendations.empty()) {
        ImGui::SameLine();
        ImGui::TextDisabled("no account with remaining quota");
    } else {
        for (const auto& rec : ov.recommendations) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "%s:", rec.category.c_str());
            ImGui::SameLine();
            ImGui::Text("%s (%d)", ov.label_for(rec.account_id).c_str(), rec.score);
        }
    }
    ImGui::Separator();
}

void ImGuiApp::render_status_bar() {
    auto errors = list_poller_->get_recent_errors();
    auto controller_errors = actions_.recent_errors();
    errors.insert(errors.end(), controller_errors.begin(), controller_errors.end());
    std::sort(errors.begin(), errors.end(), [](const QueryError& a, const QueryError& b) {
        return a.timestamp < b.timestamp;
    });

    if (!errors.empty()) {
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.8f, 0.2f, 1.0f));
        ImGui::Text("[!] %s", errors.back().message.c_str());
        ImGui::PopStyleColor();
        ImGui::SameLine();
        ImGui::TextDisabled("|");
        ImGui::SameLine();
    }

    if (!view_model_.status_message.empty()) {
        if (view_model_.status_is_error) {
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
        }
        ImGui::Text("%s", view_model_.status_message.c_str());
        if (view_model_.status_is_error) {
            ImGui::PopStyleColor();
        }
        ImGui::SameLine();
        ImGui::TextDisabled("|");
        ImGui::SameLine();
    }

    const auto& data = view_model_.instance_list.data;
    ImGui::Text("Instances: %zu", data ? data->instances.size() : size_t{0});
    if (data && data->generation > 0) {
        ImGui::SameLine();
        ImGui::TextDisabled("updated %s", format_age(data->timestamp).c_str());
    }
}

} // namespace instman
