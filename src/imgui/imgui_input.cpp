#include "imgui_app.hpp"
#include "imgui.h"
#include <algorithm>

namespace instman {

void ImGuiApp::handle_keyboard_navigation() {
    auto& il = view_model_.instance_list;

    if (ImGui::IsKeyPressed(ImGuiKey_F5)) {
        refresh_all();
        return;
    }

    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_N)) {
        open_form(FormKind::CreateInstance);
        return;
    }

    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) return;
    if (!il.data || il.data->instances.empty()) return;

    const auto& instances = il.data->instances;
    const int count = static_cast<int>(instances.size());
    const int current_idx = il.selected_index();

    int new_idx = current_idx;
    constexpr int page_size = 10;

    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow)) {
        new_idx = current_idx <= 0 ? 0 : current_idx - 1;
    } else if (ImGui::IsKeyPressed(ImGuiKey_DownArrow)) {
        new_idx = current_idx < 0 ? 0 : std::min(current_idx + 1, count - 1);
    } else if (ImGui::IsKeyPressed(ImGuiKey_PageUp)) {
        new_idx = std::max(0, current_idx - page_size);
    } else if (ImGui::IsKeyPressed(ImGuiKey_PageDown)) {
        new_idx = std::min(count - 1, std::max(0, current_idx) + page_size);
    } else if (ImGui::IsKeyPressed(ImGuiKey_Home)) {
        new_idx = 0;
    } else if (ImGui::IsKeyPressed(ImGuiKey_End)) {
        new_idx = count - 1;
    } else if (current_idx >= 0) {
        const Instance& selected = instances[current_idx];
        if (ImGui::IsKeyPressed(ImGuiKey_F2)) {
            open_form(FormKind::RenameInstance);
        } else if (ImGui::IsKeyPressed(ImGuiKey_Delete) && !selected.is_default) {
            request_delete(selected);
        }
        return;
    }

    if (new_idx != current_idx && new_idx >= 0) {
        select_instance(instances[new_idx].id);
        il.scroll_to_selected = true;
    }
}

} // namespace instman
