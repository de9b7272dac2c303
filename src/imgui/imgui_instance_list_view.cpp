#include "imgui_app.hpp"
#include "imgui.h"

namespace instman {

// Column tooltips descriptions
static constexpr const char* kColumnTooltips[] = {
    "Instance name (* marks the default instance)",
    "Running state from the process table",
    "Number of bound accounts",
    "Account the instance is signed in with",
    "Profile directory passed as --user-data-dir",
};

static void show_column_tooltips() {
    for (int col = 0; col < 5; col++) {
        if (ImGui::TableSetColumnIndex(col)) {
            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("%s", kColumnTooltips[col]);
            }
        }
    }
}

void ImGuiApp::render_instance_list() {
    const auto& list = view_model_.instance_list;
    if (!list.data) return;

    if (list.data->generation == 0) {
        ImGui::TextDisabled("Loading...");
        return;
    }

    if (ImGui::BeginTable("Instances", 6,
            ImGuiTableFlags_Resizable | ImGuiTableFlags_ScrollY |
            ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter)) {

        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthFixed, 220);
        ImGui::TableSetupColumn("State", ImGuiTableColumnFlags_WidthFixed, 90);
        ImGui::TableSetupColumn("Accounts", ImGuiTableColumnFlags_WidthFixed, 80);
        ImGui::TableSetupColumn("Current", ImGuiTableColumnFlags_WidthFixed, 260);
        ImGui::TableSetupColumn("User data dir", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("##actions", ImGuiTableColumnFlags_WidthFixed, 80);
        ImGui::TableHeadersRow();

        show_column_tooltips();

        // Actions may replace the snapshot while iterating
        const auto data = list.data;
        for (const auto& instance : data->instances) {
            ImGui::PushID(instance.id.c_str());
            ImGui::TableNextRow();

            const bool is_selected = instance.id == view_model_.instance_list.selected_id;
            const bool is_running = data->is_running(instance.id);

            if (is_selected && view_model_.instance_list.scroll_to_selected) {
                ImGui::SetScrollHereY(0.5f);
                view_model_.instance_list.scroll_to_selected = false;
            }

            ImGui::TableNextColumn();
            const std::string label = (instance.is_default ? "* " : "  ") + instance.name;
            if (ImGui::Selectable(label.c_str(), is_selected,
                    ImGuiSelectableFlags_SpanAllColumns | ImGuiSelectableFlags_AllowItemOverlap)) {
                select_instance(instance.id);
            }

            ImGui::TableNextColumn();
            if (is_running) {
                ImGui::TextColored(ImVec4(0.2f, 0.9f, 0.2f, 1.0f), "running");
            } else {
                ImGui::TextDisabled("stopped");
            }

            ImGui::TableNextColumn();
            ImGui::Text("%zu", instance.account_ids.size());

            ImGui::TableNextColumn();
            if (instance.current_account_id) {
                ImGui::Text("%s", view_model_.overview.label_for(*instance.current_account_id).c_str());
            } else {
                ImGui::TextDisabled("-");
            }

            ImGui::TableNextColumn();
            ImGui::Text("%s", instance.user_data_dir.c_str());

            ImGui::TableNextColumn();
            if (ImGui::SmallButton(is_running ? "Stop" : "Start")) {
                select_instance(instance.id);
                report(actions_.toggle_running(instance.id));
            }

            ImGui::PopID();
        }

        ImGui::EndTable();
    }
}

} // namespace instman
