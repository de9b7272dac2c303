#include "imgui_app.hpp"
#include "imgui.h"
#include "../string_utils.hpp"

namespace instman {

static ImVec4 get_quota_color(const int percentage) {
    if (percentage >= 50) return {0.2f, 0.9f, 0.2f, 1.0f};  // Green
    if (percentage >= 20) return {1.0f, 0.9f, 0.2f, 1.0f};  // Yellow
    return {1.0f, 0.3f, 0.3f, 1.0f};                        // Red
}

void ImGuiApp::render_details_panel() {
    const Instance* instance = view_model_.instance_list.selected();
    if (!instance) {
        ImGui::TextDisabled("Select an instance to see its accounts");
        return;
    }

    auto& dp = view_model_.details_panel;

    ImGui::Text("%s", instance->name.c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("%s", instance->user_data_dir.c_str());
    if (!instance->extra_args.empty()) {
        ImGui::SameLine();
        ImGui::TextDisabled("args: %s", join_args(instance->extra_args).c_str());
    }
    if (!dp.missing_account_ids.empty()) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "%zu bound account(s) unknown", dp.missing_account_ids.size());
        ImGui::SameLine();
        if (ImGui::SmallButton("Prune")) {
            request_confirm(ConfirmAction::PruneAccounts);
        }
    }

    if (dp.rows.empty()) {
        ImGui::TextDisabled("No accounts in %s", core_.config().accounts_dir().string().c_str());
        return;
    }

    if (ImGui::BeginTable("Accounts", 4,
            ImGuiTableFlags_Resizable | ImGuiTableFlags_ScrollY |
            ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter)) {

        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Account", ImGuiTableColumnFlags_WidthFixed, 300);
        ImGui::TableSetupColumn("Tier", ImGuiTableColumnFlags_WidthFixed, 100);
        ImGui::TableSetupColumn("Quota", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("##actions", ImGuiTableColumnFlags_WidthFixed, 180);
        ImGui::TableHeadersRow();

        // Actions rebuild the rows, so act on copies of the ids
        const std::string instance_id = instance->id;
        const auto rows = dp.rows;
        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& row = rows[i];
            ImGui::PushID(row.account.id.c_str());
            ImGui::TableNextRow();

            ImGui::TableNextColumn();
            const std::string label = row.account.email.empty() ? row.account.id : row.account.email;
            if (row.is_current) {
                ImGui::TextColored(ImVec4(0.2f, 0.9f, 0.2f, 1.0f), "> %s", label.c_str());
            } else if (row.is_bound) {
                ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "+ %s", label.c_str());
            } else {
                ImGui::TextDisabled("  %s", label.c_str());
            }
            if (ImGui::IsItemClicked()) {
                dp.selected_row = static_cast<int>(i);
            }

            ImGui::TableNextColumn();
            ImGui::Text("%s", row.account.quota ? row.account.quota->subscription_tier.c_str() : "");

            ImGui::TableNextColumn();
            if (!row.account.quota || row.account.quota->models.empty()) {
                ImGui::TextDisabled("no quota data");
            } else {
                bool first = true;
                for (const auto& model : row.account.quota->models) {
                    if (!first) ImGui::SameLine();
                    first = false;
                    ImGui::TextColored(get_quota_color(model.percentage), "%s %d%%", model.name.c_str(), model.percentage);
                    if (model.reset_time && ImGui::IsItemHovered()) {
                        ImGui::SetTooltip("Resets %s", model.reset_time->c_str());
                    }
                }
            }

            ImGui::TableNextColumn();
            if (!row.is_current) {
                if (ImGui::SmallButton("Switch")) {
                    report(actions_.switch_account(instance_id, row.account.id));
                }
                ImGui::SameLine();
            }
            if (row.is_bound) {
                if (ImGui::SmallButton("Unbind")) {
                    report(actions_.unbind(instance_id, row.account.id));
                }
            } else if (ImGui::SmallButton("Bind")) {
                report(actions_.bind(instance_id, row.account.id));
            }

            ImGui::PopID();
        }

        ImGui::EndTable();
    }
}

} // namespace instman
